#include "cli.hpp"

#include <fmt/format.h>

#include <charconv>
#include <cstring>

namespace {
constexpr std::string_view kUsage =
    "Usage: seller <port> <path_to_sales_log> [<tick_interval_seconds>] [linear|truncated]\n"
    "Example: seller 3000 sales.log 60 linear";
}  // namespace

tl::expected<Cli, std::string> Cli::parse(int argc, char * argv[]) {
  if (argc < 3 || argc > 5) {
    return tl::make_unexpected(fmt::format("Invalid number of arguments\n{}", kUsage));
  }

  uint16_t port;
  char const * const port_end = std::strchr(argv[1], '\0');
  std::from_chars_result result = std::from_chars(argv[1], port_end, port);
  if (result.ec != std::errc() || result.ptr != port_end || port == 0) {
    return tl::make_unexpected(fmt::format("Invalid port '{}'. Port must be in range [1, 65535]", argv[1]));
  }

  Cli cli{
    .port = port,
    .sales_log_path = argv[2],
  };

  if (argc > 3) {
    int seconds = 0;
    char const * const seconds_end = std::strchr(argv[3], '\0');
    result = std::from_chars(argv[3], seconds_end, seconds);
    if (result.ec != std::errc() || result.ptr != seconds_end || seconds <= 0) {
      return tl::make_unexpected(
          fmt::format("Invalid tick interval '{}'. It must be a positive number of seconds", argv[3]));
    }
    cli.tick_interval = std::chrono::seconds(seconds);
  }

  if (argc > 4) {
    auto const policy = parse_DecayPolicy(argv[4]);
    if (!policy) {
      return tl::make_unexpected(
          fmt::format("Invalid decay policy '{}'. Expected 'linear' or 'truncated'\n{}", argv[4], kUsage));
    }
    cli.decay_policy = *policy;
  }

  return cli;
}
