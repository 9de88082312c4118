#include <asio/awaitable.hpp>
#include <asio/co_spawn.hpp>
#include <asio/connect.hpp>
#include <asio/detached.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/read_until.hpp>
#include <asio/signal_set.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/write.hpp>

#include <fmt/format.h>

#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

using asio::awaitable;
using asio::co_spawn;
using asio::detached;
using asio::use_awaitable;
using asio::ip::tcp;

namespace {

constexpr std::string_view kUsage =
    "Usage: buyer <host:port>\n"
    "Example: buyer localhost:3000\n"
    "\n"
    "Messages, one per line:\n"
    "- cfp <title>: asks the seller for the current price\n"
    "- accept-proposal <title> <price>: buys the item if the price is still good\n"
    "- help: prints this message, nothing is sent";

struct SellerAddress {
  std::string host;
  std::string port;
};

// "<host>:<port>", the last colon separates the port
std::optional<SellerAddress> parse_seller_address(std::string_view str) {
  std::size_t const colon_pos = str.rfind(':');
  if (colon_pos == std::string_view::npos || colon_pos == 0 || colon_pos + 1 == str.size()) {
    return std::nullopt;
  }
  return SellerAddress{
    .host = std::string(str.substr(0, colon_pos)),
    .port = std::string(str.substr(colon_pos + 1)),
  };
}

// Forwards stdin lines to the seller from a dedicated thread, blocking `getline` has no asio counterpart.
// The thread is the only writer of the socket, and it's torn down together with the process.
void forward_stdin(tcp::socket & socket) {
  std::thread([&socket]() {
    std::string line;
    while (std::getline(std::cin, line)) {
      if (line.empty()) {
        continue;
      }
      if (line == "help") {
        fmt::print("{}\n", kUsage);
        continue;
      }
      line += '\n';
      asio::write(socket, asio::buffer(line));
    }
  }).detach();
}

// Prints seller replies, one per line, until the seller hangs up
awaitable<void> print_replies(asio::io_context & context, tcp::socket & socket) {
  std::string pending;
  try {
    for (;;) {
      std::size_t const n = co_await asio::async_read_until(socket, asio::dynamic_buffer(pending), '\n', use_awaitable);
      fmt::print("< {}\n", std::string_view(pending).substr(0, n - 1));
      pending.erase(0, n);
    }
  } catch (std::exception & e) {
    fmt::print("Seller closed the connection: {}\n", e.what());
  }
  context.stop();
}

}  // namespace

int main(int argc, char * argv[]) {
  if (argc != 2) {
    fmt::print("{}\n", kUsage);
    return 1;
  }

  auto const address = parse_seller_address(argv[1]);
  if (!address) {
    fmt::print("Invalid seller address '{}'\n{}\n", argv[1], kUsage);
    return 1;
  }

  try {
    asio::io_context io_context;

    tcp::socket socket(io_context);
    asio::connect(socket, tcp::resolver(io_context).resolve(address->host, address->port));
    fmt::print("Connected to seller at {}:{}, type 'help' for the list of messages\n", address->host, address->port);

    asio::signal_set signals(io_context, SIGINT, SIGTERM);
    signals.async_wait([&](auto, auto) { io_context.stop(); });

    forward_stdin(socket);
    co_spawn(io_context, print_replies(io_context, socket), detached);

    io_context.run();
  } catch (std::exception & e) {
    fmt::print("Failed to talk to the seller: {}\n", e.what());
    return 1;
  }

  return 0;
}
