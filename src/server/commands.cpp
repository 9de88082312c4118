#include "commands.hpp"
#include "shared_state.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <charconv>
#include <chrono>
#include <optional>
#include <string>
#include <utility>

template <>
struct fmt::formatter<ListingInfo> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext & ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(ListingInfo const & listing, FormatContext & ctx) const {
    auto const deadline = std::chrono::floor<std::chrono::seconds>(listing.deadline);
    return ::fmt::format_to(ctx.out(), "{} for {} funds (floor {}) until {:%Y-%m-%d %H:%M:%S}", listing.title,
                            listing.current_price, listing.floor_price, deadline);
  }
};

namespace {
// Splits off the last word and parses it as an integer
std::optional<std::pair<std::string_view, int>> pop_last_number(std::string_view args) noexcept {
  std::size_t const space_pos = args.rfind(' ');
  if (space_pos == std::string_view::npos) {
    return std::nullopt;
  }
  std::string_view const number_str = args.substr(space_pos + 1);
  int number = 0;
  auto const [ptr, ec] = std::from_chars(number_str.data(), number_str.data() + number_str.size(), number);
  if (ec != std::errc() || ptr != number_str.data() + number_str.size()) {
    return std::nullopt;
  }
  return std::make_pair(args.substr(0, space_pos), number);
}

constexpr std::string_view kHelpString = R"(Available commands:
- ping: Replies 'pong'
- help: Prints this help message about all available commands

- sell: Puts an item up for sale. Format: 'sell <title> <initial_price> <floor_price> <seconds_to_deadline>'
  The asking price falls from the initial price to the floor price until the deadline. If nobody buys the
  item by then, it is taken off sale.
  Example: 'sell Dune 100 40 600' - sells Dune starting at 100 funds, down to 40 funds in 10 minutes
- list: Displays all items currently on sale with their current price

Buyers connect over TCP and send 'cfp <title>' to get a price and 'accept-proposal <title> <price>' to buy.

Usage: <command> [<args>])";
}  // namespace

namespace commands {

std::string Help::execute(std::shared_ptr<SharedState> const &) {
  return std::string(kHelpString);
}

std::optional<Sell> Sell::parse(std::string_view args) {
  auto const seconds = pop_last_number(args);
  if (!seconds) {
    return std::nullopt;
  }
  auto const floor_price = pop_last_number(seconds->first);
  if (!floor_price) {
    return std::nullopt;
  }
  auto const initial_price = pop_last_number(floor_price->first);
  if (!initial_price) {
    return std::nullopt;
  }

  std::string_view const title = trim(initial_price->first);
  if (title.empty()) {
    return std::nullopt;
  }

  return Sell{
    .title = title,
    .initial_price = initial_price->second,
    .floor_price = floor_price->second,
    .seconds_to_deadline = seconds->second,
  };
}

std::string Sell::execute(std::shared_ptr<SharedState> const & shared_state) {
  auto const now = Clock::now();
  auto terms = ListingTerms{
    .title = std::string(title),
    .initial_price = initial_price,
    .floor_price = floor_price,
    .start_time = now,
    .deadline = now + std::chrono::seconds(seconds_to_deadline),
  };

  auto result = shared_state->seller_service.put_for_sale(terms);
  if (!result) {
    return fmt::format("Failed to put {} up for sale with error: {}", title, result.error());
  }

  shared_state->transaction_log.save(terms);
  return fmt::format("Successfully put {} up for sale for {} funds, down to {} funds in {} second(s)", title,
                     initial_price, floor_price, seconds_to_deadline);
}

std::string List::execute(std::shared_ptr<SharedState> const & shared_state) {
  auto const listings = shared_state->catalogue->view();
  if (listings.empty()) {
    return "Nothing is on sale";
  }
  std::string output = "On sale:\n";
  for (auto const & listing : listings) {
    output += fmt::format("- {}\n", listing);
  }
  return output;
}

}  // namespace commands
