#include "messages.hpp"
#include "shared_state.hpp"

#include <fmt/format.h>

#include <charconv>

namespace messages {

Reply Inquiry::execute(std::shared_ptr<SharedState> const & shared_state) {
  return shared_state->seller_service.answer_inquiry(title);
}

std::optional<Acceptance> Acceptance::parse(std::string_view args) {
  // the price is the last word, everything before it is the title
  std::size_t const space_pos = args.rfind(' ');
  if (space_pos == std::string_view::npos) {
    return std::nullopt;
  }
  std::string_view const title = trim(args.substr(0, space_pos));
  if (title.empty()) {
    return std::nullopt;
  }

  std::string_view const price_str = args.substr(space_pos + 1);
  int price = 0;
  auto const [ptr, ec] = std::from_chars(price_str.data(), price_str.data() + price_str.size(), price);
  if (ec != std::errc() || ptr != price_str.data() + price_str.size()) {
    return std::nullopt;
  }

  return Acceptance{ .proposal = Proposal{ .title = std::string(title), .offered_price = price } };
}

Reply Acceptance::execute(std::shared_ptr<SharedState> const & shared_state) {
  return shared_state->seller_service.settle_acceptance(proposal);
}

std::string to_string(Reply const & reply) {
  std::string result(::to_string(reply.performative));
  if (!reply.title.empty()) {
    result += fmt::format(" {}", reply.title);
  }
  if (reply.price) {
    result += fmt::format(" {}", *reply.price);
  }
  return result;
}

}  // namespace messages
