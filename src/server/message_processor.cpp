#include "message_processor.hpp"
#include "messages.hpp"

#include <functional>
#include <optional>
#include <unordered_map>
#include <utility>
#include <variant>

namespace {

// Takes the first word as a performative and the rest as the content
std::pair<std::string_view, std::string_view> parse_performative(std::string_view message) noexcept {
  std::size_t const space_pos = message.find(' ');
  if (space_pos == std::string_view::npos) {
    return { message, {} };
  }
  return { message.substr(0, space_pos), message.substr(space_pos + 1) };
}

using Message = std::variant<messages::Inquiry, messages::Acceptance>;

template <typename T>
std::optional<Message> parse(std::string_view args) {
  if (auto const parsed = T::parse(args); parsed) {
    return *parsed;
  }
  return std::nullopt;
}

std::unordered_map<Performative, std::optional<Message> (*)(std::string_view)> const kMessageParsers{
  { Performative::Cfp, parse<messages::Inquiry> },
  { Performative::AcceptProposal, parse<messages::Acceptance> },
};

Reply not_understood() {
  return Reply{ .performative = Performative::NotUnderstood, .title = {}, .price = std::nullopt };
}

}  // namespace

std::string MessageProcessor::process_message(std::string_view message) {
  auto const [performative_str, content] = parse_performative(trim(message));

  auto const performative = parse_Performative(performative_str);
  auto const it = performative ? kMessageParsers.find(*performative) : kMessageParsers.end();
  if (it == kMessageParsers.end()) {
    return messages::to_string(not_understood());
  }

  auto parsed = std::invoke(it->second, trim(content));
  if (!parsed) {
    return messages::to_string(not_understood());
  }

  auto const reply = std::visit([this](auto & message) { return message.execute(shared_state); }, *parsed);
  return messages::to_string(reply);
}
