#pragma once

#include "types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

struct SharedState;

// Inbound buyer messages. Each message is parsed from the content that follows its performative.
namespace messages {

// asks for the current price, content is the item title
struct Inquiry {
  std::string_view title;

  static std::optional<Inquiry> parse(std::string_view args) { return Inquiry{ .title = trim(args) }; }
  Reply execute(std::shared_ptr<SharedState> const & shared_state);
};

// accepts a price, content is "<title> <offered_price>"
// Examples:
// - "Dune 100" -> {"Dune", 100}
// - "The Left Hand of Darkness 40" -> {"The Left Hand of Darkness", 40}
// - "Dune   100" -> {"Dune", 100}
// - "Dune" -> std::nullopt
struct Acceptance {
  Proposal proposal;

  static std::optional<Acceptance> parse(std::string_view args);
  Reply execute(std::shared_ptr<SharedState> const & shared_state);
};

// Wire representation of a reply, e.g. "propose Dune 100" or "refuse Dune"
std::string to_string(Reply const & reply);

}  // namespace messages
