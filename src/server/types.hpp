#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Semantic type of a protocol message
enum class Performative : int {
  // buyer asks for the current price of an item
  Cfp = 1,
  Propose = 2,
  Refuse = 3,
  // buyer accepts a previously proposed price
  AcceptProposal = 4,
  Confirm = 5,
  Disconfirm = 6,
  NotUnderstood = 7,
};

inline std::string_view to_string(Performative performative) {
  switch (performative) {
  case Performative::Cfp: return "cfp";
  case Performative::Propose: return "propose";
  case Performative::Refuse: return "refuse";
  case Performative::AcceptProposal: return "accept-proposal";
  case Performative::Confirm: return "confirm";
  case Performative::Disconfirm: return "disconfirm";
  case Performative::NotUnderstood: return "not-understood";
  }
  return "unknown";
}

inline std::optional<Performative> parse_Performative(std::string_view str) {
  if (str == "cfp") {
    return Performative::Cfp;
  } else if (str == "propose") {
    return Performative::Propose;
  } else if (str == "refuse") {
    return Performative::Refuse;
  } else if (str == "accept-proposal") {
    return Performative::AcceptProposal;
  } else if (str == "confirm") {
    return Performative::Confirm;
  } else if (str == "disconfirm") {
    return Performative::Disconfirm;
  } else if (str == "not-understood") {
    return Performative::NotUnderstood;
  }
  return std::nullopt;
}

enum class DecayPolicy : int {
  // Price falls proportionally to the elapsed share of the listing lifetime
  Linear = 1,
  // Elapsed share is truncated to an integer, so the price stays at the initial one until the deadline
  Truncated = 2,
};

inline std::string_view to_string(DecayPolicy policy) {
  switch (policy) {
  case DecayPolicy::Linear: return "linear";
  case DecayPolicy::Truncated: return "truncated";
  }
  return "unknown";
}

inline std::optional<DecayPolicy> parse_DecayPolicy(std::string_view str) {
  if (str == "linear") {
    return DecayPolicy::Linear;
  } else if (str == "truncated") {
    return DecayPolicy::Truncated;
  }
  return std::nullopt;
}

// Strips leading and trailing whitespace, titles are compared in this form everywhere
inline std::string_view trim(std::string_view str) noexcept {
  std::size_t const begin = str.find_first_not_of(" \t\r\n");
  if (begin == std::string_view::npos) {
    return {};
  }
  std::size_t const end = str.find_last_not_of(" \t\r\n");
  return str.substr(begin, end - begin + 1);
}

// Sale terms of a single item, fixed for the whole life of the listing
struct ListingTerms {
  std::string title;
  int initial_price;
  int floor_price;
  TimePoint start_time;
  TimePoint deadline;
};

// Payload of an `accept-proposal` message
struct Proposal {
  std::string title;
  int offered_price;
};

// A reply to a buyer. Title and price are omitted when the reply doesn't carry them
struct Reply {
  Performative performative;
  std::string title;
  std::optional<int> price;
};

// A record for the "list" console command
struct ListingInfo {
  std::string title;
  int current_price;
  int floor_price;
  TimePoint deadline;
};
