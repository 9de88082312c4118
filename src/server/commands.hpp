#pragma once

#include "types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

struct SharedState;

// Seller console commands
namespace commands {

// responsds with "pong"
struct Ping {
  static std::optional<Ping> parse(std::string_view) { return Ping{}; }
  std::string execute(std::shared_ptr<SharedState> const &) { return "pong"; }
};

// prints help message with all available commands and their description
struct Help {
  static std::optional<Help> parse(std::string_view) { return Help{}; }
  std::string execute(std::shared_ptr<SharedState> const &);
};

// puts an item up for sale
struct Sell {
  std::string_view title;
  int initial_price;
  int floor_price;
  int seconds_to_deadline;

  // args should be in the format "<title> <initial_price> <floor_price> <seconds_to_deadline>".
  // Examples:
  // - "Dune 100 40 60" -> {"Dune", .initial_price=100, .floor_price=40, .seconds_to_deadline=60}
  // - "The Dispossessed 80 20 3600" -> {"The Dispossessed", .initial_price=80, .floor_price=20, ...}
  static std::optional<Sell> parse(std::string_view args);
  std::string execute(std::shared_ptr<SharedState> const & shared_state);
};

// lists all items currently on sale
struct List {
  static std::optional<List> parse(std::string_view) { return List{}; }
  std::string execute(std::shared_ptr<SharedState> const & shared_state);
};

}  // namespace commands
