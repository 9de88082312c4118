#pragma once

#include "types.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <cstdint>
#include <string>

// Command line arguments for the seller
struct Cli {
  // port to listen on for buyers
  uint16_t port;
  // path to the append-only sales log
  std::string sales_log_path;
  // how often listing prices are recomputed
  std::chrono::seconds tick_interval = std::chrono::seconds(60);
  // how the price falls towards the floor
  DecayPolicy decay_policy = DecayPolicy::Linear;

  static tl::expected<Cli, std::string> parse(int argc, char * argv[]);
};
