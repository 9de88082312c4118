#pragma once

#include "shared_state.hpp"

#include <string>
#include <string_view>

// Handles lines typed into the seller console
struct CommandsProcessor final {
  std::shared_ptr<SharedState> shared_state;

public:
  explicit CommandsProcessor(std::shared_ptr<SharedState> shared_state) : shared_state(std::move(shared_state)) {}

  // parses and executes a command
  std::string process_request(std::string_view request);
};
