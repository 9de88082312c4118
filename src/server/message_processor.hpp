#pragma once

#include "shared_state.hpp"

#include <string>
#include <string_view>

// Handles messages of a single buyer connection
struct MessageProcessor final {
  // remote address of the buyer, used only for logging
  std::string buyer;
  std::shared_ptr<SharedState> shared_state;

public:
  MessageProcessor(std::string buyer, std::shared_ptr<SharedState> shared_state)
      : buyer(std::move(buyer)), shared_state(std::move(shared_state)) {}

  // parses a "<performative> <content>" message, dispatches it and returns the reply line
  std::string process_message(std::string_view message);
};
