#include "shared_state.hpp"

#include <fmt/format.h>

std::size_t SharedState::flush_notifications() {
  std::size_t flushed = 0;
  while (!notifications->empty()) {
    auto const notification = notifications->pop();
    transaction_log.save(notification);
    fmt::print("[notification] {}\n", notification);
    ++flushed;
  }
  return flushed;
}
