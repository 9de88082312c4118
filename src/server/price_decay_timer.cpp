#include "price_decay_timer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <utility>

PriceDecayTimer::PriceDecayTimer(ListingTerms terms, DecayPolicy policy)
    : terms(std::move(terms)), policy(policy), price(this->terms.initial_price) {}

bool PriceDecayTimer::stop() {
  if (current_state != State::Running) {
    return false;
  }
  current_state = State::Sold;
  return true;
}

TickResult PriceDecayTimer::tick(TimePoint now) {
  if (current_state != State::Running) {
    return TickResult::Stopped;
  }

  if (now > terms.deadline) {
    current_state = State::Expired;
    return TickResult::Expired;
  }

  // Never go up, even if the clock was adjusted backwards between ticks
  price = std::min(price, price_at(now));
  return TickResult::Decayed;
}

int PriceDecayTimer::price_at(TimePoint now) const {
  namespace ch = std::chrono;
  int64_t const price_range = int64_t{ terms.initial_price } - terms.floor_price;
  int64_t const time_range = ch::duration_cast<ch::milliseconds>(terms.deadline - terms.start_time).count();
  if (time_range <= 0) {
    return terms.floor_price;
  }
  int64_t const elapsed =
      std::clamp<int64_t>(ch::duration_cast<ch::milliseconds>(now - terms.start_time).count(), 0, time_range);

  int64_t decrease = 0;
  switch (policy) {
  case DecayPolicy::Linear:
    decrease = std::llround(static_cast<double>(price_range) * static_cast<double>(elapsed) /
                            static_cast<double>(time_range));
    break;
  case DecayPolicy::Truncated:
    decrease = price_range * (elapsed / time_range);
    break;
  }

  return static_cast<int>(std::clamp<int64_t>(terms.initial_price - decrease, terms.floor_price, terms.initial_price));
}
