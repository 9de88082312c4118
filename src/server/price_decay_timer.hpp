#pragma once

#include "types.hpp"

#include <string>

enum class TickResult {
  // deadline is not reached yet, price was recomputed
  Decayed,
  // deadline has passed, the timer moved to the terminal `Expired` state on this tick
  Expired,
  // the timer is no longer running, nothing was done
  Stopped,
};

// Owns the price trajectory and expiry of exactly one listing. The timer itself is passive:
// someone has to call `tick()` periodically, see `SellerService::put_for_sale()`.
class PriceDecayTimer final {
public:
  enum class State { Running, Sold, Expired };

  PriceDecayTimer(ListingTerms terms, DecayPolicy policy);

  // This class cannot be copied or moved, catalogue and scheduled ticks refer to it by pointer
  PriceDecayTimer(PriceDecayTimer const &) = delete;
  PriceDecayTimer & operator=(PriceDecayTimer const &) = delete;

  std::string const & title() const { return terms.title; }
  ListingTerms const & listing_terms() const { return terms; }
  DecayPolicy decay_policy() const { return policy; }

  int current_price() const { return price; }
  State state() const { return current_state; }
  bool running() const { return current_state == State::Running; }

  // Moves a running timer to the `Sold` state. Returns false if the timer was already stopped or expired,
  // in which case nothing changes.
  bool stop();

  // Recomputes the price for the given moment or expires the timer if `now` is past the deadline
  TickResult tick(TimePoint now);

private:
  int price_at(TimePoint now) const;

  ListingTerms terms;
  DecayPolicy policy;
  int price;
  State current_state = State::Running;
};
