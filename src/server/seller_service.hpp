#pragma once

#include "types.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

class Catalogue;
class NotificationService;
class PriceDecayTimer;

// Core negotiation logic: listing items, answering price inquiries and settling acceptances.
//
// All methods must be called from the same executor. Nothing here is locked, the executor guarantees
// that only one of them runs at a time, which is what makes the sale commit atomic.
class SellerService final {
public:
  // Periodic callback, returns false once it doesn't want to be called anymore
  using TickCallback = std::function<bool(TimePoint)>;
  // Invokes the callback every `interval` until it returns false
  using SchedulePeriodic = std::function<void(std::chrono::milliseconds, TickCallback)>;

  struct Options {
    std::chrono::milliseconds tick_interval = std::chrono::seconds(60);
    DecayPolicy decay_policy = DecayPolicy::Linear;
  };

  SellerService(std::shared_ptr<Catalogue> catalogue, std::shared_ptr<NotificationService> notifications,
                SchedulePeriodic schedule_periodic, Options options)
      : catalogue(std::move(catalogue)),
        notifications(std::move(notifications)),
        schedule_periodic(std::move(schedule_periodic)),
        options(options) {}

  Options const & settings() const { return options; }

  // Creates a listing, puts it into the catalogue and schedules its price decay
  tl::expected<std::shared_ptr<PriceDecayTimer>, std::string> put_for_sale(ListingTerms terms);

  // Replies `propose` with the current price if the title is on sale, `refuse` otherwise
  Reply answer_inquiry(std::string_view title) const;

  // Replies `confirm` and sells the item if the offered price is not below the current one,
  // `disconfirm` otherwise
  Reply settle_acceptance(Proposal const & proposal);

  // Single tick of the listing's timer. Returns false once the timer is done
  bool process_tick(std::shared_ptr<PriceDecayTimer> const & timer, TimePoint now);

private:
  static bool tick_listing(Catalogue & catalogue, NotificationService & notifications,
                           std::shared_ptr<PriceDecayTimer> const & timer, TimePoint now);

  std::shared_ptr<Catalogue> catalogue;
  std::shared_ptr<NotificationService> notifications;
  SchedulePeriodic schedule_periodic;
  Options options;
};
