#include "seller_service.hpp"

#include "catalogue.hpp"
#include "notification_service.hpp"
#include "price_decay_timer.hpp"

#include <fmt/format.h>

tl::expected<std::shared_ptr<PriceDecayTimer>, std::string> SellerService::put_for_sale(ListingTerms terms) {
  // buyers' titles arrive trimmed, so listings are stored the same way
  terms.title = std::string(trim(terms.title));
  if (terms.title.empty()) {
    return tl::make_unexpected("Title cannot be empty");
  }
  if (terms.floor_price < 0) {
    return tl::make_unexpected("Cannot sell for negative price");
  }
  if (terms.floor_price > terms.initial_price) {
    return tl::make_unexpected(fmt::format("Floor price {} is above the initial price {}", terms.floor_price,
                                           terms.initial_price));
  }
  if (terms.deadline <= terms.start_time) {
    return tl::make_unexpected("Deadline must be in the future");
  }

  auto timer = std::make_shared<PriceDecayTimer>(std::move(terms), options.decay_policy);
  if (!catalogue->insert(timer)) {
    return tl::make_unexpected(fmt::format("'{}' is already on sale", timer->title()));
  }

  // The callback holds the timer alive until it reports that it's done. It shares the stores rather than
  // pointing back at this service, so the service itself may be moved around.
  auto on_tick = [catalogue = catalogue, notifications = notifications, timer](TimePoint now) {
    return tick_listing(*catalogue, *notifications, timer, now);
  };
  schedule_periodic(options.tick_interval, std::move(on_tick));
  return timer;
}

Reply SellerService::answer_inquiry(std::string_view title) const {
  auto const timer = catalogue->find(title);
  if (!timer) {
    return Reply{ .performative = Performative::Refuse, .title = std::string(title), .price = std::nullopt };
  }
  return Reply{ .performative = Performative::Propose, .title = timer->title(), .price = timer->current_price() };
}

Reply SellerService::settle_acceptance(Proposal const & proposal) {
  auto const timer = catalogue->find(proposal.title);
  if (!timer || proposal.offered_price < timer->current_price()) {
    return Reply{ .performative = Performative::Disconfirm, .title = proposal.title, .price = std::nullopt };
  }

  // Commit point: stop the decay, take the item off sale and tell the seller
  timer->stop();
  catalogue->erase(*timer);
  notifications->push(Notification{
      .kind = NotificationKind::Sold,
      .title = proposal.title,
      .price = proposal.offered_price,
  });
  return Reply{ .performative = Performative::Confirm, .title = proposal.title, .price = proposal.offered_price };
}

bool SellerService::process_tick(std::shared_ptr<PriceDecayTimer> const & timer, TimePoint now) {
  return tick_listing(*catalogue, *notifications, timer, now);
}

bool SellerService::tick_listing(Catalogue & catalogue, NotificationService & notifications,
                                 std::shared_ptr<PriceDecayTimer> const & timer, TimePoint now) {
  switch (timer->tick(now)) {
  case TickResult::Decayed: return true;
  case TickResult::Expired:
    catalogue.erase(*timer);
    notifications.push(Notification{
        .kind = NotificationKind::Expired,
        .title = timer->title(),
        .price = timer->current_price(),
    });
    return false;
  case TickResult::Stopped: return false;
  }
  return false;
}
