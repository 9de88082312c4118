#pragma once

#include <fmt/format.h>

#include <queue>
#include <string>
#include <utility>

enum class NotificationKind {
  Sold,
  Expired,
};

// Something the seller should be told about one of the listings
struct Notification {
  NotificationKind kind;
  std::string title;
  // sale price, meaningful only for `NotificationKind::Sold`
  int price;
};

// Queue of notifications for the seller. Producers are the sale and expiry paths, the only consumer is
// a periodic task that prints them and writes them into the sales log.
class NotificationService {
  std::queue<Notification> notifications;

public:
  void push(Notification notification) { notifications.push(std::move(notification)); }

  bool empty() const { return notifications.empty(); }
  std::size_t size() const { return notifications.size(); }

  Notification pop() {
    auto notification = std::move(notifications.front());
    notifications.pop();
    return notification;
  }
};

template <>
struct fmt::formatter<Notification> {
  template <typename ParseContext>
  constexpr auto parse(ParseContext & ctx) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(Notification const & notification, FormatContext & ctx) const {
    if (notification.kind == NotificationKind::Sold) {
      return ::fmt::format_to(ctx.out(), "Item {} has been sold for {}.", notification.title, notification.price);
    }
    return ::fmt::format_to(ctx.out(), "Cannot sell item {}.", notification.title);
  }
};
