#pragma once

#include "shared_state.hpp"

#include <fmt/format.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

// Fixed moment all listings in tests start at
inline TimePoint const t0 = TimePoint(std::chrono::seconds(1700000000));

inline ListingTerms make_terms(std::string title, int initial_price, int floor_price, std::chrono::seconds lifetime) {
  return ListingTerms{
    .title = std::move(title),
    .initial_price = initial_price,
    .floor_price = floor_price,
    .start_time = t0,
    .deadline = t0 + lifetime,
  };
}

// Seller state with a scheduler that only records callbacks, so tests decide when timers tick
class SellerFixture : public ::testing::Test {
protected:
  struct Scheduled {
    std::chrono::milliseconds interval;
    SellerService::TickCallback on_tick;
  };

  void SetUp() override {
    log_path = testing::TempDir() + "seller_tests_sales.log";
    auto transaction_log = TransactionLog::open(log_path);
    ASSERT_TRUE(transaction_log) << transaction_log.error();

    auto catalogue = std::make_shared<Catalogue>();
    auto notifications = std::make_shared<NotificationService>();
    auto schedule = [this](std::chrono::milliseconds interval, SellerService::TickCallback on_tick) {
      scheduled.push_back(Scheduled{ .interval = interval, .on_tick = std::move(on_tick) });
    };
    shared_state = std::make_shared<SharedState>(SharedState{
        .catalogue = catalogue,
        .notifications = notifications,
        .seller_service = SellerService(catalogue, notifications, schedule,
                                        SellerService::Options{
                                            .tick_interval = std::chrono::seconds(60),
                                            .decay_policy = DecayPolicy::Linear,
                                        }),
        .transaction_log = std::move(*transaction_log),
    });
  }

  Catalogue & catalogue() { return *shared_state->catalogue; }
  SellerService & seller_service() { return shared_state->seller_service; }

  // Pops all pending notifications formatted the way the seller sees them
  std::vector<std::string> drain_notifications() {
    std::vector<std::string> result;
    while (!shared_state->notifications->empty()) {
      result.push_back(fmt::format("{}", shared_state->notifications->pop()));
    }
    return result;
  }

  std::string log_path;
  std::shared_ptr<SharedState> shared_state;
  std::vector<Scheduled> scheduled;
};
