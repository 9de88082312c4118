#include "transaction_log.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

TEST(TransactionLog, AppendsListingsSalesAndExpirations) {
  std::string const path = testing::TempDir() + "transaction_log_test.log";
  std::remove(path.c_str());

  {
    auto log = TransactionLog::open(path);
    ASSERT_TRUE(log) << log.error();
    log->save(ListingTerms{
        .title = "Dune",
        .initial_price = 100,
        .floor_price = 40,
        .start_time = TimePoint(std::chrono::seconds(1700000000)),
        .deadline = TimePoint(std::chrono::seconds(1700000060)),
    });
    log->save(Notification{ .kind = NotificationKind::Sold, .title = "Dune", .price = 70 });
  }
  {
    // reopening appends rather than truncates
    auto log = TransactionLog::open(path);
    ASSERT_TRUE(log) << log.error();
    log->save(Notification{ .kind = NotificationKind::Expired, .title = "Hyperion", .price = 10 });
  }

  std::ifstream file(path);
  std::stringstream content;
  content << file.rdbuf();
  auto const text = content.str();

  EXPECT_NE(text.find("item{.title=\"Dune\"} listed .initial_price=100 .floor_price=40 .deadline=1700000060\n"),
            std::string::npos)
      << text;
  EXPECT_NE(text.find("item{.title=\"Dune\"} sold .price=70\n"), std::string::npos) << text;
  EXPECT_NE(text.find("item{.title=\"Hyperion\"} expired\n"), std::string::npos) << text;
}

TEST(TransactionLog, OpenFailure) {
  auto log = TransactionLog::open(testing::TempDir() + "no/such/directory/sales.log");
  ASSERT_FALSE(log);
  ASSERT_NE(log.error().find("failed to open sales log"), std::string::npos);
}
