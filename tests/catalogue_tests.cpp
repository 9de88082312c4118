#include "catalogue.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <utility>

using namespace std::chrono_literals;

namespace {
std::shared_ptr<PriceDecayTimer> make_timer(std::string title, int initial_price, int floor_price) {
  auto const start = TimePoint(std::chrono::seconds(1700000000));
  return std::make_shared<PriceDecayTimer>(ListingTerms{ .title = std::move(title),
                                                         .initial_price = initial_price,
                                                         .floor_price = floor_price,
                                                         .start_time = start,
                                                         .deadline = start + 60s },
                                           DecayPolicy::Linear);
}
}  // namespace

TEST(Catalogue, InsertFindErase) {
  Catalogue catalogue;
  EXPECT_TRUE(catalogue.empty());
  EXPECT_EQ(catalogue.find("Dune"), nullptr);

  auto dune = make_timer("Dune", 100, 40);
  ASSERT_TRUE(catalogue.insert(dune));
  EXPECT_EQ(catalogue.size(), 1);
  EXPECT_EQ(catalogue.find("Dune"), dune);

  // titles are unique
  ASSERT_FALSE(catalogue.insert(make_timer("Dune", 10, 5)));
  EXPECT_EQ(catalogue.find("Dune"), dune);

  ASSERT_TRUE(catalogue.erase("Dune"));
  ASSERT_FALSE(catalogue.erase("Dune"));
  EXPECT_TRUE(catalogue.empty());
}

TEST(Catalogue, ReadersSeeLivePrice) {
  Catalogue catalogue;
  auto dune = make_timer("Dune", 100, 40);
  ASSERT_TRUE(catalogue.insert(dune));

  dune->tick(dune->listing_terms().start_time + 30s);
  EXPECT_EQ(catalogue.find("Dune")->current_price(), 70);
  EXPECT_EQ(catalogue.view().at(0).current_price, 70);
}

TEST(Catalogue, EraseByTimerOnlyRemovesItsOwnEntry) {
  Catalogue catalogue;
  auto old_dune = make_timer("Dune", 100, 40);
  auto new_dune = make_timer("Dune", 80, 20);
  ASSERT_TRUE(catalogue.insert(new_dune));

  ASSERT_FALSE(catalogue.erase(*old_dune));
  EXPECT_EQ(catalogue.find("Dune"), new_dune);

  ASSERT_TRUE(catalogue.erase(*new_dune));
  EXPECT_TRUE(catalogue.empty());
}

TEST(Catalogue, RejectsStoppedTimers) {
  Catalogue catalogue;
  auto dune = make_timer("Dune", 100, 40);
  dune->stop();
  ASSERT_FALSE(catalogue.insert(dune));
  ASSERT_FALSE(catalogue.insert(nullptr));
  EXPECT_TRUE(catalogue.empty());
}

TEST(Catalogue, ViewIsOrderedByTitle) {
  Catalogue catalogue;
  ASSERT_TRUE(catalogue.insert(make_timer("Hyperion", 50, 10)));
  ASSERT_TRUE(catalogue.insert(make_timer("Dune", 100, 40)));

  auto const listings = catalogue.view();
  ASSERT_EQ(listings.size(), 2);
  EXPECT_EQ(listings[0].title, "Dune");
  EXPECT_EQ(listings[0].current_price, 100);
  EXPECT_EQ(listings[0].floor_price, 40);
  EXPECT_EQ(listings[1].title, "Hyperion");
}
