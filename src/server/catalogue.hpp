#pragma once

#include "price_decay_timer.hpp"
#include "types.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

// Items currently on sale, keyed by title. Holds the live timers rather than copies, so readers
// always see the latest price.
class Catalogue final {
  std::map<std::string, std::shared_ptr<PriceDecayTimer>, std::less<>> listings;

public:
  // Registers a running timer under its title. Returns false if the title is already on sale
  bool insert(std::shared_ptr<PriceDecayTimer> timer);

  // Returns the timer for the title if it is on sale, nullptr otherwise
  std::shared_ptr<PriceDecayTimer> find(std::string_view title) const;

  bool contains(std::string_view title) const { return listings.find(title) != listings.end(); }

  // Removes the title. Returns false if it wasn't on sale
  bool erase(std::string_view title);

  // Removes the title only if it is still owned by the given timer
  bool erase(PriceDecayTimer const & timer);

  std::size_t size() const { return listings.size(); }
  bool empty() const { return listings.empty(); }

  // Snapshot of all listings, ordered by title
  std::vector<ListingInfo> view() const;
};
