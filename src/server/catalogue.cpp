#include "catalogue.hpp"

#include <utility>

bool Catalogue::insert(std::shared_ptr<PriceDecayTimer> timer) {
  if (!timer || !timer->running()) {
    return false;
  }
  std::string title = timer->title();
  return listings.emplace(std::move(title), std::move(timer)).second;
}

std::shared_ptr<PriceDecayTimer> Catalogue::find(std::string_view title) const {
  auto const it = listings.find(title);
  if (it == listings.end()) {
    return nullptr;
  }
  return it->second;
}

bool Catalogue::erase(std::string_view title) {
  auto const it = listings.find(title);
  if (it == listings.end()) {
    return false;
  }
  listings.erase(it);
  return true;
}

bool Catalogue::erase(PriceDecayTimer const & timer) {
  auto const it = listings.find(timer.title());
  if (it == listings.end() || it->second.get() != &timer) {
    return false;
  }
  listings.erase(it);
  return true;
}

std::vector<ListingInfo> Catalogue::view() const {
  std::vector<ListingInfo> result;
  result.reserve(listings.size());
  for (auto const & [title, timer] : listings) {
    result.push_back(ListingInfo{
        .title = title,
        .current_price = timer->current_price(),
        .floor_price = timer->listing_terms().floor_price,
        .deadline = timer->listing_terms().deadline,
    });
  }
  return result;
}
