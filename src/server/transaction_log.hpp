#pragma once

#include "notification_service.hpp"
#include "types.hpp"

#include <tl/expected.hpp>

#include <cstdio>
#include <string>
#include <string_view>
#include <utility>

// Stateless wrapper around C-style file api, that performs append-only writes of the sales history.
// The log is never read back.
class TransactionLog final {
  std::FILE * file;

  // private constructor, use `open` instead
  TransactionLog(std::FILE * file) : file(file) {}

public:
  // Opens a sales log file in the 'append only' mode. If the file doesn't exist, it will be created
  static tl::expected<TransactionLog, std::string> open(std::string const & path);
  ~TransactionLog();

  // This class cannot be copied, but can be moved
  TransactionLog(TransactionLog const &) = delete;
  TransactionLog & operator=(TransactionLog const &) = delete;
  TransactionLog(TransactionLog && other) noexcept : file(other.file) { other.file = nullptr; }
  TransactionLog & operator=(TransactionLog && other) noexcept {
    // move and swap idiom via local varialbe
    TransactionLog local = std::move(other);
    std::swap(file, local.file);
    return *this;
  }

  // listings, sales and expirations
  void log(std::string_view title, std::string_view message);

  void save(ListingTerms const & terms);
  void save(Notification const & notification);
};
