#include "transaction_log.hpp"

#include <fmt/format.h>
#include <tl/expected.hpp>

#include <chrono>
#include <cstdint>

namespace {
int64_t to_unix_seconds(TimePoint time) {
  return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
}
}  // namespace

tl::expected<TransactionLog, std::string> TransactionLog::open(std::string const & path) {
  std::FILE * file = std::fopen(path.c_str(), "a");
  if (!file) {
    return tl::make_unexpected(fmt::format("failed to open sales log '{}'", path));
  }
  return TransactionLog(file);
}

TransactionLog::~TransactionLog() {
  if (file) {
    std::fclose(file);
  }
}

void TransactionLog::log(std::string_view title, std::string_view message) {
  namespace ch = std::chrono;
  int64_t const unix_now_ms = ch::duration_cast<ch::milliseconds>(ch::system_clock::now().time_since_epoch()).count();
  auto const timestamp = static_cast<double>(unix_now_ms) / 1000.0;

  auto log_entry = fmt::format("{}: item{{.title=\"{}\"}} {}\n", timestamp, title, message);
  std::fwrite(log_entry.data(), 1, log_entry.size(), file);
  std::fflush(file);
}

void TransactionLog::save(ListingTerms const & terms) {
  log(terms.title, fmt::format("listed .initial_price={} .floor_price={} .deadline={}", terms.initial_price,
                               terms.floor_price, to_unix_seconds(terms.deadline)));
}

void TransactionLog::save(Notification const & notification) {
  switch (notification.kind) {
  case NotificationKind::Sold: log(notification.title, fmt::format("sold .price={}", notification.price)); break;
  case NotificationKind::Expired: log(notification.title, "expired"); break;
  }
}
