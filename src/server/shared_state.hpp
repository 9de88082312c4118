#pragma once

#include "catalogue.hpp"
#include "notification_service.hpp"
#include "seller_service.hpp"
#include "transaction_log.hpp"

#include <memory>

// State of the seller process shared between buyer connections, the console and the price timers
struct SharedState {
  // Items currently on sale
  std::shared_ptr<Catalogue> catalogue;

  // Notifications for the seller about sold and expired items
  std::shared_ptr<NotificationService> notifications;

  // Core logic for listing items and answering buyers
  SellerService seller_service;

  // Append-only history of listings, sales and expirations
  TransactionLog transaction_log;

  // Writes every pending notification into the sales log and prints it for the seller.
  // Returns how many notifications were flushed.
  std::size_t flush_notifications();
};
