#pragma once

#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "models.hpp"
#include "unexpected_codes.hpp"

// Persistence seam for the stores. Every call is one transaction: it either
// applies completely or returns an error and leaves storage untouched.
class Repository {
public:
  virtual ~Repository() = default;

  virtual std::expected<std::vector<models::LineItem>, Error>
  loadLineItems() = 0;

  // Upserts by id.
  virtual std::optional<Error>
  saveLineItems(const std::vector<models::LineItem> &items) = 0;

  virtual std::optional<Error>
  deleteLineItem(const std::string &id) = 0;

  virtual std::expected<std::vector<models::Hint>, Error>
  loadHints() = 0;

  virtual std::optional<Error>
  saveHint(const models::Hint &hint) = 0;

  // Rewrites display_order for every given hint at once.
  virtual std::optional<Error>
  saveHintOrder(const std::vector<models::Hint> &hints) = 0;

  virtual std::optional<Error>
  deleteHint(const std::string &id) = 0;

  virtual std::expected<std::vector<models::Event>, Error>
  loadEvents() = 0;

  // Stores the event and claims its line items; CONFLICT if one is already claimed.
  virtual std::optional<Error>
  saveEvent(const models::Event &event) = 0;

  // Deletes the event and releases its line items.
  virtual std::optional<Error>
  deleteEvent(const std::string &id) = 0;

  virtual std::expected<std::vector<models::Account>, Error>
  loadAccounts() = 0;

  virtual std::optional<Error>
  saveAccount(const models::Account &account) = 0;
};
