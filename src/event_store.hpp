#pragma once

#include <cstdint>
#include <expected>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ledger.hpp"
#include "models.hpp"
#include "repository.hpp"
#include "unexpected_codes.hpp"

namespace events {

class EventStore {
public:
  EventStore(Repository &repository, ledger::Ledger &ledger);

  EventStore(const EventStore &) = delete;
  EventStore &operator=(const EventStore &) = delete;

  std::optional<Error>
  load();

  // Claims the line items in the ledger, then persists. If persisting fails
  // the claim is released again.
  std::expected<models::Event, Error>
  create(const models::NewEvent &request);

  // Deletes the event and sends exactly its line items back to review.
  std::optional<Error>
  remove(const std::string &id);

  std::expected<models::Event, Error>
  get(const std::string &id) const;

  // Inclusive range on the event date, newest first.
  models::EventList
  list(std::optional<std::int64_t> startTime, std::optional<std::int64_t> endTime) const;

  std::vector<models::Event>
  all() const;

  std::expected<std::vector<models::LineItem>, Error>
  lineItemsFor(const std::string &id) const;

private:
  Repository
    &repository_;
  ledger::Ledger
    &ledger_;
  mutable std::mutex
    mutex_;
  std::map<std::string, models::Event>
    events_;
};

// Event amount and date as derived from its line items.
Decimal
eventAmount(const std::vector<models::LineItem> &items, bool isDuplicateTransaction);

std::int64_t
earliestDate(const std::vector<models::LineItem> &items);

}
