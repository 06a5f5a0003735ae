#include "event_store.hpp"

#include <algorithm>
#include <format>
#include <unordered_set>

#include <spdlog/spdlog.h>

#include "ids.hpp"

namespace events {

Decimal
eventAmount(const std::vector<models::LineItem> &items, bool isDuplicateTransaction) {
  if(items.empty()) {
    return Decimal{};
  }

  // A duplicated transaction shows up once per source; only one copy counts.
  if(isDuplicateTransaction) {
    return items.front().amount;
  }

  Decimal total;
  for(const auto &item : items) {
    total += item.amount;
  }
  return total;
}

std::int64_t
earliestDate(const std::vector<models::LineItem> &items) {
  auto earliest = std::min_element(items.begin(), items.end(),
      [](const models::LineItem &a, const models::LineItem &b) { return a.date < b.date; });
  return earliest == items.end() ? 0 : earliest->date;
}

EventStore::EventStore(Repository &repository, ledger::Ledger &ledger)
  : repository_(repository), ledger_(ledger) {}

std::optional<Error>
EventStore::load() {
  auto stored = repository_.loadEvents();
  if(!stored) {
    return stored.error();
  }

  std::lock_guard lock{mutex_};

  events_.clear();
  for(auto &event : *stored) {
    events_.emplace(event.id, std::move(event));
  }

  spdlog::info("loaded {} events", events_.size());
  return std::nullopt;
}

std::expected<models::Event, Error>
EventStore::create(const models::NewEvent &request) {
  if(request.name.find_first_not_of(" \t\r\n") == std::string::npos) {
    return std::unexpected(makeError(UNEXPECTED_CODE::VALIDATION, "Missing required field: name"));
  }

  if(request.lineItemIds.empty()) {
    return std::unexpected(makeError(UNEXPECTED_CODE::VALIDATION,
                                     "An event needs at least one line item"));
  }

  std::unordered_set<std::string> seen;
  for(const auto &id : request.lineItemIds) {
    if(!seen.insert(id).second) {
      return std::unexpected(makeError(UNEXPECTED_CODE::VALIDATION,
                                       std::format("Line item {} listed twice", id)));
    }
  }

  auto items = ledger_.getMany(request.lineItemIds);
  if(!items) {
    return std::unexpected(items.error());
  }

  models::Event event;
  event.id = ids::generateId("evt");
  event.name = request.name;
  event.categoryId = request.categoryId;
  event.lineItemIds = request.lineItemIds;
  event.isDuplicateTransaction = request.isDuplicateTransaction;
  event.amount = eventAmount(*items, request.isDuplicateTransaction);
  event.date = request.date.value_or(earliestDate(*items));

  std::lock_guard lock{mutex_};

  // The ledger is the arbiter between two events racing for the same item.
  if(auto error = ledger_.removeMany(event.lineItemIds, event.id)) {
    return std::unexpected(*error);
  }

  if(auto error = repository_.saveEvent(event)) {
    spdlog::error("event {} not stored, releasing its line items: {}", event.id, error->message);
    ledger_.restore(event.lineItemIds);
    return std::unexpected(*error);
  }

  events_.emplace(event.id, event);

  spdlog::info("created event {} '{}' from {} line items, amount {}",
               event.id, event.name, event.lineItemIds.size(), event.amount.toString());
  return event;
}

std::optional<Error>
EventStore::remove(const std::string &id) {
  std::lock_guard lock{mutex_};

  auto found = events_.find(id);
  if(found == events_.end()) {
    return makeError(UNEXPECTED_CODE::NOT_FOUND, std::format("Event not found: {}", id));
  }

  if(auto error = repository_.deleteEvent(id)) {
    return error;
  }

  ledger_.restore(found->second.lineItemIds);
  events_.erase(found);

  spdlog::info("deleted event {}", id);
  return std::nullopt;
}

std::expected<models::Event, Error>
EventStore::get(const std::string &id) const {
  std::lock_guard lock{mutex_};

  auto found = events_.find(id);
  if(found == events_.end()) {
    return std::unexpected(makeError(UNEXPECTED_CODE::NOT_FOUND,
                                     std::format("Event not found: {}", id)));
  }
  return found->second;
}

models::EventList
EventStore::list(std::optional<std::int64_t> startTime, std::optional<std::int64_t> endTime) const {
  models::EventList result;

  {
    std::lock_guard lock{mutex_};

    for(const auto &[id, event] : events_) {
      if(startTime && event.date < *startTime) {
        continue;
      }
      if(endTime && event.date > *endTime) {
        continue;
      }
      result.total += event.amount;
      result.events.push_back(event);
    }
  }

  std::sort(result.events.begin(), result.events.end(),
            [](const models::Event &a, const models::Event &b) {
              if(a.date != b.date) {
                return a.date > b.date;
              }
              return a.id < b.id;
            });

  return result;
}

std::vector<models::Event>
EventStore::all() const {
  return list(std::nullopt, std::nullopt).events;
}

std::expected<std::vector<models::LineItem>, Error>
EventStore::lineItemsFor(const std::string &id) const {
  auto event = get(id);
  if(!event) {
    return std::unexpected(event.error());
  }
  return ledger_.getMany(event->lineItemIds);
}

}
