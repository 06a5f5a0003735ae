#include "ledger.hpp"

#include <algorithm>
#include <format>

#include <spdlog/spdlog.h>

#include "ids.hpp"

namespace ledger {

namespace {

bool
sameFields(const models::LineItem &item, const models::NormalizedItem &incoming) {
  return item.date == incoming.date &&
         item.amount == incoming.amount &&
         item.description == incoming.description &&
         item.counterparty == incoming.counterparty &&
         item.paymentMethod == incoming.paymentMethod;
}

void
applyFields(models::LineItem &item, const models::NormalizedItem &incoming) {
  item.date = incoming.date;
  item.amount = incoming.amount;
  item.description = incoming.description;
  item.counterparty = incoming.counterparty;
  item.paymentMethod = incoming.paymentMethod;
}

std::string
joinIds(const std::vector<std::string> &ids) {
  std::string joined;
  for(const auto &id : ids) {
    if(!joined.empty()) {
      joined += ", ";
    }
    joined += id;
  }
  return joined;
}

}

Ledger::Ledger(Repository &repository): repository_(repository) {}

std::optional<Error>
Ledger::load() {
  auto stored = repository_.loadLineItems();
  if(!stored) {
    return stored.error();
  }

  std::lock_guard lock{mutex_};

  items_.clear();
  byExternalRef_.clear();

  for(auto &item : *stored) {
    if(!item.isManual()) {
      byExternalRef_.emplace(ExternalKey{item.provider, item.externalRef}, item.id);
    }
    items_.emplace(item.id, std::move(item));
  }

  spdlog::info("ledger loaded {} line items", items_.size());
  return std::nullopt;
}

std::expected<models::MergeReport, Error>
Ledger::merge(const std::string &provider, const std::vector<models::NormalizedItem> &items) {
  if(provider.empty()) {
    return std::unexpected(makeError(UNEXPECTED_CODE::VALIDATION, "merge needs a provider"));
  }

  for(const auto &item : items) {
    if(item.externalRef.empty()) {
      return std::unexpected(makeError(UNEXPECTED_CODE::VALIDATION,
          std::format("{} sent an item without an external reference", provider)));
    }
  }

  std::lock_guard lock{mutex_};

  models::MergeReport report;

  // Changes are staged and persisted first so a storage failure leaves memory as it was.
  std::unordered_map<std::string, models::LineItem> staged;
  std::map<std::string, std::string> insertedRefs;
  std::vector<std::string> order;

  for(const auto &incoming : items) {
    std::optional<std::string> id;

    if(auto found = byExternalRef_.find(ExternalKey{provider, incoming.externalRef});
       found != byExternalRef_.end()) {
      id = found->second;
    } else if(auto inserted = insertedRefs.find(incoming.externalRef); inserted != insertedRefs.end()) {
      id = inserted->second;
    }

    if(!id) {
      models::LineItem item;
      item.id = ids::generateId("li");
      item.provider = provider;
      item.externalRef = incoming.externalRef;
      applyFields(item, incoming);

      insertedRefs.emplace(incoming.externalRef, item.id);
      order.push_back(item.id);
      staged.emplace(item.id, std::move(item));
      ++report.inserted;
      continue;
    }

    auto stagedItem = staged.find(*id);
    const auto &current = stagedItem != staged.end() ? stagedItem->second : items_.at(*id);

    if(sameFields(current, incoming)) {
      ++report.unchanged;
      continue;
    }

    models::LineItem updated = current;
    applyFields(updated, incoming);

    if(stagedItem == staged.end()) {
      order.push_back(*id);
    }
    staged.insert_or_assign(*id, std::move(updated));
    ++report.updated;
  }

  if(staged.empty()) {
    return report;
  }

  std::vector<models::LineItem> changes;
  changes.reserve(order.size());
  for(const auto &id : order) {
    changes.push_back(staged.at(id));
  }

  if(auto error = repository_.saveLineItems(changes)) {
    return std::unexpected(*error);
  }

  for(auto &change : changes) {
    auto existing = items_.find(change.id);

    if(existing == items_.end()) {
      byExternalRef_.emplace(ExternalKey{change.provider, change.externalRef}, change.id);
      items_.emplace(change.id, std::move(change));
      continue;
    }

    // Only provider fields move; review, selection and event stay put.
    existing->second.date = change.date;
    existing->second.amount = change.amount;
    existing->second.description = std::move(change.description);
    existing->second.counterparty = std::move(change.counterparty);
    existing->second.paymentMethod = std::move(change.paymentMethod);
  }

  spdlog::debug("merged {} items from {}: {} inserted, {} updated, {} unchanged",
                items.size(), provider, report.inserted, report.updated, report.unchanged);

  return report;
}

void
Ledger::sortForReview(std::vector<models::LineItem> &items) {
  std::sort(items.begin(), items.end(), [](const models::LineItem &a, const models::LineItem &b) {
    if(a.date != b.date) {
      return a.date > b.date;
    }
    return a.id < b.id;
  });
}

std::vector<models::LineItem>
Ledger::listUnreviewed() const {
  return list(models::LineItemFilter{true, std::nullopt});
}

std::vector<models::LineItem>
Ledger::list(const models::LineItemFilter &filter) const {
  std::vector<models::LineItem> result;

  {
    std::lock_guard lock{mutex_};

    for(const auto &[id, item] : items_) {
      if(filter.onlyToReview && item.eventId) {
        continue;
      }
      if(filter.paymentMethod && item.paymentMethod != *filter.paymentMethod) {
        continue;
      }
      result.push_back(item);
    }
  }

  sortForReview(result);
  return result;
}

std::expected<models::LineItem, Error>
Ledger::get(const std::string &id) const {
  std::lock_guard lock{mutex_};

  auto found = items_.find(id);
  if(found == items_.end()) {
    return std::unexpected(makeError(UNEXPECTED_CODE::NOT_FOUND,
                                     std::format("Line item not found: {}", id)));
  }
  return found->second;
}

std::expected<std::vector<models::LineItem>, Error>
Ledger::getMany(const std::vector<std::string> &ids) const {
  std::lock_guard lock{mutex_};

  std::vector<models::LineItem> result;
  std::vector<std::string> missing;

  for(const auto &id : ids) {
    auto found = items_.find(id);
    if(found == items_.end()) {
      missing.push_back(id);
      continue;
    }
    result.push_back(found->second);
  }

  if(!missing.empty()) {
    return std::unexpected(makeError(UNEXPECTED_CODE::PARTIAL_NOT_FOUND,
                                     std::format("Line items not found: {}", joinIds(missing))));
  }

  return result;
}

std::expected<models::LineItem, Error>
Ledger::toggleSelect(const std::string &id) {
  std::lock_guard lock{mutex_};

  auto found = items_.find(id);
  if(found == items_.end() || found->second.eventId) {
    return std::unexpected(makeError(UNEXPECTED_CODE::NOT_FOUND,
                                     std::format("Line item not reviewable: {}", id)));
  }

  found->second.selected = !found->second.selected;
  return found->second;
}

std::optional<Error>
Ledger::removeMany(const std::vector<std::string> &ids, const std::string &eventId) {
  std::lock_guard lock{mutex_};

  std::vector<std::string> missing;
  std::vector<std::string> attached;

  for(const auto &id : ids) {
    auto found = items_.find(id);
    if(found == items_.end()) {
      missing.push_back(id);
    } else if(found->second.eventId) {
      attached.push_back(id);
    }
  }

  if(!missing.empty()) {
    return makeError(UNEXPECTED_CODE::PARTIAL_NOT_FOUND,
                     std::format("Line items not found: {}", joinIds(missing)));
  }

  if(!attached.empty()) {
    return makeError(UNEXPECTED_CODE::CONFLICT,
                     std::format("Line items already belong to an event: {}", joinIds(attached)));
  }

  for(const auto &id : ids) {
    auto &item = items_.at(id);
    item.eventId = eventId;
    item.reviewed = true;
    item.selected = false;
  }

  return std::nullopt;
}

void
Ledger::restore(const std::vector<std::string> &ids) {
  std::lock_guard lock{mutex_};

  for(const auto &id : ids) {
    auto found = items_.find(id);
    if(found == items_.end()) {
      spdlog::warn("cannot restore missing line item {}", id);
      continue;
    }

    found->second.eventId.reset();
    found->second.reviewed = false;
    found->second.selected = false;
  }
}

std::expected<models::LineItem, Error>
Ledger::insertManual(const models::NewManualItem &manual) {
  models::LineItem item;
  item.id = ids::generateId("li");
  item.date = manual.date;
  item.amount = manual.amount;
  item.description = manual.description;
  item.counterparty = manual.counterparty;
  item.paymentMethod = manual.paymentMethod;

  std::lock_guard lock{mutex_};

  if(auto error = repository_.saveLineItems({item})) {
    return std::unexpected(*error);
  }

  items_.emplace(item.id, item);
  spdlog::info("manual line item {} created: {} {}", item.id, item.description, item.amount.toString());
  return item;
}

std::optional<Error>
Ledger::deleteManual(const std::string &id) {
  std::lock_guard lock{mutex_};

  auto found = items_.find(id);
  if(found == items_.end()) {
    return makeError(UNEXPECTED_CODE::NOT_FOUND, std::format("Line item not found: {}", id));
  }

  if(!found->second.isManual()) {
    return makeError(UNEXPECTED_CODE::NOT_MANUAL,
                     std::format("Line item {} was synced from {} and cannot be deleted",
                                 id, found->second.provider));
  }

  if(found->second.eventId) {
    return makeError(UNEXPECTED_CODE::CONFLICT,
                     std::format("Line item {} belongs to event {}", id, *found->second.eventId));
  }

  if(auto error = repository_.deleteLineItem(id)) {
    return error;
  }

  items_.erase(found);
  spdlog::info("manual line item {} deleted", id);
  return std::nullopt;
}

std::size_t
Ledger::size() const {
  std::lock_guard lock{mutex_};
  return items_.size();
}

}
