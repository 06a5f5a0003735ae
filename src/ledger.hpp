#pragma once

#include <expected>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "models.hpp"
#include "repository.hpp"
#include "unexpected_codes.hpp"

namespace ledger {

// Authoritative set of line items. Every mutation runs under one mutex and is
// written to the repository before it becomes visible in memory.
class Ledger {
public:
  explicit Ledger(Repository &repository);

  Ledger(const Ledger &) = delete;
  Ledger &operator=(const Ledger &) = delete;

  // Replaces the in-memory state with what the repository holds.
  std::optional<Error>
  load();

  // Upserts by (provider, externalRef). Existing items keep their id, review
  // and selection state; merging the same batch twice changes nothing.
  std::expected<models::MergeReport, Error>
  merge(const std::string &provider, const std::vector<models::NormalizedItem> &items);

  // Items not attached to an event, newest first, ties by id.
  std::vector<models::LineItem>
  listUnreviewed() const;

  std::vector<models::LineItem>
  list(const models::LineItemFilter &filter) const;

  std::expected<models::LineItem, Error>
  get(const std::string &id) const;

  // All or nothing: PARTIAL_NOT_FOUND names every missing id.
  std::expected<std::vector<models::LineItem>, Error>
  getMany(const std::vector<std::string> &ids) const;

  std::expected<models::LineItem, Error>
  toggleSelect(const std::string &id);

  // Takes the items out of the reviewable set by attaching them to eventId.
  // Fails without touching anything when an id is unknown (PARTIAL_NOT_FOUND)
  // or already attached to an event (CONFLICT). The caller persists the event.
  std::optional<Error>
  removeMany(const std::vector<std::string> &ids, const std::string &eventId);

  // Returns items to the reviewable set with review and selection cleared.
  void
  restore(const std::vector<std::string> &ids);

  std::expected<models::LineItem, Error>
  insertManual(const models::NewManualItem &item);

  std::optional<Error>
  deleteManual(const std::string &id);

  std::size_t size() const;

private:
  using ExternalKey = std::pair<std::string, std::string>;

  Repository
    &repository_;
  mutable std::mutex
    mutex_;
  std::unordered_map<std::string, models::LineItem>
    items_;
  std::map<ExternalKey, std::string>
    byExternalRef_;

  static void sortForReview(std::vector<models::LineItem> &items);
};

}
