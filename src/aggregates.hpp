#pragma once

#include <expected>
#include <mutex>
#include <string>
#include <vector>

#include "models.hpp"
#include "repository.hpp"
#include "unexpected_codes.hpp"

namespace aggregates {

// "MM-YYYY" of a Unix timestamp, in UTC.
std::string
monthKey(std::int64_t timestamp);

models::Aggregates
compute(const std::vector<models::Account> &accounts, const std::vector<models::Event> &events);

// Balances and the monthly breakdown, rebuilt from storage on demand and
// served from memory in between.
class AggregateCache {
public:
  explicit AggregateCache(Repository &repository);

  std::expected<models::Aggregates, Error>
  recompute();

  models::Aggregates
  snapshot() const;

private:
  Repository
    &repository_;
  mutable std::mutex
    mutex_;
  models::Aggregates
    current_;
};

}
