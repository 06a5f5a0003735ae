#include "aggregates.hpp"

#include <chrono>
#include <format>
#include <map>
#include <set>

#include <spdlog/spdlog.h>

namespace aggregates {

namespace {

// year * 12 + month index, so months sort chronologically
int
monthIndex(std::int64_t timestamp) {
  using namespace std::chrono;

  const year_month_day day{floor<days>(sys_seconds{seconds{timestamp}})};
  return static_cast<int>(day.year()) * 12 + static_cast<int>(static_cast<unsigned>(day.month())) - 1;
}

std::string
formatMonth(int index) {
  return std::format("{:02}-{:04}", index % 12 + 1, index / 12);
}

}

std::string
monthKey(std::int64_t timestamp) {
  return formatMonth(monthIndex(timestamp));
}

models::Aggregates
compute(const std::vector<models::Account> &accounts, const std::vector<models::Event> &events) {
  models::Aggregates result;

  for(const auto &account : accounts) {
    if(account.status != models::ACCOUNT_STATUS::ACTIVE) {
      continue;
    }

    models::AccountBalance balance{
      account.id,
      account.displayName,
      account.balance.value_or(Decimal{}),
      account.lastSyncedAt
    };

    result.totalBalance += balance.balance;
    result.balances.push_back(std::move(balance));
  }

  std::set<int> months;
  std::map<std::string, std::map<int, Decimal>> byCategory;

  for(const auto &event : events) {
    auto month = monthIndex(event.date);
    months.insert(month);
    byCategory[event.categoryId][month] += event.amount;
  }

  for(auto &[category, amounts] : byCategory) {
    std::vector<models::MonthlyAmount> series;
    series.reserve(months.size());

    for(auto month : months) {
      auto found = amounts.find(month);
      series.push_back({formatMonth(month), found == amounts.end() ? Decimal{} : found->second});
    }

    result.monthlyBreakdown.emplace_back(category, std::move(series));
  }

  return result;
}

AggregateCache::AggregateCache(Repository &repository): repository_(repository) {}

std::expected<models::Aggregates, Error>
AggregateCache::recompute() {
  auto accounts = repository_.loadAccounts();
  if(!accounts) {
    return std::unexpected(accounts.error());
  }

  auto events = repository_.loadEvents();
  if(!events) {
    return std::unexpected(events.error());
  }

  auto result = compute(*accounts, *events);

  std::lock_guard lock{mutex_};
  current_ = result;

  spdlog::debug("aggregates recomputed: {} balances, {} categories",
                result.balances.size(), result.monthlyBreakdown.size());
  return result;
}

models::Aggregates
AggregateCache::snapshot() const {
  std::lock_guard lock{mutex_};
  return current_;
}

}
