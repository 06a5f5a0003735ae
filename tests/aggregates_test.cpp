#include <gtest/gtest.h>

#include "aggregates.hpp"
#include "test_support.hpp"

namespace {

models::Account
account(std::string id, models::ACCOUNT_STATUS status, std::optional<Decimal> balance) {
  models::Account result;
  result.id = id;
  result.displayName = id + " card";
  result.status = status;
  result.balance = balance;
  return result;
}

models::Event
event(std::string category, std::int64_t date, Decimal amount) {
  models::Event result;
  result.id = "evt_" + category + std::to_string(date);
  result.categoryId = std::move(category);
  result.date = date;
  result.amount = amount;
  return result;
}

}

TEST(Aggregates, MonthKeysAreUtc) {
  EXPECT_EQ(aggregates::monthKey(1700000000), "11-2023");
  EXPECT_EQ(aggregates::monthKey(1704067199), "12-2023");
  EXPECT_EQ(aggregates::monthKey(1704067200), "01-2024");
}

TEST(Aggregates, BalancesCoverActiveAccountsOnly) {
  auto result = aggregates::compute({
    account("a", models::ACCOUNT_STATUS::ACTIVE, Decimal::fromUnits(100)),
    account("b", models::ACCOUNT_STATUS::INACTIVE, Decimal::fromUnits(999)),
    account("c", models::ACCOUNT_STATUS::ACTIVE, std::nullopt)
  }, {});

  ASSERT_EQ(result.balances.size(), 2u);
  EXPECT_EQ(result.balances[0].accountId, "a");
  EXPECT_EQ(result.balances[1].balance, Decimal{});
  EXPECT_EQ(result.totalBalance, Decimal::fromUnits(100));
}

TEST(Aggregates, MonthlyBreakdownIsZeroFilled) {
  auto result = aggregates::compute({}, {
    event("dining", 1700000000, Decimal::fromUnits(-20)),
    event("dining", 1700100000, Decimal::fromUnits(-5)),
    event("travel", 1704067200, Decimal::fromUnits(-300))
  });

  ASSERT_EQ(result.monthlyBreakdown.size(), 2u);

  const auto &[dining, diningMonths] = result.monthlyBreakdown[0];
  EXPECT_EQ(dining, "dining");
  ASSERT_EQ(diningMonths.size(), 2u);
  EXPECT_EQ(diningMonths[0].month, "11-2023");
  EXPECT_EQ(diningMonths[0].amount, Decimal::fromUnits(-25));
  EXPECT_EQ(diningMonths[1].month, "01-2024");
  EXPECT_EQ(diningMonths[1].amount, Decimal{});

  const auto &[travel, travelMonths] = result.monthlyBreakdown[1];
  EXPECT_EQ(travel, "travel");
  EXPECT_EQ(travelMonths[0].amount, Decimal{});
  EXPECT_EQ(travelMonths[1].amount, Decimal::fromUnits(-300));
}

TEST(AggregateCache, SnapshotHoldsTheLastGoodComputation) {
  auto storage = testing_support::memoryRepository();
  testing_support::FlakyRepository repository{*storage};
  aggregates::AggregateCache cache{repository};

  ASSERT_FALSE(repository.saveAccount(account("a", models::ACCOUNT_STATUS::ACTIVE, Decimal::fromUnits(50))).has_value());
  ASSERT_TRUE(cache.recompute().has_value());
  EXPECT_EQ(cache.snapshot().totalBalance, Decimal::fromUnits(50));

  repository.failAccounts = true;
  auto failed = cache.recompute();
  ASSERT_FALSE(failed.has_value());
  EXPECT_EQ(failed.error().code, UNEXPECTED_CODE::UNKNOWN);
  EXPECT_EQ(cache.snapshot().totalBalance, Decimal::fromUnits(50));
}
