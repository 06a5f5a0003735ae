#include <gtest/gtest.h>

#include "account_store.hpp"
#include "test_support.hpp"

namespace {

models::Account
card(std::string id, std::string displayName) {
  models::Account account;
  account.id = std::move(id);
  account.displayName = std::move(displayName);
  return account;
}

}

class AccountStoreTest: public ::testing::Test {
protected:
  std::unique_ptr<database::SqliteRepository> storage = testing_support::memoryRepository();
  testing_support::FlakyRepository repository{*storage};
  accounts::AccountStore store{repository};
};

TEST_F(AccountStoreTest, UpsertKeepsSyncState) {
  ASSERT_TRUE(store.upsert(card("acc_1", "Visa")).has_value());
  ASSERT_FALSE(store.recordSync("acc_1", 1700000000, Decimal::fromUnits(42)).has_value());

  auto renamed = store.upsert(card("acc_1", "Visa Gold"));
  ASSERT_TRUE(renamed.has_value());
  EXPECT_EQ(renamed->displayName, "Visa Gold");
  EXPECT_EQ(renamed->lastSyncedAt, 1700000000);
  EXPECT_EQ(renamed->balance, Decimal::fromUnits(42));
}

TEST_F(AccountStoreTest, RejectsIncompleteOrMovedAccounts) {
  EXPECT_EQ(store.upsert(card("", "Visa")).error().code, UNEXPECTED_CODE::VALIDATION);
  EXPECT_EQ(store.upsert(card("acc_1", "")).error().code, UNEXPECTED_CODE::VALIDATION);

  ASSERT_TRUE(store.upsert(card("acc_1", "Visa")).has_value());
  auto moved = card("acc_1", "Visa");
  moved.provider = models::PROVIDER::PEER_PAYMENT;
  auto result = store.upsert(moved);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, UNEXPECTED_CODE::CONFLICT);
}

TEST_F(AccountStoreTest, SyncWithoutBalanceKeepsTheLastOne) {
  ASSERT_TRUE(store.upsert(card("acc_1", "Visa")).has_value());
  ASSERT_FALSE(store.recordSync("acc_1", 100, Decimal::fromUnits(10)).has_value());
  ASSERT_FALSE(store.recordSync("acc_1", 200, std::nullopt).has_value());

  auto account = store.get("acc_1");
  ASSERT_TRUE(account.has_value());
  EXPECT_EQ(account->lastSyncedAt, 200);
  EXPECT_EQ(account->balance, Decimal::fromUnits(10));

  EXPECT_EQ(store.recordSync("missing", 1, std::nullopt)->code, UNEXPECTED_CODE::NOT_FOUND);
}

TEST_F(AccountStoreTest, FailedWriteLeavesMemoryAlone) {
  ASSERT_TRUE(store.upsert(card("acc_1", "Visa")).has_value());

  repository.failAccounts = true;
  EXPECT_FALSE(store.setStatus("acc_1", models::ACCOUNT_STATUS::INACTIVE).has_value());
  EXPECT_EQ(store.get("acc_1")->status, models::ACCOUNT_STATUS::ACTIVE);
}

TEST_F(AccountStoreTest, ReloadsFromStorage) {
  ASSERT_TRUE(store.upsert(card("acc_2", "Amex")).has_value());
  ASSERT_TRUE(store.upsert(card("acc_1", "Visa")).has_value());
  ASSERT_TRUE(store.setStatus("acc_2", models::ACCOUNT_STATUS::INACTIVE).has_value());

  accounts::AccountStore reloaded{repository};
  ASSERT_FALSE(reloaded.load().has_value());

  auto accounts = reloaded.list();
  ASSERT_EQ(accounts.size(), 2u);
  EXPECT_EQ(accounts[0].id, "acc_1");
  EXPECT_EQ(accounts[1].status, models::ACCOUNT_STATUS::INACTIVE);
}
