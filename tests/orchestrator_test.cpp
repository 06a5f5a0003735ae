#include <gtest/gtest.h>

#include <condition_variable>
#include <functional>
#include <future>
#include <thread>

#include "account_store.hpp"
#include "aggregates.hpp"
#include "ledger.hpp"
#include "orchestrator.hpp"
#include "test_support.hpp"

using testing_support::normalized;

namespace {

using Fetch = std::function<std::expected<models::FetchResult, Error>(const models::Account &, std::stop_token)>;

class ScriptedProvider: public providers::Provider {
public:
  explicit ScriptedProvider(Fetch fetch): fetch_(std::move(fetch)) {}

  std::expected<models::FetchResult, Error>
  fetch(const models::Account &account, std::stop_token stop) override {
    return fetch_(account, stop);
  }

private:
  Fetch
    fetch_;
};

std::expected<models::FetchResult, Error>
blockUntilStopped(std::stop_token stop) {
  std::mutex mutex;
  std::condition_variable_any cv;
  std::unique_lock lock{mutex};
  cv.wait(lock, stop, []() { return false; });
  return std::unexpected(makeError(UNEXPECTED_CODE::TIMEOUT, "timeout"));
}

models::FetchResult
itemsFor(const std::string &accountId, int count) {
  models::FetchResult result;
  for(int i = 0; i < count; ++i) {
    result.items.push_back(normalized(accountId + "_tx" + std::to_string(i), 1700000000 + i,
                                      Decimal::fromUnits(-(i + 1)), "purchase"));
  }
  return result;
}

}

class OrchestratorTest: public ::testing::Test {
protected:
  std::unique_ptr<database::SqliteRepository> repository = testing_support::memoryRepository();
  ledger::Ledger ledger{*repository};
  accounts::AccountStore accounts{*repository};
  aggregates::AggregateCache aggregates{*repository};
  providers::ProviderRegistry registry;

  void
  addAccount(const std::string &id, models::ACCOUNT_STATUS status = models::ACCOUNT_STATUS::ACTIVE,
             models::PROVIDER provider = models::PROVIDER::CARD_AGGREGATOR) {
    models::Account account;
    account.id = id;
    account.provider = provider;
    account.displayName = id;
    account.status = status;
    ASSERT_TRUE(accounts.upsert(account).has_value());
  }

  void
  script(Fetch fetch) {
    registry.add(models::PROVIDER::CARD_AGGREGATOR, std::make_unique<ScriptedProvider>(std::move(fetch)));
  }

  std::unique_ptr<orchestrator::Orchestrator>
  makeOrchestrator(std::chrono::milliseconds timeout = std::chrono::milliseconds{2000}) {
    orchestrator::Options options;
    options.timeout = timeout;
    options.workers = 4;
    return std::make_unique<orchestrator::Orchestrator>(accounts, registry, ledger, aggregates, options);
  }
};

TEST_F(OrchestratorTest, MergesEveryAccount) {
  addAccount("acc_1");
  addAccount("acc_2");
  script([](const models::Account &account, std::stop_token) {
    return std::expected<models::FetchResult, Error>{itemsFor(account.id, 2)};
  });

  auto orchestrator = makeOrchestrator();
  auto results = orchestrator->refreshAll();

  ASSERT_EQ(results.size(), 2u);
  for(const auto &result : results) {
    EXPECT_EQ(result.outcome, models::SYNC_OUTCOME::OK);
    EXPECT_EQ(result.itemsMerged, 2);
  }
  EXPECT_EQ(ledger.size(), 4u);

  auto again = orchestrator->refreshAll();
  EXPECT_EQ(again[0].itemsMerged, 0);
  EXPECT_EQ(ledger.size(), 4u);
}

TEST_F(OrchestratorTest, OneSlowAccountDoesNotSinkTheOthers) {
  addAccount("acc_1");
  addAccount("acc_2");
  addAccount("acc_3");
  script([](const models::Account &account, std::stop_token stop) -> std::expected<models::FetchResult, Error> {
    if(account.id == "acc_2") {
      return blockUntilStopped(stop);
    }
    return itemsFor(account.id, account.id == "acc_1" ? 2 : 1);
  });

  auto orchestrator = makeOrchestrator(std::chrono::milliseconds{300});
  auto results = orchestrator->refreshAll();

  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(results[0].accountId, "acc_1");
  EXPECT_EQ(results[0].outcome, models::SYNC_OUTCOME::OK);
  EXPECT_EQ(results[1].accountId, "acc_2");
  EXPECT_EQ(results[1].outcome, models::SYNC_OUTCOME::FAILED);
  EXPECT_EQ(results[1].error, "timeout");
  EXPECT_TRUE(results[1].timedOut);
  EXPECT_EQ(results[2].outcome, models::SYNC_OUTCOME::OK);

  EXPECT_EQ(ledger.size(), 3u);
}

TEST_F(OrchestratorTest, LateResultIsDiscarded) {
  addAccount("acc_1");

  std::promise<void> release;
  auto released = release.get_future().share();
  script([released](const models::Account &account, std::stop_token) {
    released.wait();
    return std::expected<models::FetchResult, Error>{itemsFor(account.id, 3)};
  });

  auto orchestrator = makeOrchestrator(std::chrono::milliseconds{100});
  auto result = orchestrator->refreshOne("acc_1");
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->timedOut);

  release.set_value();
  orchestrator.reset();

  EXPECT_EQ(ledger.size(), 0u);
  EXPECT_FALSE(accounts.get("acc_1")->lastSyncedAt.has_value());
}

TEST_F(OrchestratorTest, ProviderErrorIsReportedPerAccount) {
  addAccount("acc_1");
  addAccount("acc_2");
  script([](const models::Account &account, std::stop_token) -> std::expected<models::FetchResult, Error> {
    if(account.id == "acc_1") {
      return std::unexpected(makeError(UNEXPECTED_CODE::PROVIDER, "upstream answered 503"));
    }
    return itemsFor(account.id, 1);
  });

  auto results = makeOrchestrator()->refreshAll();

  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].outcome, models::SYNC_OUTCOME::FAILED);
  EXPECT_EQ(results[0].error, "upstream answered 503");
  EXPECT_FALSE(results[0].timedOut);
  EXPECT_EQ(results[1].outcome, models::SYNC_OUTCOME::OK);
}

TEST_F(OrchestratorTest, SameAccountIsNotSyncedTwiceAtOnce) {
  addAccount("acc_1");

  std::promise<void> entered;
  std::promise<void> release;
  auto released = release.get_future().share();
  script([&entered, released](const models::Account &account, std::stop_token) {
    entered.set_value();
    released.wait();
    return std::expected<models::FetchResult, Error>{itemsFor(account.id, 1)};
  });

  auto orchestrator = makeOrchestrator();

  std::expected<models::SyncResult, Error> first = std::unexpected(makeError(UNEXPECTED_CODE::UNKNOWN, ""));
  std::thread worker([&]() { first = orchestrator->refreshOne("acc_1"); });

  entered.get_future().wait();
  auto second = orchestrator->refreshOne("acc_1");

  release.set_value();
  worker.join();

  ASSERT_TRUE(second.has_value());
  EXPECT_TRUE(second->rejected);
  EXPECT_EQ(second->error, "sync already in progress");

  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->outcome, models::SYNC_OUTCOME::OK);
  EXPECT_EQ(ledger.size(), 1u);
}

TEST_F(OrchestratorTest, InactiveAccountsAreOnlyRefreshedOnRequest) {
  addAccount("acc_1", models::ACCOUNT_STATUS::INACTIVE);
  script([](const models::Account &account, std::stop_token) {
    return std::expected<models::FetchResult, Error>{itemsFor(account.id, 1)};
  });

  auto orchestrator = makeOrchestrator();
  EXPECT_TRUE(orchestrator->refreshAll().empty());

  auto result = orchestrator->refreshOne("acc_1");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->outcome, models::SYNC_OUTCOME::OK);
  EXPECT_EQ(ledger.size(), 1u);
}

TEST_F(OrchestratorTest, UnknownAccountIsNotFound) {
  auto result = makeOrchestrator()->refreshOne("missing");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, UNEXPECTED_CODE::NOT_FOUND);
}

TEST_F(OrchestratorTest, MissingProviderFailsTheAccount) {
  addAccount("splitwise", models::ACCOUNT_STATUS::ACTIVE, models::PROVIDER::EXPENSE_SPLIT);

  auto result = makeOrchestrator()->refreshOne("splitwise");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->outcome, models::SYNC_OUTCOME::FAILED);
}

TEST_F(OrchestratorTest, SuccessfulSyncRecordsBalanceAndAggregates) {
  addAccount("acc_1");
  script([](const models::Account &account, std::stop_token) {
    auto result = itemsFor(account.id, 1);
    result.balance = Decimal::fromUnits(250);
    return std::expected<models::FetchResult, Error>{result};
  });

  auto result = makeOrchestrator()->refreshOne("acc_1");
  ASSERT_TRUE(result.has_value());

  auto account = accounts.get("acc_1");
  ASSERT_TRUE(account.has_value());
  EXPECT_TRUE(account->lastSyncedAt.has_value());
  EXPECT_EQ(account->balance, Decimal::fromUnits(250));
  EXPECT_EQ(aggregates.snapshot().totalBalance, Decimal::fromUnits(250));
}
