#include <gtest/gtest.h>

#include "database.hpp"
#include "test_support.hpp"

class DatabaseTest: public ::testing::Test {
protected:
  std::unique_ptr<database::SqliteRepository> repository = testing_support::memoryRepository();

  models::LineItem
  lineItem(std::string id, std::string ref) {
    models::LineItem item;
    item.id = std::move(id);
    item.provider = "card_aggregator";
    item.externalRef = std::move(ref);
    item.date = 1700000000;
    item.amount = Decimal::fromCents(-999);
    item.description = "Cafe";
    item.paymentMethod = "Visa";
    return item;
  }
};

TEST_F(DatabaseTest, LineItemsRoundTripThroughUpsert) {
  ASSERT_FALSE(repository->saveLineItems({lineItem("li_1", "tx1")}).has_value());

  auto changed = lineItem("li_1", "tx1");
  changed.amount = Decimal::fromCents(-1000);
  ASSERT_FALSE(repository->saveLineItems({changed}).has_value());

  auto items = repository->loadLineItems();
  ASSERT_TRUE(items.has_value());
  ASSERT_EQ(items->size(), 1u);
  EXPECT_EQ(items->front().amount, Decimal::fromCents(-1000));
  EXPECT_FALSE(items->front().reviewed);
}

TEST_F(DatabaseTest, ProviderReferenceIsUnique) {
  ASSERT_FALSE(repository->saveLineItems({lineItem("li_1", "tx1")}).has_value());

  auto clash = repository->saveLineItems({lineItem("li_2", "tx1")});
  ASSERT_TRUE(clash.has_value());
  EXPECT_EQ(clash->code, UNEXPECTED_CODE::CONFLICT);
}

TEST_F(DatabaseTest, ManualItemsDoNotClash) {
  auto first = lineItem("li_1", "");
  first.provider.clear();
  auto second = lineItem("li_2", "");
  second.provider.clear();

  EXPECT_FALSE(repository->saveLineItems({first, second}).has_value());
}

TEST_F(DatabaseTest, FailedBatchIsRolledBack) {
  auto result = repository->saveLineItems({lineItem("li_1", "tx1"), lineItem("li_2", "tx1")});
  ASSERT_TRUE(result.has_value());

  EXPECT_TRUE(repository->loadLineItems()->empty());
}

TEST_F(DatabaseTest, LineItemCanBeClaimedOnce) {
  ASSERT_FALSE(repository->saveLineItems({lineItem("li_1", "tx1")}).has_value());

  models::Event event;
  event.id = "evt_1";
  event.name = "Coffee";
  event.lineItemIds = {"li_1"};
  ASSERT_FALSE(repository->saveEvent(event).has_value());

  auto items = repository->loadLineItems();
  ASSERT_TRUE(items.has_value());
  EXPECT_TRUE(items->front().reviewed);
  EXPECT_EQ(items->front().eventId, "evt_1");

  event.id = "evt_2";
  auto clash = repository->saveEvent(event);
  ASSERT_TRUE(clash.has_value());
  EXPECT_EQ(clash->code, UNEXPECTED_CODE::CONFLICT);
  EXPECT_EQ(repository->loadEvents()->size(), 1u);

  ASSERT_FALSE(repository->deleteEvent("evt_1").has_value());
  EXPECT_FALSE(repository->loadLineItems()->front().eventId.has_value());
}

TEST_F(DatabaseTest, ActiveHintOrderIsUnique) {
  models::Hint first;
  first.id = "eh_1";
  first.name = "first";
  first.expression = "true";
  first.prefillName = "x";
  first.displayOrder = 0;
  ASSERT_FALSE(repository->saveHint(first).has_value());

  auto second = first;
  second.id = "eh_2";
  auto clash = repository->saveHint(second);
  ASSERT_TRUE(clash.has_value());
  EXPECT_EQ(clash->code, UNEXPECTED_CODE::DUPLICATE_ORDER);

  second.active = false;
  EXPECT_FALSE(repository->saveHint(second).has_value());
}

TEST_F(DatabaseTest, HintOrderCanBeSwapped) {
  models::Hint a;
  a.id = "eh_a";
  a.name = "a";
  a.expression = "true";
  a.prefillName = "a";
  a.displayOrder = 0;
  auto b = a;
  b.id = "eh_b";
  b.displayOrder = 1;
  ASSERT_FALSE(repository->saveHint(a).has_value());
  ASSERT_FALSE(repository->saveHint(b).has_value());

  a.displayOrder = 1;
  b.displayOrder = 0;
  ASSERT_FALSE(repository->saveHintOrder({b, a}).has_value());

  auto hints = repository->loadHints();
  ASSERT_TRUE(hints.has_value());
  for(const auto &hint : *hints) {
    EXPECT_EQ(hint.displayOrder, hint.id == "eh_a" ? 1 : 0);
  }
}

TEST_F(DatabaseTest, AccountsRoundTrip) {
  models::Account account;
  account.id = "acct_1";
  account.provider = models::PROVIDER::PEER_PAYMENT;
  account.displayName = "Venmo";
  account.status = models::ACCOUNT_STATUS::INACTIVE;
  account.lastSyncedAt = 1700000000;
  account.balance = Decimal::fromCents(12345);
  ASSERT_FALSE(repository->saveAccount(account).has_value());

  auto accounts = repository->loadAccounts();
  ASSERT_TRUE(accounts.has_value());
  ASSERT_EQ(accounts->size(), 1u);
  EXPECT_EQ(accounts->front().provider, models::PROVIDER::PEER_PAYMENT);
  EXPECT_EQ(accounts->front().status, models::ACCOUNT_STATUS::INACTIVE);
  EXPECT_EQ(accounts->front().lastSyncedAt, 1700000000);
  EXPECT_EQ(accounts->front().balance, Decimal::fromCents(12345));
}
