#include <gtest/gtest.h>

#include "event_store.hpp"
#include "ledger.hpp"
#include "test_support.hpp"

using testing_support::normalized;

class EventStoreTest: public ::testing::Test {
protected:
  std::unique_ptr<database::SqliteRepository> storage = testing_support::memoryRepository();
  testing_support::FlakyRepository repository{*storage};
  ledger::Ledger ledger{repository};
  events::EventStore events{repository, ledger};

  std::vector<std::string> ids;

  void SetUp() override {
    auto report = ledger.merge("card_aggregator", {
      normalized("tx1", 1700000000, Decimal::fromCents(-1250), "Dinner", "Luigi"),
      normalized("tx2", 1699000000, Decimal::fromCents(-1250), "Dinner (pending copy)", "Luigi"),
      normalized("tx3", 1701000000, Decimal::fromUnits(-40), "Groceries", "Market")
    });
    ASSERT_TRUE(report.has_value());

    for(const auto &ref : {"tx1", "tx2", "tx3"}) {
      for(const auto &item : ledger.list({})) {
        if(item.externalRef == ref) {
          ids.push_back(item.id);
        }
      }
    }
    ASSERT_EQ(ids.size(), 3u);
  }

  models::NewEvent
  newEvent(std::vector<std::string> lineItemIds, std::string name = "Dinner") {
    models::NewEvent request;
    request.name = std::move(name);
    request.categoryId = "dining";
    request.lineItemIds = std::move(lineItemIds);
    return request;
  }
};

TEST_F(EventStoreTest, CreateDerivesAmountAndDate) {
  auto event = events.create(newEvent({ids[0], ids[2]}));
  ASSERT_TRUE(event.has_value());

  EXPECT_EQ(event->id.rfind("evt_", 0), 0u);
  EXPECT_EQ(event->amount, Decimal::fromCents(-5250));
  EXPECT_EQ(event->date, 1700000000);
  EXPECT_EQ(ledger.listUnreviewed().size(), 1u);
  EXPECT_TRUE(ledger.get(ids[0])->reviewed);
}

TEST_F(EventStoreTest, DuplicateTransactionCountsOnce) {
  auto request = newEvent({ids[0], ids[1]});
  request.isDuplicateTransaction = true;
  request.date = 1650000000;

  auto event = events.create(request);
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->amount, Decimal::fromCents(-1250));
  EXPECT_EQ(event->date, 1650000000);
}

TEST_F(EventStoreTest, LineItemBelongsToOneEventOnly) {
  auto first = events.create(newEvent({ids[0], ids[1]}));
  ASSERT_TRUE(first.has_value());

  auto second = events.create(newEvent({ids[2], ids[0]}, "Second"));
  ASSERT_FALSE(second.has_value());
  EXPECT_EQ(second.error().code, UNEXPECTED_CODE::CONFLICT);

  EXPECT_EQ(ledger.get(ids[0])->eventId, first->id);
  EXPECT_FALSE(ledger.get(ids[2])->eventId.has_value());
  EXPECT_EQ(events.list(std::nullopt, std::nullopt).events.size(), 1u);
}

TEST_F(EventStoreTest, RejectsBadRequests) {
  EXPECT_EQ(events.create(newEvent({})).error().code, UNEXPECTED_CODE::VALIDATION);
  EXPECT_EQ(events.create(newEvent({ids[0], ids[0]})).error().code, UNEXPECTED_CODE::VALIDATION);
  EXPECT_EQ(events.create(newEvent({ids[0]}, " ")).error().code, UNEXPECTED_CODE::VALIDATION);
  EXPECT_EQ(events.create(newEvent({ids[0], "li_ghost"})).error().code, UNEXPECTED_CODE::PARTIAL_NOT_FOUND);
  EXPECT_EQ(ledger.listUnreviewed().size(), 3u);
}

TEST_F(EventStoreTest, DeleteReturnsExactlyItsItems) {
  ASSERT_TRUE(ledger.toggleSelect(ids[0]).has_value());
  auto event = events.create(newEvent({ids[0], ids[1]}));
  ASSERT_TRUE(event.has_value());
  auto other = events.create(newEvent({ids[2]}, "Groceries"));
  ASSERT_TRUE(other.has_value());
  ASSERT_TRUE(ledger.listUnreviewed().empty());

  ASSERT_FALSE(events.remove(event->id).has_value());

  auto unreviewed = ledger.listUnreviewed();
  ASSERT_EQ(unreviewed.size(), 2u);
  for(const auto &item : unreviewed) {
    EXPECT_TRUE(item.id == ids[0] || item.id == ids[1]);
    EXPECT_FALSE(item.selected);
    EXPECT_FALSE(item.reviewed);
  }

  EXPECT_EQ(events.get(event->id).error().code, UNEXPECTED_CODE::NOT_FOUND);
  EXPECT_EQ(events.remove(event->id)->code, UNEXPECTED_CODE::NOT_FOUND);
}

TEST_F(EventStoreTest, StorageFailureReleasesTheItems) {
  repository.failEvents = true;

  auto event = events.create(newEvent({ids[0], ids[1]}));
  ASSERT_FALSE(event.has_value());
  EXPECT_EQ(event.error().code, UNEXPECTED_CODE::UNKNOWN);
  EXPECT_EQ(ledger.listUnreviewed().size(), 3u);
}

TEST_F(EventStoreTest, ListsByDateRangeWithTotal) {
  ASSERT_TRUE(events.create(newEvent({ids[0]})).has_value());
  ASSERT_TRUE(events.create(newEvent({ids[1]})).has_value());
  ASSERT_TRUE(events.create(newEvent({ids[2]})).has_value());

  auto all = events.list(std::nullopt, std::nullopt);
  ASSERT_EQ(all.events.size(), 3u);
  EXPECT_EQ(all.events.front().date, 1701000000);
  EXPECT_EQ(all.total, Decimal::fromCents(-6500));

  auto window = events.list(1699500000, 1700000000);
  ASSERT_EQ(window.events.size(), 1u);
  EXPECT_EQ(window.total, Decimal::fromCents(-1250));
}

TEST_F(EventStoreTest, LineItemsForAnEvent) {
  auto event = events.create(newEvent({ids[2], ids[0]}));
  ASSERT_TRUE(event.has_value());

  auto items = events.lineItemsFor(event->id);
  ASSERT_TRUE(items.has_value());
  ASSERT_EQ(items->size(), 2u);
  EXPECT_EQ((*items)[0].id, ids[2]);
  EXPECT_EQ((*items)[1].id, ids[0]);
}

TEST_F(EventStoreTest, ReloadRestoresEventsAndClaims) {
  auto event = events.create(newEvent({ids[0], ids[1]}));
  ASSERT_TRUE(event.has_value());

  ledger::Ledger reloadedLedger{repository};
  events::EventStore reloaded{repository, reloadedLedger};
  ASSERT_FALSE(reloadedLedger.load().has_value());
  ASSERT_FALSE(reloaded.load().has_value());

  auto restored = reloaded.get(event->id);
  ASSERT_TRUE(restored.has_value());
  EXPECT_EQ(restored->lineItemIds, event->lineItemIds);
  EXPECT_EQ(restored->amount, event->amount);
  EXPECT_EQ(reloadedLedger.listUnreviewed().size(), 1u);
  EXPECT_EQ(reloadedLedger.get(ids[0])->eventId, event->id);
}
