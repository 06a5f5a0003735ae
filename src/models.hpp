#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "decimal.hpp"

namespace models {
  enum PROVIDER: const unsigned char {
    CARD_AGGREGATOR,
    PEER_PAYMENT,
    EXPENSE_SPLIT
  };

  enum ACCOUNT_STATUS: const unsigned char {
    ACTIVE,
    INACTIVE
  };

  enum SYNC_OUTCOME: const unsigned char {
    OK,
    FAILED
  };

  std::string_view providerKey(PROVIDER provider);
  std::optional<PROVIDER> providerFromKey(std::string_view key);

  std::string_view statusKey(ACCOUNT_STATUS status);
  std::optional<ACCOUNT_STATUS> statusFromKey(std::string_view key);

  // What a provider hands back for one upstream transaction.
  struct NormalizedItem {
    std::string
      externalRef;
    std::int64_t
      date = 0;
    Decimal
      amount;
    std::string
      description;
    std::string
      counterparty;
    std::string
      paymentMethod;
  };

  struct LineItem {
    std::string
      id;
    // Empty provider and externalRef mark a manual entry.
    std::string
      provider;
    std::string
      externalRef;
    std::int64_t
      date = 0;
    Decimal
      amount;
    std::string
      description;
    std::string
      counterparty;
    std::string
      paymentMethod;
    bool
      reviewed = false;
    bool
      selected = false;
    std::optional<std::string>
      eventId;

    bool isManual() const { return externalRef.empty(); }
  };

  struct NewManualItem {
    std::int64_t
      date = 0;
    Decimal
      amount;
    std::string
      description;
    std::string
      counterparty;
    std::string
      paymentMethod = "Cash";
  };

  struct MergeReport {
    int
      inserted = 0;
    int
      updated = 0;
    int
      unchanged = 0;
  };

  struct LineItemFilter {
    bool
      onlyToReview = false;
    std::optional<std::string>
      paymentMethod;
  };

  struct Hint {
    std::string
      id;
    std::string
      name;
    std::string
      expression;
    std::string
      prefillName;
    std::optional<std::string>
      prefillCategoryId;
    int
      displayOrder = 0;
    bool
      active = true;
    int
      expressionVersion = 1;
  };

  struct NewHint {
    std::string
      name;
    std::string
      expression;
    std::string
      prefillName;
    std::optional<std::string>
      prefillCategoryId;
    std::optional<int>
      displayOrder;
    bool
      active = true;
  };

  struct HintPatch {
    std::optional<std::string>
      name;
    std::optional<std::string>
      expression;
    std::optional<std::string>
      prefillName;
    // Engaged outer optional with an empty inner one clears the category.
    std::optional<std::optional<std::string>>
      prefillCategoryId;
    std::optional<int>
      displayOrder;
    std::optional<bool>
      active;
  };

  struct Suggestion {
    std::string
      name;
    std::optional<std::string>
      categoryId;
    std::string
      matchedHintId;
    std::string
      matchedHintName;
  };

  struct Event {
    std::string
      id;
    std::string
      name;
    std::string
      categoryId;
    std::int64_t
      date = 0;
    Decimal
      amount;
    std::vector<std::string>
      lineItemIds;
    bool
      isDuplicateTransaction = false;
  };

  struct NewEvent {
    std::string
      name;
    std::string
      categoryId;
    std::vector<std::string>
      lineItemIds;
    std::optional<std::int64_t>
      date;
    bool
      isDuplicateTransaction = false;
  };

  struct EventList {
    std::vector<Event>
      events;
    Decimal
      total;
  };

  struct Account {
    std::string
      id;
    PROVIDER
      provider = PROVIDER::CARD_AGGREGATOR;
    std::string
      displayName;
    ACCOUNT_STATUS
      status = ACCOUNT_STATUS::ACTIVE;
    std::optional<std::int64_t>
      lastSyncedAt;
    std::optional<Decimal>
      balance;
  };

  struct FetchResult {
    std::vector<NormalizedItem>
      items;
    std::optional<Decimal>
      balance;
  };

  struct SyncResult {
    std::string
      accountId;
    SYNC_OUTCOME
      outcome = SYNC_OUTCOME::OK;
    int
      itemsMerged = 0;
    std::optional<std::string>
      error;
    // Set when the failure was a deadline expiry rather than a provider error.
    bool
      timedOut = false;
    // Set when the request was rejected because the account was already syncing.
    bool
      rejected = false;
  };

  struct MonthlyAmount {
    std::string
      month;
    Decimal
      amount;
  };

  struct AccountBalance {
    std::string
      accountId;
    std::string
      displayName;
    Decimal
      balance;
    std::optional<std::int64_t>
      asOf;
  };

  struct Aggregates {
    std::vector<AccountBalance>
      balances;
    Decimal
      totalBalance;
    // category id -> months in chronological order
    std::vector<std::pair<std::string, std::vector<MonthlyAmount>>>
      monthlyBreakdown;
  };
}
