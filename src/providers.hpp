#pragma once

#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "models.hpp"
#include "unexpected_codes.hpp"

namespace providers {

struct Endpoint {
  std::string
    baseUrl;
  std::string
    token;
};

struct Settings {
  Endpoint
    cardAggregator;
  Endpoint
    peerPayment;
  Endpoint
    expenseSplit;
  // How the user appears in peer-payment and expense-split feeds.
  std::string
    userFirstName;
  std::vector<std::string>
    ignoredParties;
  // Peer-payment and expense-split history older than this is not fetched.
  std::int64_t
    cutoff = 0;
  int
    connectTimeoutSeconds = 5;
  int
    readTimeoutSeconds = 10;
  int
    pageSize = 100;
};

class Provider {
public:
  virtual ~Provider() = default;

  // Checks the stop token between requests and gives up with TIMEOUT once
  // a stop has been requested.
  virtual std::expected<models::FetchResult, Error>
  fetch(const models::Account &account, std::stop_token stop) = 0;
};

class ProviderRegistry {
public:
  void
  add(models::PROVIDER kind, std::unique_ptr<Provider> provider);

  Provider *
  find(models::PROVIDER kind) const;

  std::size_t size() const { return providers_.size(); }

  static ProviderRegistry
  withDefaults(const Settings &settings);

private:
  std::map<models::PROVIDER, std::unique_ptr<Provider>>
    providers_;
};

// Feed normalization, independent of HTTP.

struct CardPage {
  std::vector<models::NormalizedItem>
    items;
  bool
    hasMore = false;
  // Cursor for the next page: the id of the last transaction on this one.
  std::string
    lastId;
};

std::expected<CardPage, Error>
normalizeCardPage(const nlohmann::json &page, const models::Account &account);

std::expected<std::optional<Decimal>, Error>
normalizeCardBalance(const nlohmann::json &body);

struct PeerPaymentPage {
  std::vector<models::NormalizedItem>
    items;
  // Set once a transaction older than the cutoff was seen; the feed is newest first.
  bool
    reachedCutoff = false;
  std::optional<std::string>
    next;
};

std::expected<PeerPaymentPage, Error>
normalizePeerPaymentPage(const nlohmann::json &page, const models::Account &account,
                         const Settings &settings);

std::expected<std::vector<models::NormalizedItem>, Error>
normalizeExpenses(const nlohmann::json &body, const models::Account &account,
                  const Settings &settings);

class CardAggregatorProvider: public Provider {
public:
  explicit CardAggregatorProvider(Settings settings);

  std::expected<models::FetchResult, Error>
  fetch(const models::Account &account, std::stop_token stop) override;

private:
  Settings
    settings_;
};

class PeerPaymentProvider: public Provider {
public:
  explicit PeerPaymentProvider(Settings settings);

  std::expected<models::FetchResult, Error>
  fetch(const models::Account &account, std::stop_token stop) override;

private:
  Settings
    settings_;
};

class ExpenseSplitProvider: public Provider {
public:
  explicit ExpenseSplitProvider(Settings settings);

  std::expected<models::FetchResult, Error>
  fetch(const models::Account &account, std::stop_token stop) override;

private:
  Settings
    settings_;
};

}
