#include "providers.hpp"

#include <algorithm>
#include <format>

#include <spdlog/spdlog.h>

#include "httplib.h"

#include "dates.hpp"

namespace providers {

namespace {

Error
providerError(std::string message) {
  return makeError(UNEXPECTED_CODE::PROVIDER, std::move(message));
}

Error
stopped() {
  return makeError(UNEXPECTED_CODE::TIMEOUT, "timeout");
}

std::expected<nlohmann::json, Error>
getJson(const Endpoint &endpoint, const std::string &path, const httplib::Params &params,
        const Settings &settings) {
  if(endpoint.baseUrl.empty()) {
    return std::unexpected(providerError(std::format("no base url configured for {}", path)));
  }

  httplib::Client client(endpoint.baseUrl);

  if(!client.is_valid()) {
    return std::unexpected(providerError(std::format("invalid base url {}", endpoint.baseUrl)));
  }

  client.set_connection_timeout(settings.connectTimeoutSeconds, 0);
  client.set_read_timeout(settings.readTimeoutSeconds, 0);

  if(!endpoint.token.empty()) {
    client.set_bearer_token_auth(endpoint.token);
  }

  auto res = client.Get(path, params, httplib::Headers{});

  if(!res) {
    return std::unexpected(providerError(
        std::format("{}{} unreachable: {}", endpoint.baseUrl, path, httplib::to_string(res.error()))));
  }

  if(res->status != 200) {
    return std::unexpected(providerError(
        std::format("{}{} answered {}", endpoint.baseUrl, path, res->status)));
  }

  auto body = nlohmann::json::parse(res->body, nullptr, false);

  if(body.is_discarded()) {
    return std::unexpected(providerError(std::format("{}{} sent malformed JSON", endpoint.baseUrl, path)));
  }

  return body;
}

// Upstream ids arrive as strings or numbers depending on the feed.
std::string
idString(const nlohmann::json &value) {
  if(value.is_string()) {
    return value.get<std::string>();
  }
  if(value.is_number_integer()) {
    return std::to_string(value.get<std::int64_t>());
  }
  return value.get<std::string>();
}

// Optional free text; absent and null both read as empty.
std::string
textField(const nlohmann::json &object, const char *key) {
  auto found = object.find(key);
  if(found == object.end() || !found->is_string()) {
    return "";
  }
  return found->get<std::string>();
}

std::expected<Decimal, Error>
decimalFrom(const nlohmann::json &value) {
  if(value.is_string()) {
    return Decimal::parse(value.get<std::string>());
  }
  if(value.is_number()) {
    return Decimal::fromDouble(value.get<double>());
  }
  return std::unexpected(providerError(std::format("expected an amount, got {}", value.type_name())));
}

bool
ignored(const Settings &settings, const std::string &party) {
  return std::find(settings.ignoredParties.begin(), settings.ignoredParties.end(), party)
         != settings.ignoredParties.end();
}

}

void
ProviderRegistry::add(models::PROVIDER kind, std::unique_ptr<Provider> provider) {
  providers_.insert_or_assign(kind, std::move(provider));
}

Provider *
ProviderRegistry::find(models::PROVIDER kind) const {
  auto found = providers_.find(kind);
  return found == providers_.end() ? nullptr : found->second.get();
}

ProviderRegistry
ProviderRegistry::withDefaults(const Settings &settings) {
  ProviderRegistry registry;
  registry.add(models::PROVIDER::CARD_AGGREGATOR, std::make_unique<CardAggregatorProvider>(settings));
  registry.add(models::PROVIDER::PEER_PAYMENT, std::make_unique<PeerPaymentProvider>(settings));
  registry.add(models::PROVIDER::EXPENSE_SPLIT, std::make_unique<ExpenseSplitProvider>(settings));
  return registry;
}

std::expected<CardPage, Error>
normalizeCardPage(const nlohmann::json &page, const models::Account &account) {
  try {
    CardPage result;

    for(const auto &transaction : page.at("data")) {
      auto id = idString(transaction.at("id"));
      result.lastId = id;

      auto status = transaction.at("status").get<std::string>();
      if(status != "posted") {
        spdlog::debug("{}: skipping {} transaction {}", account.id, status, id);
        continue;
      }

      models::NormalizedItem item;
      item.externalRef = id;
      item.date = transaction.at("transacted_at").get<std::int64_t>();
      // Upstream reports money out as positive cents.
      item.amount = -Decimal::fromCents(transaction.at("amount").get<std::int64_t>());
      item.description = textField(transaction, "description");
      item.counterparty = item.description;
      item.paymentMethod = account.displayName;

      result.items.push_back(std::move(item));
    }

    result.hasMore = page.value("has_more", false);
    return result;
  } catch(const nlohmann::json::exception &e) {
    return std::unexpected(providerError(std::format("card feed for {}: {}", account.id, e.what())));
  }
}

std::expected<std::optional<Decimal>, Error>
normalizeCardBalance(const nlohmann::json &body) {
  try {
    const auto &data = body.at("data");
    if(data.empty()) {
      return std::optional<Decimal>{};
    }
    return std::optional<Decimal>{
      Decimal::fromCents(data.at(0).at("current").at("usd").get<std::int64_t>())
    };
  } catch(const nlohmann::json::exception &e) {
    return std::unexpected(providerError(std::format("card balance: {}", e.what())));
  }
}

std::expected<PeerPaymentPage, Error>
normalizePeerPaymentPage(const nlohmann::json &page, const models::Account &account,
                         const Settings &settings) {
  try {
    PeerPaymentPage result;

    for(const auto &transaction : page.at("data")) {
      auto created = transaction.at("date_created").get<std::int64_t>();

      if(created < settings.cutoff) {
        result.reachedCutoff = true;
        break;
      }

      auto actor = transaction.at("actor").at("first_name").get<std::string>();
      auto target = transaction.at("target").at("first_name").get<std::string>();

      if(ignored(settings, actor) || ignored(settings, target)) {
        continue;
      }

      auto amount = decimalFrom(transaction.at("amount"));
      if(!amount) {
        return std::unexpected(amount.error());
      }

      auto type = transaction.at("payment_type").get<std::string>();

      models::NormalizedItem item;
      item.externalRef = idString(transaction.at("id"));
      item.date = created;
      item.description = textField(transaction, "note");
      item.paymentMethod = account.displayName;

      if(actor == settings.userFirstName && type == "pay") {
        item.counterparty = target;
        item.amount = -amount->abs();
      } else if(target == settings.userFirstName && type == "charge") {
        item.counterparty = actor;
        item.amount = -amount->abs();
      } else {
        item.counterparty = target == settings.userFirstName ? actor : target;
        item.amount = amount->abs();
      }

      result.items.push_back(std::move(item));
    }

    if(auto next = page.find("next"); next != page.end() && next->is_string()) {
      result.next = next->get<std::string>();
    }

    return result;
  } catch(const nlohmann::json::exception &e) {
    return std::unexpected(providerError(std::format("peer payment feed for {}: {}", account.id, e.what())));
  }
}

std::expected<std::vector<models::NormalizedItem>, Error>
normalizeExpenses(const nlohmann::json &body, const models::Account &account,
                  const Settings &settings) {
  try {
    std::vector<models::NormalizedItem> items;

    for(const auto &expense : body.at("expenses")) {
      auto id = idString(expense.at("id"));

      if(auto deleted = expense.find("deleted_at"); deleted != expense.end() && !deleted->is_null()) {
        continue;
      }

      std::string counterparty;
      const nlohmann::json *share = nullptr;

      for(const auto &user : expense.at("users")) {
        auto firstName = user.at("first_name").get<std::string>();
        if(firstName == settings.userFirstName) {
          share = &user;
          continue;
        }
        if(!counterparty.empty()) {
          counterparty += ", ";
        }
        counterparty += firstName;
      }

      if(ignored(settings, counterparty)) {
        continue;
      }

      if(share == nullptr) {
        spdlog::debug("{}: expense {} does not involve {}", account.id, id, settings.userFirstName);
        continue;
      }

      auto amount = decimalFrom(share->at("net_balance"));
      if(!amount) {
        return std::unexpected(amount.error());
      }

      auto dateText = expense.at("date").get<std::string>();
      auto date = dates::parseIso(dateText);
      if(!date) {
        return std::unexpected(providerError(std::format("expense {} has an invalid date '{}'", id, dateText)));
      }

      models::NormalizedItem item;
      item.externalRef = id;
      item.date = *date;
      item.amount = *amount;
      item.description = textField(expense, "description");
      item.counterparty = counterparty;
      item.paymentMethod = account.displayName;

      items.push_back(std::move(item));
    }

    return items;
  } catch(const nlohmann::json::exception &e) {
    return std::unexpected(providerError(std::format("expense feed for {}: {}", account.id, e.what())));
  }
}

CardAggregatorProvider::CardAggregatorProvider(Settings settings): settings_(std::move(settings)) {}

std::expected<models::FetchResult, Error>
CardAggregatorProvider::fetch(const models::Account &account, std::stop_token stop) {
  models::FetchResult result;
  std::string cursor;

  auto path = std::format("/v1/accounts/{}/transactions", account.id);

  while(true) {
    if(stop.stop_requested()) {
      return std::unexpected(stopped());
    }

    httplib::Params params{{"limit", std::to_string(settings_.pageSize)}};
    if(!cursor.empty()) {
      params.emplace("starting_after", cursor);
    }

    auto body = getJson(settings_.cardAggregator, path, params, settings_);
    if(!body) {
      return std::unexpected(body.error());
    }

    auto page = normalizeCardPage(*body, account);
    if(!page) {
      return std::unexpected(page.error());
    }

    std::move(page->items.begin(), page->items.end(), std::back_inserter(result.items));

    if(!page->hasMore || page->lastId.empty()) {
      break;
    }
    cursor = page->lastId;
  }

  if(stop.stop_requested()) {
    return std::unexpected(stopped());
  }

  auto body = getJson(settings_.cardAggregator, std::format("/v1/accounts/{}/balances", account.id),
                      httplib::Params{}, settings_);
  if(!body) {
    return std::unexpected(body.error());
  }

  auto balance = normalizeCardBalance(*body);
  if(!balance) {
    return std::unexpected(balance.error());
  }
  result.balance = *balance;

  return result;
}

PeerPaymentProvider::PeerPaymentProvider(Settings settings): settings_(std::move(settings)) {}

std::expected<models::FetchResult, Error>
PeerPaymentProvider::fetch(const models::Account &account, std::stop_token stop) {
  models::FetchResult result;
  std::optional<std::string> before;

  auto path = std::format("/users/{}/transactions", account.id);

  while(true) {
    if(stop.stop_requested()) {
      return std::unexpected(stopped());
    }

    httplib::Params params{{"limit", std::to_string(settings_.pageSize)}};
    if(before) {
      params.emplace("before", *before);
    }

    auto body = getJson(settings_.peerPayment, path, params, settings_);
    if(!body) {
      return std::unexpected(body.error());
    }

    auto page = normalizePeerPaymentPage(*body, account, settings_);
    if(!page) {
      return std::unexpected(page.error());
    }

    std::move(page->items.begin(), page->items.end(), std::back_inserter(result.items));

    if(page->reachedCutoff || !page->next) {
      break;
    }
    before = page->next;
  }

  return result;
}

ExpenseSplitProvider::ExpenseSplitProvider(Settings settings): settings_(std::move(settings)) {}

std::expected<models::FetchResult, Error>
ExpenseSplitProvider::fetch(const models::Account &account, std::stop_token stop) {
  models::FetchResult result;
  int offset = 0;

  while(true) {
    if(stop.stop_requested()) {
      return std::unexpected(stopped());
    }

    httplib::Params params{
      {"limit", std::to_string(settings_.pageSize)},
      {"offset", std::to_string(offset)},
      {"dated_after", dates::formatDay(settings_.cutoff)}
    };

    auto body = getJson(settings_.expenseSplit, "/api/v3.0/get_expenses", params, settings_);
    if(!body) {
      return std::unexpected(body.error());
    }

    auto items = normalizeExpenses(*body, account, settings_);
    if(!items) {
      return std::unexpected(items.error());
    }

    std::move(items->begin(), items->end(), std::back_inserter(result.items));

    auto received = body->contains("expenses") ? body->at("expenses").size() : 0;
    if(received < static_cast<std::size_t>(settings_.pageSize)) {
      break;
    }
    offset += settings_.pageSize;
  }

  return result;
}

}
