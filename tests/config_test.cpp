#include <gtest/gtest.h>

#include <map>

#include "config.hpp"

namespace {

config::EnvLookup
environment(std::map<std::string, std::string> values) {
  return [values = std::move(values)](const std::string &name) -> std::optional<std::string> {
    auto found = values.find(name);
    if(found == values.end()) {
      return std::nullopt;
    }
    return found->second;
  };
}

}

TEST(Config, EmptyDocumentKeepsDefaults) {
  auto parsed = config::fromJson(nlohmann::json::object());
  ASSERT_TRUE(parsed.has_value());

  EXPECT_EQ(parsed->host, "0.0.0.0");
  EXPECT_EQ(parsed->port, 8080);
  EXPECT_EQ(parsed->databasePath, "tally.db");
  EXPECT_EQ(parsed->syncTimeout, std::chrono::milliseconds{30000});
  EXPECT_EQ(parsed->providers.pageSize, 100);
  EXPECT_TRUE(parsed->accounts.empty());
}

TEST(Config, ReadsEverySection) {
  auto document = nlohmann::json::parse(R"({
    "server": {"host": "127.0.0.1", "port": 9000, "threads": 2},
    "database": "/tmp/ledger.db",
    "log_level": "debug",
    "sync": {"timeout_ms": 1500, "workers": 3, "page_size": 25},
    "providers": {
      "card_aggregator": {"base_url": "http://cards:8000", "token": "secret"}
    },
    "user_first_name": "Sam",
    "ignored_parties": ["Landlord"],
    "cutoff": "2023-01-01",
    "accounts": [
      {"id": "acc_1", "provider": "card_aggregator", "display_name": "Visa"},
      {"id": "venmo", "provider": "peer_payment", "status": "inactive"}
    ]
  })");

  auto parsed = config::fromJson(document);
  ASSERT_TRUE(parsed.has_value()) << parsed.error().message;

  EXPECT_EQ(parsed->host, "127.0.0.1");
  EXPECT_EQ(parsed->port, 9000);
  EXPECT_EQ(parsed->httpThreads, 2);
  EXPECT_EQ(parsed->databasePath, "/tmp/ledger.db");
  EXPECT_EQ(parsed->logLevel, "debug");
  EXPECT_EQ(parsed->syncTimeout, std::chrono::milliseconds{1500});
  EXPECT_EQ(parsed->syncWorkers, 3u);
  EXPECT_EQ(parsed->providers.pageSize, 25);
  EXPECT_EQ(parsed->providers.cardAggregator.baseUrl, "http://cards:8000");
  EXPECT_EQ(parsed->providers.cardAggregator.token, "secret");
  EXPECT_EQ(parsed->providers.userFirstName, "Sam");
  EXPECT_EQ(parsed->providers.ignoredParties, std::vector<std::string>{"Landlord"});
  EXPECT_EQ(parsed->providers.cutoff, 1672531200);

  ASSERT_EQ(parsed->accounts.size(), 2u);
  EXPECT_EQ(parsed->accounts[0].displayName, "Visa");
  EXPECT_EQ(parsed->accounts[1].provider, models::PROVIDER::PEER_PAYMENT);
  EXPECT_EQ(parsed->accounts[1].displayName, "venmo");
  EXPECT_EQ(parsed->accounts[1].status, models::ACCOUNT_STATUS::INACTIVE);
}

TEST(Config, RejectsBadValues) {
  EXPECT_FALSE(config::fromJson(nlohmann::json::array()).has_value());
  EXPECT_FALSE(config::fromJson({{"log_level", "loud"}}).has_value());
  EXPECT_FALSE(config::fromJson({{"cutoff", "last year"}}).has_value());
  EXPECT_FALSE(config::fromJson({{"server", {{"port", "eighty"}}}}).has_value());

  auto badProvider = nlohmann::json::parse(R"({"accounts": [{"id": "x", "provider": "bank"}]})");
  auto parsed = config::fromJson(badProvider);
  ASSERT_FALSE(parsed.has_value());
  EXPECT_EQ(parsed.error().code, UNEXPECTED_CODE::VALIDATION);
}

TEST(Config, EnvironmentOverridesFile) {
  config::Config config;
  config.port = 9000;

  auto error = config::applyEnvironment(config, environment({
    {"TALLY_PORT", "7000"},
    {"TALLY_DATABASE", "/data/tally.db"},
    {"TALLY_SYNC_TIMEOUT_MS", "250"},
    {"TALLY_IGNORED_PARTIES", "Landlord,,Gym"},
    {"TALLY_PEER_PAYMENT_TOKEN", "abc"},
    {"TALLY_CUTOFF", "2024-02-29"}
  }));

  ASSERT_FALSE(error.has_value());
  EXPECT_EQ(config.port, 7000);
  EXPECT_EQ(config.databasePath, "/data/tally.db");
  EXPECT_EQ(config.syncTimeout, std::chrono::milliseconds{250});
  EXPECT_EQ(config.providers.ignoredParties, (std::vector<std::string>{"Landlord", "Gym"}));
  EXPECT_EQ(config.providers.peerPayment.token, "abc");
  EXPECT_EQ(config.providers.cutoff, 1709164800);
}

TEST(Config, RejectsMalformedEnvironment) {
  config::Config config;

  EXPECT_TRUE(config::applyEnvironment(config, environment({{"TALLY_PORT", "80a"}})).has_value());
  EXPECT_TRUE(config::applyEnvironment(config, environment({{"TALLY_LOG_LEVEL", "chatty"}})).has_value());
  EXPECT_TRUE(config::applyEnvironment(config, environment({{"TALLY_CUTOFF", "2023-02-30"}})).has_value());
}

TEST(Config, MissingFileFallsBackToDefaults) {
  auto loaded = config::load("/nonexistent/tally.json", environment({{"TALLY_HOST", "localhost"}}));
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->host, "localhost");
  EXPECT_EQ(loaded->port, 8080);
}
