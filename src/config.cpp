#include "config.hpp"

#include <charconv>
#include <cstdlib>
#include <type_traits>
#include <format>
#include <fstream>

#include <spdlog/spdlog.h>

#include "dates.hpp"

namespace config {

namespace {

constexpr std::string_view logLevels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};

Error
invalid(std::string message) {
  return makeError(UNEXPECTED_CODE::VALIDATION, std::move(message));
}

std::optional<Error>
checkLogLevel(const std::string &level) {
  for(auto known : logLevels) {
    if(level == known) {
      return std::nullopt;
    }
  }
  return invalid(std::format("unknown log level '{}'", level));
}

std::expected<std::int64_t, Error>
parseCutoff(const std::string &text) {
  auto parsed = dates::parseIso(text);
  if(!parsed) {
    return std::unexpected(invalid(std::format("cutoff must be YYYY-MM-DD, got '{}'", text)));
  }
  return *parsed;
}

std::expected<int, Error>
parseInt(const std::string &name, const std::string &text) {
  int value = 0;
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if(ec != std::errc{} || end != text.data() + text.size()) {
    return std::unexpected(invalid(std::format("{} must be an integer, got '{}'", name, text)));
  }
  return value;
}

std::vector<std::string>
splitList(const std::string &text) {
  std::vector<std::string> parts;
  std::size_t begin = 0;

  while(begin <= text.size()) {
    auto end = text.find(',', begin);
    if(end == std::string::npos) {
      end = text.size();
    }
    auto part = text.substr(begin, end - begin);
    if(!part.empty()) {
      parts.push_back(part);
    }
    begin = end + 1;
  }
  return parts;
}

void
readEndpoint(const nlohmann::json &node, providers::Endpoint &endpoint) {
  endpoint.baseUrl = node.value("base_url", endpoint.baseUrl);
  endpoint.token = node.value("token", endpoint.token);
}

}

std::optional<std::string>
processEnv(const std::string &name) {
  const char *value = std::getenv(name.c_str());
  if(value == nullptr) {
    return std::nullopt;
  }
  return std::string{value};
}

std::expected<Config, Error>
fromJson(const nlohmann::json &document) {
  Config config;

  if(!document.is_object()) {
    return std::unexpected(invalid("configuration must be a JSON object"));
  }

  try {
    if(auto server = document.find("server"); server != document.end()) {
      config.host = server->value("host", config.host);
      config.port = server->value("port", config.port);
      config.httpThreads = server->value("threads", config.httpThreads);
    }

    config.databasePath = document.value("database", config.databasePath);
    config.logLevel = document.value("log_level", config.logLevel);

    if(auto syncNode = document.find("sync"); syncNode != document.end()) {
      config.syncTimeout = std::chrono::milliseconds{syncNode->value("timeout_ms", config.syncTimeout.count())};
      config.syncWorkers = syncNode->value("workers", config.syncWorkers);
      config.providers.connectTimeoutSeconds = syncNode->value("connect_timeout_s", config.providers.connectTimeoutSeconds);
      config.providers.readTimeoutSeconds = syncNode->value("read_timeout_s", config.providers.readTimeoutSeconds);
      config.providers.pageSize = syncNode->value("page_size", config.providers.pageSize);
    }

    if(auto feeds = document.find("providers"); feeds != document.end()) {
      if(auto node = feeds->find("card_aggregator"); node != feeds->end()) {
        readEndpoint(*node, config.providers.cardAggregator);
      }
      if(auto node = feeds->find("peer_payment"); node != feeds->end()) {
        readEndpoint(*node, config.providers.peerPayment);
      }
      if(auto node = feeds->find("expense_split"); node != feeds->end()) {
        readEndpoint(*node, config.providers.expenseSplit);
      }
    }

    config.providers.userFirstName = document.value("user_first_name", config.providers.userFirstName);
    config.providers.ignoredParties =
        document.value("ignored_parties", config.providers.ignoredParties);

    if(auto cutoff = document.find("cutoff"); cutoff != document.end()) {
      auto parsed = parseCutoff(cutoff->get<std::string>());
      if(!parsed) {
        return std::unexpected(parsed.error());
      }
      config.providers.cutoff = *parsed;
    }

    if(auto accounts = document.find("accounts"); accounts != document.end()) {
      for(const auto &node : *accounts) {
        models::Account account;
        account.id = node.at("id").get<std::string>();
        account.displayName = node.value("display_name", account.id);

        auto providerName = node.at("provider").get<std::string>();
        auto provider = models::providerFromKey(providerName);
        if(!provider) {
          return std::unexpected(invalid(std::format("account {}: unknown provider '{}'", account.id, providerName)));
        }
        account.provider = *provider;

        auto statusName = node.value("status", std::string{models::statusKey(account.status)});
        auto status = models::statusFromKey(statusName);
        if(!status) {
          return std::unexpected(invalid(std::format("account {}: unknown status '{}'", account.id, statusName)));
        }
        account.status = *status;

        config.accounts.push_back(std::move(account));
      }
    }
  } catch(const nlohmann::json::exception &e) {
    return std::unexpected(invalid(std::format("configuration: {}", e.what())));
  }

  if(auto error = checkLogLevel(config.logLevel)) {
    return std::unexpected(*error);
  }

  return config;
}

std::optional<Error>
applyEnvironment(Config &config, const EnvLookup &lookup) {
  auto integer = [&](const std::string &name, auto &target) -> std::optional<Error> {
    if(auto value = lookup(name)) {
      auto parsed = parseInt(name, *value);
      if(!parsed) {
        return parsed.error();
      }
      target = static_cast<std::remove_reference_t<decltype(target)>>(*parsed);
    }
    return std::nullopt;
  };

  auto text = [&](const std::string &name, std::string &target) {
    if(auto value = lookup(name)) {
      target = *value;
    }
  };

  text("TALLY_HOST", config.host);
  text("TALLY_DATABASE", config.databasePath);
  text("TALLY_LOG_LEVEL", config.logLevel);
  text("TALLY_USER_FIRST_NAME", config.providers.userFirstName);
  text("TALLY_CARD_AGGREGATOR_URL", config.providers.cardAggregator.baseUrl);
  text("TALLY_CARD_AGGREGATOR_TOKEN", config.providers.cardAggregator.token);
  text("TALLY_PEER_PAYMENT_URL", config.providers.peerPayment.baseUrl);
  text("TALLY_PEER_PAYMENT_TOKEN", config.providers.peerPayment.token);
  text("TALLY_EXPENSE_SPLIT_URL", config.providers.expenseSplit.baseUrl);
  text("TALLY_EXPENSE_SPLIT_TOKEN", config.providers.expenseSplit.token);

  if(auto error = integer("TALLY_PORT", config.port)) return error;
  if(auto error = integer("TALLY_HTTP_THREADS", config.httpThreads)) return error;
  if(auto error = integer("TALLY_SYNC_WORKERS", config.syncWorkers)) return error;

  int timeoutMs = static_cast<int>(config.syncTimeout.count());
  if(auto error = integer("TALLY_SYNC_TIMEOUT_MS", timeoutMs)) return error;
  config.syncTimeout = std::chrono::milliseconds{timeoutMs};

  if(auto value = lookup("TALLY_IGNORED_PARTIES")) {
    config.providers.ignoredParties = splitList(*value);
  }

  if(auto value = lookup("TALLY_CUTOFF")) {
    auto parsed = parseCutoff(*value);
    if(!parsed) {
      return parsed.error();
    }
    config.providers.cutoff = *parsed;
  }

  return checkLogLevel(config.logLevel);
}

std::expected<Config, Error>
load(const std::string &path, const EnvLookup &lookup) {
  Config config;

  std::ifstream file{path};

  if(file.is_open()) {
    auto document = nlohmann::json::parse(file, nullptr, false);

    if(document.is_discarded()) {
      return std::unexpected(invalid(std::format("{} is not valid JSON", path)));
    }

    auto parsed = fromJson(document);
    if(!parsed) {
      return std::unexpected(parsed.error());
    }
    config = std::move(*parsed);
  } else {
    spdlog::warn("{} not found, using defaults", path);
  }

  if(auto error = applyEnvironment(config, lookup)) {
    return std::unexpected(*error);
  }

  return config;
}

}
