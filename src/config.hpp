#pragma once

#include <chrono>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "models.hpp"
#include "providers.hpp"
#include "unexpected_codes.hpp"

namespace config {

struct Config {
  std::string
    host = "0.0.0.0";
  int
    port = 8080;
  int
    httpThreads = 4;
  std::string
    databasePath = "tally.db";
  std::string
    logLevel = "info";
  std::chrono::milliseconds
    syncTimeout{30000};
  std::size_t
    syncWorkers = 0;
  providers::Settings
    providers;
  // Registered (or updated) at startup.
  std::vector<models::Account>
    accounts;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;

std::optional<std::string>
processEnv(const std::string &name);

// Every key is optional; missing keys keep their defaults.
std::expected<Config, Error>
fromJson(const nlohmann::json &document);

// TALLY_* variables override whatever the file said.
std::optional<Error>
applyEnvironment(Config &config, const EnvLookup &lookup);

// A missing file is not an error: defaults and the environment still apply.
std::expected<Config, Error>
load(const std::string &path, const EnvLookup &lookup = processEnv);

}
