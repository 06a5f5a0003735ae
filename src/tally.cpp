#include <algorithm>
#include <exception>
#include <string>

#include <spdlog/spdlog.h>

#include "httplib.h"
#include "nlohmann/json.hpp"

#include "account_store.hpp"
#include "aggregates.hpp"
#include "api.hpp"
#include "config.hpp"
#include "database.hpp"
#include "event_store.hpp"
#include "hint_matcher.hpp"
#include "hint_store.hpp"
#include "ledger.hpp"
#include "orchestrator.hpp"
#include "providers.hpp"

#define PROJECT_NAME "tally"

int
main(int argc, char **argv) {
    std::string configPath = argc > 1 ? argv[1] : "tally.json";

    auto loaded = config::load(configPath);

    if (!loaded) {
      spdlog::critical("{}: {}", PROJECT_NAME, loaded.error().message);
      return 1;
    }

    auto &config = *loaded;

    spdlog::set_level(spdlog::level::from_str(config.logLevel));

    auto repository = database::SqliteRepository::open(config.databasePath);

    if (!repository) {
      spdlog::critical("cannot open {}: {}", config.databasePath, repository.error().message);
      return 1;
    }

    ledger::Ledger ledger{**repository};
    hints::HintStore hintStore{**repository};
    events::EventStore eventStore{**repository, ledger};
    accounts::AccountStore accountStore{**repository};
    aggregates::AggregateCache aggregateCache{**repository};

    for (auto error : {ledger.load(), hintStore.load(), eventStore.load(), accountStore.load()}) {
      if (error) {
        spdlog::critical("cannot load state: {}", error->message);
        return 1;
      }
    }

    for (const auto &account : config.accounts) {
      if (auto stored = accountStore.upsert(account); !stored) {
        spdlog::error("account {} not registered: {}", account.id, stored.error().message);
      }
    }

    if (auto aggregates = aggregateCache.recompute(); !aggregates) {
      spdlog::error("aggregates not computed: {}", aggregates.error().message);
    }

    auto registry = providers::ProviderRegistry::withDefaults(config.providers);

    orchestrator::Orchestrator syncOrchestrator{
      accountStore, registry, ledger, aggregateCache,
      orchestrator::Options{config.syncTimeout, config.syncWorkers}
    };

    hints::HintMatcher matcher{hintStore, ledger};

    api::Api handlers{api::Services{
      ledger, hintStore, matcher, eventStore, accountStore, aggregateCache, syncOrchestrator
    }};

    // HTTP
    httplib::Server svr;

    auto threads = static_cast<std::size_t>(std::max(config.httpThreads, 1));
    svr.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };

    svr.set_logger([](const httplib::Request &req, const httplib::Response &res) {
      spdlog::debug("{} {} -> {}", req.method, req.path, res.status);
    });

    svr.set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
      try {
        std::rethrow_exception(ep);
      } catch (const std::exception &e) {
        spdlog::error("{} {} failed: {}", req.method, req.path, e.what());
      } catch (...) {
        spdlog::error("{} {} failed with a non-standard exception", req.method, req.path);
      }

      res.status = 500;
      res.set_content(nlohmann::json{{"error", "internal error"}}.dump(), "application/json");
    });

    api::registerRoutes(svr, handlers);

    spdlog::info("{} listening on {}:{}", PROJECT_NAME, config.host, config.port);

    if (!svr.listen(config.host, config.port)) {
      spdlog::critical("cannot listen on {}:{}", config.host, config.port);
      return 1;
    }

    return 0;
}
