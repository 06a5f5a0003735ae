#pragma once

#include <chrono>
#include <condition_variable>
#include <expected>
#include <memory>
#include <mutex>
#include <set>
#include <stop_token>
#include <string>
#include <vector>

#include "account_store.hpp"
#include "aggregates.hpp"
#include "ledger.hpp"
#include "models.hpp"
#include "providers.hpp"
#include "unexpected_codes.hpp"

namespace httplib {
class ThreadPool;
}

namespace orchestrator {

struct Options {
  std::chrono::milliseconds
    timeout{30000};
  // 0 means one worker per registered provider kind.
  std::size_t
    workers = 0;
};

// Fans account refreshes out over a bounded pool. Each account is synced by at
// most one task at a time, and a result that arrives after its deadline is
// dropped without touching the ledger.
class Orchestrator {
public:
  Orchestrator(accounts::AccountStore &accounts, const providers::ProviderRegistry &registry,
               ledger::Ledger &ledger, aggregates::AggregateCache &aggregates, Options options);

  ~Orchestrator();

  Orchestrator(const Orchestrator &) = delete;
  Orchestrator &operator=(const Orchestrator &) = delete;

  // One result per active account, in the given order. Inactive accounts are skipped.
  std::vector<models::SyncResult>
  refreshAll(const std::vector<models::Account> &accounts);

  std::vector<models::SyncResult>
  refreshAll();

  // Works for inactive accounts too.
  std::expected<models::SyncResult, Error>
  refreshOne(const std::string &accountId);

private:
  struct SyncJob {
    std::mutex
      mutex;
    std::condition_variable
      cv;
    bool
      done = false;
    bool
      cancelled = false;
    std::stop_source
      stop;
    models::SyncResult
      result;
  };

  using Deadline = std::chrono::steady_clock::time_point;

  accounts::AccountStore
    &accounts_;
  const providers::ProviderRegistry
    &registry_;
  ledger::Ledger
    &ledger_;
  aggregates::AggregateCache
    &aggregates_;
  Options
    options_;
  std::mutex
    inFlightMutex_;
  std::set<std::string>
    inFlight_;
  std::unique_ptr<httplib::ThreadPool>
    pool_;

  // Null when the account is already being synced.
  std::shared_ptr<SyncJob>
  start(const models::Account &account);

  models::SyncResult
  wait(const std::shared_ptr<SyncJob> &job, const std::string &accountId, Deadline deadline);

  void
  run(const std::shared_ptr<SyncJob> &job, const models::Account &account);

  models::SyncResult
  complete(const models::Account &account, std::expected<models::FetchResult, Error> fetched);
};

}
