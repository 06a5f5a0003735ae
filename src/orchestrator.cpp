#include "orchestrator.hpp"

#include <algorithm>
#include <format>

#include <spdlog/spdlog.h>

#include "httplib.h"

namespace orchestrator {

namespace {

models::SyncResult
failed(const std::string &accountId, std::string message) {
  models::SyncResult result;
  result.accountId = accountId;
  result.outcome = models::SYNC_OUTCOME::FAILED;
  result.error = std::move(message);
  return result;
}

}

Orchestrator::Orchestrator(accounts::AccountStore &accounts, const providers::ProviderRegistry &registry,
                           ledger::Ledger &ledger, aggregates::AggregateCache &aggregates, Options options)
  : accounts_(accounts), registry_(registry), ledger_(ledger), aggregates_(aggregates), options_(options) {
  auto workers = options_.workers != 0 ? options_.workers : std::max<std::size_t>(registry_.size(), 1);
  pool_ = std::make_unique<httplib::ThreadPool>(workers);

  spdlog::info("sync pool started with {} workers, {} ms deadline", workers, options_.timeout.count());
}

Orchestrator::~Orchestrator() {
  pool_->shutdown();
}

std::shared_ptr<Orchestrator::SyncJob>
Orchestrator::start(const models::Account &account) {
  {
    std::lock_guard lock{inFlightMutex_};
    if(!inFlight_.insert(account.id).second) {
      return nullptr;
    }
  }

  auto job = std::make_shared<SyncJob>();

  pool_->enqueue([this, job, account]() { run(job, account); });

  return job;
}

void
Orchestrator::run(const std::shared_ptr<SyncJob> &job, const models::Account &account) {
  std::expected<models::FetchResult, Error> fetched = std::unexpected(
      makeError(UNEXPECTED_CODE::PROVIDER,
                std::format("no provider registered for {}", models::providerKey(account.provider))));

  if(job->stop.stop_requested()) {
    fetched = std::unexpected(makeError(UNEXPECTED_CODE::TIMEOUT, "timeout"));
  } else if(auto *provider = registry_.find(account.provider)) {
    fetched = provider->fetch(account, job->stop.get_token());
  }

  {
    std::lock_guard lock{job->mutex};

    if(job->cancelled) {
      spdlog::warn("{}: discarding result that arrived after the deadline", account.id);
    } else {
      job->result = complete(account, std::move(fetched));
    }

    {
      std::lock_guard inFlightLock{inFlightMutex_};
      inFlight_.erase(account.id);
    }

    job->done = true;
  }

  job->cv.notify_all();
}

models::SyncResult
Orchestrator::complete(const models::Account &account, std::expected<models::FetchResult, Error> fetched) {
  if(!fetched) {
    spdlog::warn("{}: fetch failed: {}", account.id, fetched.error().message);
    auto result = failed(account.id, fetched.error().message);
    result.timedOut = fetched.error().code == UNEXPECTED_CODE::TIMEOUT;
    return result;
  }

  auto report = ledger_.merge(std::string{models::providerKey(account.provider)}, fetched->items);

  if(!report) {
    spdlog::error("{}: merge failed: {}", account.id, report.error().message);
    return failed(account.id, report.error().message);
  }

  models::SyncResult result;
  result.accountId = account.id;
  result.outcome = models::SYNC_OUTCOME::OK;
  result.itemsMerged = report->inserted + report->updated;

  auto now = std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();

  if(auto error = accounts_.recordSync(account.id, now, fetched->balance)) {
    spdlog::error("{}: could not record sync: {}", account.id, error->message);
  }

  if(auto aggregates = aggregates_.recompute(); !aggregates) {
    spdlog::error("{}: aggregates not recomputed: {}", account.id, aggregates.error().message);
  }

  spdlog::info("{}: synced, {} inserted, {} updated, {} unchanged",
               account.id, report->inserted, report->updated, report->unchanged);
  return result;
}

models::SyncResult
Orchestrator::wait(const std::shared_ptr<SyncJob> &job, const std::string &accountId, Deadline deadline) {
  if(!job) {
    spdlog::warn("{}: sync already in progress", accountId);
    auto result = failed(accountId, "sync already in progress");
    result.rejected = true;
    return result;
  }

  std::unique_lock lock{job->mutex};

  if(!job->cv.wait_until(lock, deadline, [&]() { return job->done; })) {
    job->cancelled = true;
    job->stop.request_stop();

    spdlog::warn("{}: sync deadline expired", accountId);
    auto result = failed(accountId, "timeout");
    result.timedOut = true;
    return result;
  }

  return job->result;
}

std::vector<models::SyncResult>
Orchestrator::refreshAll(const std::vector<models::Account> &accounts) {
  auto deadline = std::chrono::steady_clock::now() + options_.timeout;

  std::vector<std::pair<std::string, std::shared_ptr<SyncJob>>> jobs;

  for(const auto &account : accounts) {
    if(account.status != models::ACCOUNT_STATUS::ACTIVE) {
      spdlog::debug("{}: inactive, not refreshed", account.id);
      continue;
    }
    jobs.emplace_back(account.id, start(account));
  }

  std::vector<models::SyncResult> results;
  results.reserve(jobs.size());

  for(const auto &[accountId, job] : jobs) {
    results.push_back(wait(job, accountId, deadline));
  }

  auto failures = std::count_if(results.begin(), results.end(), [](const models::SyncResult &result) {
    return result.outcome != models::SYNC_OUTCOME::OK;
  });
  spdlog::info("refreshed {} accounts, {} failed", results.size(), failures);

  return results;
}

std::vector<models::SyncResult>
Orchestrator::refreshAll() {
  return refreshAll(accounts_.list());
}

std::expected<models::SyncResult, Error>
Orchestrator::refreshOne(const std::string &accountId) {
  auto account = accounts_.get(accountId);
  if(!account) {
    return std::unexpected(account.error());
  }

  auto deadline = std::chrono::steady_clock::now() + options_.timeout;
  return wait(start(*account), accountId, deadline);
}

}
