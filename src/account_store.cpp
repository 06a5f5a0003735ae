#include "account_store.hpp"

#include <format>

#include <spdlog/spdlog.h>

namespace accounts {

AccountStore::AccountStore(Repository &repository): repository_(repository) {}

std::optional<Error>
AccountStore::load() {
  auto stored = repository_.loadAccounts();
  if(!stored) {
    return stored.error();
  }

  std::lock_guard lock{mutex_};

  accounts_.clear();
  for(auto &account : *stored) {
    accounts_.emplace(account.id, std::move(account));
  }

  spdlog::info("loaded {} accounts", accounts_.size());
  return std::nullopt;
}

std::optional<Error>
AccountStore::store(const models::Account &account) {
  if(auto error = repository_.saveAccount(account)) {
    return error;
  }
  accounts_.insert_or_assign(account.id, account);
  return std::nullopt;
}

std::expected<models::Account, Error>
AccountStore::upsert(const models::Account &account) {
  if(account.id.empty()) {
    return std::unexpected(makeError(UNEXPECTED_CODE::VALIDATION, "Missing required field: id"));
  }
  if(account.displayName.empty()) {
    return std::unexpected(makeError(UNEXPECTED_CODE::VALIDATION,
                                     "Missing required field: display_name"));
  }

  std::lock_guard lock{mutex_};

  models::Account updated = account;

  if(auto found = accounts_.find(account.id); found != accounts_.end()) {
    if(found->second.provider != account.provider) {
      return std::unexpected(makeError(UNEXPECTED_CODE::CONFLICT,
          std::format("Account {} is already registered for {}",
                      account.id, models::providerKey(found->second.provider))));
    }
    updated.lastSyncedAt = found->second.lastSyncedAt;
    updated.balance = found->second.balance;
  }

  if(auto error = store(updated)) {
    return std::unexpected(*error);
  }

  spdlog::info("registered {} account {} '{}'",
               models::providerKey(updated.provider), updated.id, updated.displayName);
  return updated;
}

std::expected<models::Account, Error>
AccountStore::get(const std::string &id) const {
  std::lock_guard lock{mutex_};

  auto found = accounts_.find(id);
  if(found == accounts_.end()) {
    return std::unexpected(makeError(UNEXPECTED_CODE::NOT_FOUND,
                                     std::format("Account not found: {}", id)));
  }
  return found->second;
}

std::vector<models::Account>
AccountStore::list() const {
  std::lock_guard lock{mutex_};

  std::vector<models::Account> result;
  result.reserve(accounts_.size());
  for(const auto &[id, account] : accounts_) {
    result.push_back(account);
  }
  return result;
}

std::optional<Error>
AccountStore::recordSync(const std::string &id, std::int64_t when, std::optional<Decimal> balance) {
  std::lock_guard lock{mutex_};

  auto found = accounts_.find(id);
  if(found == accounts_.end()) {
    return makeError(UNEXPECTED_CODE::NOT_FOUND, std::format("Account not found: {}", id));
  }

  models::Account updated = found->second;
  updated.lastSyncedAt = when;
  if(balance) {
    updated.balance = balance;
  }

  return store(updated);
}

std::expected<models::Account, Error>
AccountStore::setStatus(const std::string &id, models::ACCOUNT_STATUS status) {
  std::lock_guard lock{mutex_};

  auto found = accounts_.find(id);
  if(found == accounts_.end()) {
    return std::unexpected(makeError(UNEXPECTED_CODE::NOT_FOUND,
                                     std::format("Account not found: {}", id)));
  }

  models::Account updated = found->second;
  updated.status = status;

  if(auto error = store(updated)) {
    return std::unexpected(*error);
  }

  spdlog::info("account {} is now {}", id, models::statusKey(status));
  return updated;
}

}
