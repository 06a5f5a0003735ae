#pragma once

#include <cstdint>
#include <expected>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "models.hpp"
#include "repository.hpp"
#include "unexpected_codes.hpp"

namespace accounts {

class AccountStore {
public:
  explicit AccountStore(Repository &repository);

  AccountStore(const AccountStore &) = delete;
  AccountStore &operator=(const AccountStore &) = delete;

  std::optional<Error>
  load();

  // Registers a new account or renames an existing one. Sync state of an
  // existing account is kept.
  std::expected<models::Account, Error>
  upsert(const models::Account &account);

  std::expected<models::Account, Error>
  get(const std::string &id) const;

  std::vector<models::Account>
  list() const;

  std::optional<Error>
  recordSync(const std::string &id, std::int64_t when, std::optional<Decimal> balance);

  std::expected<models::Account, Error>
  setStatus(const std::string &id, models::ACCOUNT_STATUS status);

private:
  Repository
    &repository_;
  mutable std::mutex
    mutex_;
  std::map<std::string, models::Account>
    accounts_;

  std::optional<Error>
  store(const models::Account &account);
};

}
