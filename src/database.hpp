#pragma once

#include <cstdint>
#include <memory>
#include <expected>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "models.hpp"
#include "repository.hpp"
#include "unexpected_codes.hpp"

struct sqlite3;

namespace database {

struct Connection;

//Database specific
void run_stmt(Connection*, const char *);

// Bind failures latch in the connection and surface through its status.
void
bind(Connection* connection, int index, std::string_view value);

void
bind(Connection* connection, int index, std::int64_t value);

void
bind(Connection* connection, int index, const std::optional<std::string> &value);

class SqliteRepository: public Repository {
public:
  // path may be ":memory:".
  static std::expected<std::unique_ptr<SqliteRepository>, Error>
  open(const std::string &path);

  ~SqliteRepository() override;

  SqliteRepository(const SqliteRepository &) = delete;
  SqliteRepository &operator=(const SqliteRepository &) = delete;

  //Model operations

  std::expected<std::vector<models::LineItem>, Error>
  loadLineItems() override;

  std::optional<Error>
  saveLineItems(const std::vector<models::LineItem> &items) override;

  std::optional<Error>
  deleteLineItem(const std::string &id) override;

  std::expected<std::vector<models::Hint>, Error>
  loadHints() override;

  std::optional<Error>
  saveHint(const models::Hint &hint) override;

  std::optional<Error>
  saveHintOrder(const std::vector<models::Hint> &hints) override;

  std::optional<Error>
  deleteHint(const std::string &id) override;

  std::expected<std::vector<models::Event>, Error>
  loadEvents() override;

  std::optional<Error>
  saveEvent(const models::Event &event) override;

  std::optional<Error>
  deleteEvent(const std::string &id) override;

  std::expected<std::vector<models::Account>, Error>
  loadAccounts() override;

  std::optional<Error>
  saveAccount(const models::Account &account) override;

private:
  explicit SqliteRepository(sqlite3 *db);

  std::unique_ptr<Connection, void(*)(Connection*)>
  getConnection(bool transactional);

  sqlite3
    *db_;
  std::mutex
    mutex_;
};

}
