#include "database.hpp"
#include "sqlite3.h"

#include <format>
#include <map>

#include <spdlog/spdlog.h>

namespace database {

namespace {

constexpr auto schema = R"(
  CREATE TABLE IF NOT EXISTS line_items (
    id             TEXT PRIMARY KEY,
    provider       TEXT NOT NULL DEFAULT '',
    external_ref   TEXT NOT NULL DEFAULT '',
    date           INTEGER NOT NULL,
    amount_cents   INTEGER NOT NULL,
    description    TEXT NOT NULL DEFAULT '',
    counterparty   TEXT NOT NULL DEFAULT '',
    payment_method TEXT NOT NULL DEFAULT ''
  );

  CREATE UNIQUE INDEX IF NOT EXISTS line_items_provider_external_ref
    ON line_items(provider, external_ref) WHERE external_ref <> '';

  CREATE TABLE IF NOT EXISTS event_hints (
    id                  TEXT PRIMARY KEY,
    name                TEXT NOT NULL,
    cel_expression      TEXT NOT NULL,
    prefill_name        TEXT NOT NULL,
    prefill_category_id TEXT,
    display_order       INTEGER NOT NULL,
    is_active           INTEGER NOT NULL DEFAULT 1,
    expression_version  INTEGER NOT NULL DEFAULT 1
  );

  CREATE UNIQUE INDEX IF NOT EXISTS event_hints_active_display_order
    ON event_hints(display_order) WHERE is_active = 1;

  CREATE TABLE IF NOT EXISTS events (
    id                       TEXT PRIMARY KEY,
    name                     TEXT NOT NULL,
    category_id              TEXT NOT NULL DEFAULT '',
    date                     INTEGER NOT NULL,
    amount_cents             INTEGER NOT NULL,
    is_duplicate_transaction INTEGER NOT NULL DEFAULT 0
  );

  CREATE TABLE IF NOT EXISTS event_line_items (
    event_id     TEXT NOT NULL REFERENCES events(id) ON DELETE CASCADE,
    line_item_id TEXT NOT NULL UNIQUE REFERENCES line_items(id),
    position     INTEGER NOT NULL,
    PRIMARY KEY (event_id, line_item_id)
  );

  CREATE TABLE IF NOT EXISTS accounts (
    id             TEXT PRIMARY KEY,
    provider       TEXT NOT NULL,
    display_name   TEXT NOT NULL DEFAULT '',
    status         TEXT NOT NULL DEFAULT 'active',
    last_synced_at INTEGER,
    balance_cents  INTEGER
  );
)";

std::string
columnText(sqlite3_stmt *stmt, int column) {
  const auto *text = sqlite3_column_text(stmt, column);
  if(text == nullptr) {
    return {};
  }
  return std::string{reinterpret_cast<const char *>(text)};
}

std::optional<std::string>
columnOptionalText(sqlite3_stmt *stmt, int column) {
  if(sqlite3_column_type(stmt, column) == SQLITE_NULL) {
    return std::nullopt;
  }
  return columnText(stmt, column);
}

std::optional<std::int64_t>
columnOptionalInt(sqlite3_stmt *stmt, int column) {
  if(sqlite3_column_type(stmt, column) == SQLITE_NULL) {
    return std::nullopt;
  }
  return sqlite3_column_int64(stmt, column);
}

}

struct Connection {
  sqlite3 *db = nullptr;
  sqlite3_stmt* stmt = nullptr;
  const bool transactional;
  int rc = SQLITE_OK;
  std::unique_lock<std::mutex> lock;

  Connection(sqlite3 *db, std::mutex &mutex, bool transactional)
    : db(db), transactional(transactional), lock(mutex) {

    if(transactional) {
      do {
        rc = sqlite3_exec(db, "BEGIN IMMEDIATE", 0, 0, 0);
      }
      while(rc == SQLITE_BUSY);
    }

    if(rc != SQLITE_OK) {
      spdlog::error("[SQLITE3_ERROR] BEGIN failed: {}", sqlite3_errmsg(db));
    }
  }

  bool ok() const {
    return rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW;
  }

  template<typename Functor>
  void prepare(Functor functor) {
    if(stmt != nullptr) {
      sqlite3_finalize(stmt);
      stmt = nullptr;
    }
    command(functor);
  }

  // Runs the next step unless an earlier one failed, so a failure short-circuits
  // the rest of the transaction and is rolled back on close.
  template<typename Functor>
  void command(Functor functor) {

    if(ok()) {
      do {
        rc = functor();
      } while(rc == SQLITE_BUSY);

      if(!ok()) {
        spdlog::error("[SQLITE3_ERROR] {}", sqlite3_errmsg(db));
      }
    }
  }

  template<typename... Functors>
  void command(Functors&&... functors) {
    ([&]{
     command(functors);
    } (), ...);
  }

  // Rearms the current statement for another row.
  void reset() {
    command([&]() { return sqlite3_reset(stmt); });
    command([&]() { return sqlite3_clear_bindings(stmt); });
  }

  std::optional<Error> status(std::string_view operation) const {
    if(ok()) {
      return std::nullopt;
    }

    if((rc & 0xff) == SQLITE_CONSTRAINT) {
      return makeError(UNEXPECTED_CODE::CONFLICT,
                       std::format("{}: {}", operation, sqlite3_errmsg(db)));
    }

    return makeError(UNEXPECTED_CODE::UNKNOWN,
                     std::format("{}: {}", operation, sqlite3_errmsg(db)));
  }
};

void deleteConnection(Connection* connection) {
  const bool failed = !connection->ok();

  sqlite3_finalize(connection->stmt);
  connection->stmt = nullptr;

  if(connection->transactional) {
    const auto rc = sqlite3_exec(connection->db, failed ? "ROLLBACK" : "COMMIT", 0, 0, 0);

    if(rc != SQLITE_OK) {
      spdlog::error("[SQLITE3_ERROR DELETE] {}", sqlite3_errmsg(connection->db));
      sqlite3_exec(connection->db, "ROLLBACK", 0, 0, 0);
    }
  }

  delete connection;
}

void run_stmt(Connection *connection, const char *sql) {
  char *zErrMsg = 0;

  connection->command([&]() {
    return sqlite3_exec(connection->db, sql, nullptr, 0, &zErrMsg);
  });

  if (zErrMsg != nullptr) {
    spdlog::error("[SQLITE3_ERROR] {}", zErrMsg);
    sqlite3_free(zErrMsg);
  }
}

void
bind(Connection* connection, int index, std::string_view value) {
  connection->command([&]() {
    return sqlite3_bind_text(connection->stmt, index, value.data(),
                             static_cast<int>(value.size()), SQLITE_TRANSIENT);
  });
}

void
bind(Connection* connection, int index, std::int64_t value) {
  connection->command([&]() { return sqlite3_bind_int64(connection->stmt, index, value); });
}

void
bind(Connection* connection, int index, const std::optional<std::string> &value) {
  if(!value) {
    connection->command([&]() { return sqlite3_bind_null(connection->stmt, index); });
    return;
  }
  bind(connection, index, std::string_view{*value});
}

SqliteRepository::SqliteRepository(sqlite3 *db): db_(db) {}

SqliteRepository::~SqliteRepository() {
  if(sqlite3_close(db_) != SQLITE_OK) {
    spdlog::error("[SQLITE3_ERROR CLOSE] {}", sqlite3_errmsg(db_));
  }
}

std::expected<std::unique_ptr<SqliteRepository>, Error>
SqliteRepository::open(const std::string &path) {
  sqlite3 *db = nullptr;

  if(sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
    auto error = makeError(UNEXPECTED_CODE::UNKNOWN,
                           std::format("DATABASE {} couldn't be opened: {}", path, sqlite3_errmsg(db)));
    sqlite3_close(db);
    return std::unexpected(error);
  }

  sqlite3_busy_timeout(db, 1000);

  std::unique_ptr<SqliteRepository> repository{new SqliteRepository(db)};

  {
    auto connection = repository->getConnection(false);
    run_stmt(connection.get(), "PRAGMA foreign_keys = ON");
    run_stmt(connection.get(), schema);

    if(auto error = connection->status("schema")) {
      return std::unexpected(*error);
    }
  }

  spdlog::info("database ready at {}", path);
  return repository;
}

std::unique_ptr<Connection, void(*)(Connection*)>
SqliteRepository::getConnection(bool transactional) {
  return std::unique_ptr<Connection, void (*)(Connection *)>(
      new Connection(db_, mutex_, transactional), deleteConnection);
}

std::expected<std::vector<models::LineItem>, Error>
SqliteRepository::loadLineItems() {
  auto connection = getConnection(false);

  auto sql = R"(
    SELECT l.id, l.provider, l.external_ref, l.date, l.amount_cents,
           l.description, l.counterparty, l.payment_method, e.event_id
    FROM line_items AS l
    LEFT JOIN event_line_items AS e ON e.line_item_id = l.id
  )";

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
  });

  connection->command([&]() { return sqlite3_step(connection->stmt); });

  std::vector<models::LineItem> items;

  while(connection->rc == SQLITE_ROW) {
    models::LineItem item;
    item.id = columnText(connection->stmt, 0);
    item.provider = columnText(connection->stmt, 1);
    item.externalRef = columnText(connection->stmt, 2);
    item.date = sqlite3_column_int64(connection->stmt, 3);
    item.amount = Decimal::fromCents(sqlite3_column_int64(connection->stmt, 4));
    item.description = columnText(connection->stmt, 5);
    item.counterparty = columnText(connection->stmt, 6);
    item.paymentMethod = columnText(connection->stmt, 7);
    item.eventId = columnOptionalText(connection->stmt, 8);
    item.reviewed = item.eventId.has_value();
    items.push_back(std::move(item));

    connection->command([&]() { return sqlite3_step(connection->stmt); });
  }

  if(auto error = connection->status("load line items")) {
    return std::unexpected(*error);
  }

  return items;
}

std::optional<Error>
SqliteRepository::saveLineItems(const std::vector<models::LineItem> &items) {
  if(items.empty()) {
    return std::nullopt;
  }

  auto connection = getConnection(true);

  auto sql = R"(
    INSERT INTO line_items(id, provider, external_ref, date, amount_cents,
                           description, counterparty, payment_method)
    VALUES(?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(id) DO UPDATE SET
      date = excluded.date,
      amount_cents = excluded.amount_cents,
      description = excluded.description,
      counterparty = excluded.counterparty,
      payment_method = excluded.payment_method
  )";

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
  });

  for(const auto &item : items) {
    bind(connection.get(), 1, std::string_view{item.id});
    bind(connection.get(), 2, std::string_view{item.provider});
    bind(connection.get(), 3, std::string_view{item.externalRef});
    bind(connection.get(), 4, item.date);
    bind(connection.get(), 5, item.amount.cents());
    bind(connection.get(), 6, std::string_view{item.description});
    bind(connection.get(), 7, std::string_view{item.counterparty});
    bind(connection.get(), 8, std::string_view{item.paymentMethod});

    connection->command([&]() { return sqlite3_step(connection->stmt); });
    connection->reset();
  }

  return connection->status("save line items");
}

std::optional<Error>
SqliteRepository::deleteLineItem(const std::string &id) {
  auto connection = getConnection(true);

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, "DELETE FROM line_items WHERE id = ?", -1,
                              &(connection->stmt), nullptr);
  });

  bind(connection.get(), 1, std::string_view{id});
  connection->command([&]() { return sqlite3_step(connection->stmt); });

  return connection->status("delete line item");
}

std::expected<std::vector<models::Hint>, Error>
SqliteRepository::loadHints() {
  auto connection = getConnection(false);

  auto sql = R"(
    SELECT id, name, cel_expression, prefill_name, prefill_category_id,
           display_order, is_active, expression_version
    FROM event_hints
    ORDER BY display_order, id
  )";

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
  });

  connection->command([&]() { return sqlite3_step(connection->stmt); });

  std::vector<models::Hint> hints;

  while(connection->rc == SQLITE_ROW) {
    models::Hint hint;
    hint.id = columnText(connection->stmt, 0);
    hint.name = columnText(connection->stmt, 1);
    hint.expression = columnText(connection->stmt, 2);
    hint.prefillName = columnText(connection->stmt, 3);
    hint.prefillCategoryId = columnOptionalText(connection->stmt, 4);
    hint.displayOrder = sqlite3_column_int(connection->stmt, 5);
    hint.active = sqlite3_column_int(connection->stmt, 6) != 0;
    hint.expressionVersion = sqlite3_column_int(connection->stmt, 7);
    hints.push_back(std::move(hint));

    connection->command([&]() { return sqlite3_step(connection->stmt); });
  }

  if(auto error = connection->status("load hints")) {
    return std::unexpected(*error);
  }

  return hints;
}

std::optional<Error>
SqliteRepository::saveHint(const models::Hint &hint) {
  auto connection = getConnection(true);

  auto sql = R"(
    INSERT INTO event_hints(id, name, cel_expression, prefill_name, prefill_category_id,
                            display_order, is_active, expression_version)
    VALUES(?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(id) DO UPDATE SET
      name = excluded.name,
      cel_expression = excluded.cel_expression,
      prefill_name = excluded.prefill_name,
      prefill_category_id = excluded.prefill_category_id,
      display_order = excluded.display_order,
      is_active = excluded.is_active,
      expression_version = excluded.expression_version
  )";

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
  });

  bind(connection.get(), 1, std::string_view{hint.id});
  bind(connection.get(), 2, std::string_view{hint.name});
  bind(connection.get(), 3, std::string_view{hint.expression});
  bind(connection.get(), 4, std::string_view{hint.prefillName});
  bind(connection.get(), 5, hint.prefillCategoryId);
  bind(connection.get(), 6, std::int64_t{hint.displayOrder});
  bind(connection.get(), 7, std::int64_t{hint.active ? 1 : 0});
  bind(connection.get(), 8, std::int64_t{hint.expressionVersion});

  connection->command([&]() { return sqlite3_step(connection->stmt); });

  auto error = connection->status("save hint");
  if(error && error->code == UNEXPECTED_CODE::CONFLICT) {
    error->code = UNEXPECTED_CODE::DUPLICATE_ORDER;
  }
  return error;
}

std::optional<Error>
SqliteRepository::saveHintOrder(const std::vector<models::Hint> &hints) {
  if(hints.empty()) {
    return std::nullopt;
  }

  auto connection = getConnection(true);

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, "UPDATE event_hints SET display_order = ? WHERE id = ?",
                              -1, &(connection->stmt), nullptr);
  });

  // The active-order index is checked per row, so park every row on a unique
  // negative slot before writing the final orders.
  std::int64_t parked = -1;
  for(const auto &hint : hints) {
    bind(connection.get(), 1, parked--);
    bind(connection.get(), 2, std::string_view{hint.id});
    connection->command([&]() { return sqlite3_step(connection->stmt); });
    connection->reset();
  }

  for(const auto &hint : hints) {
    bind(connection.get(), 1, std::int64_t{hint.displayOrder});
    bind(connection.get(), 2, std::string_view{hint.id});
    connection->command([&]() { return sqlite3_step(connection->stmt); });
    connection->reset();
  }

  auto error = connection->status("save hint order");
  if(error && error->code == UNEXPECTED_CODE::CONFLICT) {
    error->code = UNEXPECTED_CODE::DUPLICATE_ORDER;
  }
  return error;
}

std::optional<Error>
SqliteRepository::deleteHint(const std::string &id) {
  auto connection = getConnection(true);

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, "DELETE FROM event_hints WHERE id = ?", -1,
                              &(connection->stmt), nullptr);
  });

  bind(connection.get(), 1, std::string_view{id});
  connection->command([&]() { return sqlite3_step(connection->stmt); });

  return connection->status("delete hint");
}

std::expected<std::vector<models::Event>, Error>
SqliteRepository::loadEvents() {
  auto connection = getConnection(false);

  auto sql = R"(
    SELECT id, name, category_id, date, amount_cents, is_duplicate_transaction
    FROM events
  )";

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
  });

  connection->command([&]() { return sqlite3_step(connection->stmt); });

  std::map<std::string, models::Event> events;

  while(connection->rc == SQLITE_ROW) {
    models::Event event;
    event.id = columnText(connection->stmt, 0);
    event.name = columnText(connection->stmt, 1);
    event.categoryId = columnText(connection->stmt, 2);
    event.date = sqlite3_column_int64(connection->stmt, 3);
    event.amount = Decimal::fromCents(sqlite3_column_int64(connection->stmt, 4));
    event.isDuplicateTransaction = sqlite3_column_int(connection->stmt, 5) != 0;
    events.emplace(event.id, std::move(event));

    connection->command([&]() { return sqlite3_step(connection->stmt); });
  }

  auto junctionSql = R"(
    SELECT event_id, line_item_id FROM event_line_items ORDER BY event_id, position
  )";

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, junctionSql, -1, &(connection->stmt), nullptr);
  });

  connection->command([&]() { return sqlite3_step(connection->stmt); });

  while(connection->rc == SQLITE_ROW) {
    auto found = events.find(columnText(connection->stmt, 0));
    if(found != events.end()) {
      found->second.lineItemIds.push_back(columnText(connection->stmt, 1));
    }

    connection->command([&]() { return sqlite3_step(connection->stmt); });
  }

  if(auto error = connection->status("load events")) {
    return std::unexpected(*error);
  }

  std::vector<models::Event> result;
  result.reserve(events.size());
  for(auto &[id, event] : events) {
    result.push_back(std::move(event));
  }
  return result;
}

std::optional<Error>
SqliteRepository::saveEvent(const models::Event &event) {
  auto connection = getConnection(true);

  auto sql = R"(
    INSERT INTO events(id, name, category_id, date, amount_cents, is_duplicate_transaction)
    VALUES(?, ?, ?, ?, ?, ?)
  )";

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
  });

  bind(connection.get(), 1, std::string_view{event.id});
  bind(connection.get(), 2, std::string_view{event.name});
  bind(connection.get(), 3, std::string_view{event.categoryId});
  bind(connection.get(), 4, event.date);
  bind(connection.get(), 5, event.amount.cents());
  bind(connection.get(), 6, std::int64_t{event.isDuplicateTransaction ? 1 : 0});

  connection->command([&]() { return sqlite3_step(connection->stmt); });

  auto junctionSql = R"(
    INSERT INTO event_line_items(event_id, line_item_id, position) VALUES(?, ?, ?)
  )";

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, junctionSql, -1, &(connection->stmt), nullptr);
  });

  std::int64_t position = 0;
  for(const auto &lineItemId : event.lineItemIds) {
    bind(connection.get(), 1, std::string_view{event.id});
    bind(connection.get(), 2, std::string_view{lineItemId});
    bind(connection.get(), 3, position++);
    connection->command([&]() { return sqlite3_step(connection->stmt); });
    connection->reset();
  }

  return connection->status("save event");
}

std::optional<Error>
SqliteRepository::deleteEvent(const std::string &id) {
  auto connection = getConnection(true);

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, "DELETE FROM event_line_items WHERE event_id = ?", -1,
                              &(connection->stmt), nullptr);
  });

  bind(connection.get(), 1, std::string_view{id});
  connection->command([&]() { return sqlite3_step(connection->stmt); });

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, "DELETE FROM events WHERE id = ?", -1,
                              &(connection->stmt), nullptr);
  });

  bind(connection.get(), 1, std::string_view{id});
  connection->command([&]() { return sqlite3_step(connection->stmt); });

  return connection->status("delete event");
}

std::expected<std::vector<models::Account>, Error>
SqliteRepository::loadAccounts() {
  auto connection = getConnection(false);

  auto sql = R"(
    SELECT id, provider, display_name, status, last_synced_at, balance_cents
    FROM accounts
    ORDER BY id
  )";

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
  });

  connection->command([&]() { return sqlite3_step(connection->stmt); });

  std::vector<models::Account> accounts;

  while(connection->rc == SQLITE_ROW) {
    const auto provider = models::providerFromKey(columnText(connection->stmt, 1));
    const auto status = models::statusFromKey(columnText(connection->stmt, 3));

    if(provider && status) {
      models::Account account;
      account.id = columnText(connection->stmt, 0);
      account.provider = *provider;
      account.displayName = columnText(connection->stmt, 2);
      account.status = *status;
      account.lastSyncedAt = columnOptionalInt(connection->stmt, 4);
      if(auto cents = columnOptionalInt(connection->stmt, 5)) {
        account.balance = Decimal::fromCents(*cents);
      }
      accounts.push_back(std::move(account));
    } else {
      spdlog::warn("skipping account {} with unknown provider or status", columnText(connection->stmt, 0));
    }

    connection->command([&]() { return sqlite3_step(connection->stmt); });
  }

  if(auto error = connection->status("load accounts")) {
    return std::unexpected(*error);
  }

  return accounts;
}

std::optional<Error>
SqliteRepository::saveAccount(const models::Account &account) {
  auto connection = getConnection(true);

  auto sql = R"(
    INSERT INTO accounts(id, provider, display_name, status, last_synced_at, balance_cents)
    VALUES(?, ?, ?, ?, ?, ?)
    ON CONFLICT(id) DO UPDATE SET
      provider = excluded.provider,
      display_name = excluded.display_name,
      status = excluded.status,
      last_synced_at = excluded.last_synced_at,
      balance_cents = excluded.balance_cents
  )";

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
  });

  bind(connection.get(), 1, std::string_view{account.id});
  bind(connection.get(), 2, models::providerKey(account.provider));
  bind(connection.get(), 3, std::string_view{account.displayName});
  bind(connection.get(), 4, models::statusKey(account.status));

  if(account.lastSyncedAt) {
    bind(connection.get(), 5, *account.lastSyncedAt);
  } else {
    connection->command([&]() { return sqlite3_bind_null(connection->stmt, 5); });
  }

  if(account.balance) {
    bind(connection.get(), 6, account.balance->cents());
  } else {
    connection->command([&]() { return sqlite3_bind_null(connection->stmt, 6); });
  }

  connection->command([&]() { return sqlite3_step(connection->stmt); });

  return connection->status("save account");
}

}
