// Copyright 2026 visitor_badge contributors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "visitor_badge/storage/sqlite_counter_store.hpp"

#include <sqlite3.h>

#include <limits>
#include <rclcpp/rclcpp.hpp>
#include <string>

namespace visitor_badge {

namespace {

constexpr const char * kCreateCountsTableSql = R"(
  CREATE TABLE IF NOT EXISTS counts (
    id TEXT PRIMARY KEY,
    count INTEGER NOT NULL DEFAULT 0
  );
)";

constexpr const char * kInsertCounterSql = "INSERT INTO counts (id, count) VALUES (?, 0) RETURNING id";

// Read-modify-write happens inside SQLite under the write lock
constexpr const char * kIncrementSql = "UPDATE counts SET count = count + 1 WHERE id = ? RETURNING count";

/// RAII wrapper for SQLite statements
class SqliteStatement {
 public:
  SqliteStatement(sqlite3 * db, const char * sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      throw StorageError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db));
    }
  }

  ~SqliteStatement() {
    if (stmt_) {
      sqlite3_finalize(stmt_);
    }
  }

  SqliteStatement(const SqliteStatement &) = delete;
  SqliteStatement & operator=(const SqliteStatement &) = delete;

  void bind_text(int index, const std::string & value) {
    const auto size = value.size();
    if (size > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
      throw StorageError("Failed to bind text: value size exceeds SQLite int length limit");
    }
    if (sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(size), SQLITE_TRANSIENT) != SQLITE_OK) {
      throw StorageError(std::string("Failed to bind text: ") + sqlite3_errmsg(db_));
    }
  }

  /// Step once; SQLITE_ROW and SQLITE_DONE pass through, anything else throws
  int step(const char * what) {
    int rc = sqlite3_step(stmt_);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
      throw StorageError(std::string("Failed to ") + what + ": " + sqlite3_errmsg(db_));
    }
    return rc;
  }

  /// Drain remaining rows so the implicit transaction commits
  void finish(const char * what) {
    while (step(what) == SQLITE_ROW) {
    }
  }

  std::string column_text(int index) {
    const auto * text = reinterpret_cast<const char *>(sqlite3_column_text(stmt_, index));
    return text ? std::string(text) : std::string();
  }

  int64_t column_int64(int index) {
    return sqlite3_column_int64(stmt_, index);
  }

 private:
  sqlite3 * db_;
  sqlite3_stmt * stmt_{nullptr};
};

}  // namespace

SqliteCounterStore::SqliteCounterStore(ConnectionPool & pool) : pool_(pool) {
}

void SqliteCounterStore::initialize_schema() {
  auto conn = pool_.acquire();
  try {
    conn->exec(kCreateCountsTableSql, "create counts table");
  } catch (const StorageError &) {
    conn.discard();
    throw;
  }
}

Uuid SqliteCounterStore::create_counter() {
  const Uuid id = Uuid::generate_v4();

  auto conn = pool_.acquire();
  try {
    SqliteStatement stmt(conn->get(), kInsertCounterSql);
    stmt.bind_text(1, id.to_string());

    if (stmt.step("insert counter") != SQLITE_ROW) {
      throw StorageError("Failed to insert counter: no row returned");
    }
    std::string stored = stmt.column_text(0);
    stmt.finish("insert counter");

    if (stored != id.to_string()) {
      throw StorageError("Failed to insert counter: database returned unexpected id '" + stored + "'");
    }
  } catch (const StorageError &) {
    // A connection that failed mid-statement is closed rather than reused
    conn.discard();
    throw;
  }
  return id;
}

std::optional<int64_t> SqliteCounterStore::increment_and_get(const Uuid & id) {
  auto conn = pool_.acquire();
  try {
    SqliteStatement stmt(conn->get(), kIncrementSql);
    stmt.bind_text(1, id.to_string());

    if (stmt.step("increment counter") == SQLITE_DONE) {
      RCLCPP_DEBUG(rclcpp::get_logger("sqlite_counter_store"), "Counter %s not found", id.to_string().c_str());
      return std::nullopt;
    }
    int64_t count = stmt.column_int64(0);
    stmt.finish("increment counter");
    return count;
  } catch (const StorageError &) {
    conn.discard();
    throw;
  }
}

}  // namespace visitor_badge
