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

#pragma once

#include <sqlite3.h>

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "visitor_badge/config.hpp"

namespace visitor_badge {

/// Owning handle for one SQLite connection
class SqliteConnection {
 public:
  /// Open (or create) the database at db_path in WAL mode
  /// @throws StorageError if the database cannot be opened or configured
  SqliteConnection(const std::string & db_path, int busy_timeout_ms);

  ~SqliteConnection();

  // Non-copyable, non-movable (owns SQLite connection)
  SqliteConnection(const SqliteConnection &) = delete;
  SqliteConnection & operator=(const SqliteConnection &) = delete;
  SqliteConnection(SqliteConnection &&) = delete;
  SqliteConnection & operator=(SqliteConnection &&) = delete;

  sqlite3 * get() const {
    return db_;
  }

  /// Run one or more SQL statements without result rows
  /// @throws StorageError on failure
  void exec(const char * sql, const char * what);

 private:
  sqlite3 * db_{nullptr};
};

/**
 * @brief Bounded pool of SQLite connections
 *
 * Connections are opened lazily up to PoolConfig::max_connections. A caller
 * that finds the pool exhausted waits up to PoolConfig::acquire_timeout_ms and
 * then fails with PoolExhaustedError instead of blocking indefinitely.
 *
 * Thread-safe. Leases must not outlive the pool.
 */
class ConnectionPool {
 public:
  /// Scoped ownership of a pooled connection, returned to the pool on destruction
  class Lease {
   public:
    Lease(Lease && other) noexcept;
    Lease & operator=(Lease && other) noexcept;
    ~Lease();

    Lease(const Lease &) = delete;
    Lease & operator=(const Lease &) = delete;

    SqliteConnection & operator*() const {
      return *connection_;
    }

    SqliteConnection * operator->() const {
      return connection_.get();
    }

    /// Close the connection instead of returning it to the pool
    void discard() {
      discard_ = true;
    }

   private:
    friend class ConnectionPool;

    Lease(ConnectionPool * pool, std::unique_ptr<SqliteConnection> connection);
    void release();

    ConnectionPool * pool_{nullptr};
    std::unique_ptr<SqliteConnection> connection_;
    bool discard_{false};
  };

  explicit ConnectionPool(const PoolConfig & config);
  ~ConnectionPool() = default;

  ConnectionPool(const ConnectionPool &) = delete;
  ConnectionPool & operator=(const ConnectionPool &) = delete;

  /**
   * @brief Take a connection from the pool
   * @throws PoolExhaustedError if no connection is free within the acquire timeout
   * @throws StorageError if a new connection cannot be opened
   */
  Lease acquire();

  /// Number of open connections (idle and leased)
  size_t open_connections() const;

  /// Number of open connections waiting in the pool
  size_t idle_connections() const;

 private:
  void release(std::unique_ptr<SqliteConnection> connection, bool discard);

  PoolConfig config_;
  mutable std::mutex mutex_;
  std::condition_variable available_cv_;
  std::vector<std::unique_ptr<SqliteConnection>> idle_;
  size_t open_count_{0};
};

}  // namespace visitor_badge
