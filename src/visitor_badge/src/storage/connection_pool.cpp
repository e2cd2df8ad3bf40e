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

#include "visitor_badge/storage/connection_pool.hpp"

#include <chrono>
#include <rclcpp/rclcpp.hpp>
#include <utility>

#include "visitor_badge/storage/storage_error.hpp"

namespace visitor_badge {

SqliteConnection::SqliteConnection(const std::string & db_path, int busy_timeout_ms) {
  // The pool hands a connection to one thread at a time
  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX;
  if (sqlite3_open_v2(db_path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    std::string error = db_ ? sqlite3_errmsg(db_) : "Unknown error";
    if (db_) {
      sqlite3_close(db_);
      db_ = nullptr;
    }
    throw StorageError("Failed to open database '" + db_path + "': " + error);
  }

  try {
    exec("PRAGMA journal_mode=WAL;", "enable WAL mode");
    exec("PRAGMA synchronous=NORMAL;", "set synchronous mode");
  } catch (const StorageError &) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }

  // Concurrent writers wait for the write lock instead of failing immediately
  sqlite3_busy_timeout(db_, busy_timeout_ms);
}

SqliteConnection::~SqliteConnection() {
  if (db_) {
    sqlite3_close(db_);
  }
}

void SqliteConnection::exec(const char * sql, const char * what) {
  char * err_msg = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
    std::string error = err_msg ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    throw StorageError(std::string("Failed to ") + what + ": " + error);
  }
}

ConnectionPool::Lease::Lease(ConnectionPool * pool, std::unique_ptr<SqliteConnection> connection)
  : pool_(pool), connection_(std::move(connection)) {
}

ConnectionPool::Lease::Lease(Lease && other) noexcept
  : pool_(other.pool_), connection_(std::move(other.connection_)), discard_(other.discard_) {
  other.pool_ = nullptr;
}

ConnectionPool::Lease & ConnectionPool::Lease::operator=(Lease && other) noexcept {
  if (this != &other) {
    release();
    pool_ = other.pool_;
    connection_ = std::move(other.connection_);
    discard_ = other.discard_;
    other.pool_ = nullptr;
  }
  return *this;
}

ConnectionPool::Lease::~Lease() {
  release();
}

void ConnectionPool::Lease::release() {
  if (pool_ && connection_) {
    pool_->release(std::move(connection_), discard_);
  }
  pool_ = nullptr;
}

ConnectionPool::ConnectionPool(const PoolConfig & config) : config_(config) {
  idle_.reserve(static_cast<size_t>(config_.max_connections));
}

ConnectionPool::Lease ConnectionPool::acquire() {
  std::unique_lock<std::mutex> lock(mutex_);

  const auto max_open = static_cast<size_t>(config_.max_connections);
  bool ready = available_cv_.wait_for(lock, std::chrono::milliseconds(config_.acquire_timeout_ms), [this, max_open]() {
    return !idle_.empty() || open_count_ < max_open;
  });
  if (!ready) {
    RCLCPP_WARN(rclcpp::get_logger("connection_pool"), "Connection pool exhausted (%zu/%zu in use)", open_count_,
                max_open);
    throw PoolExhaustedError(config_.acquire_timeout_ms);
  }

  if (!idle_.empty()) {
    auto connection = std::move(idle_.back());
    idle_.pop_back();
    return Lease(this, std::move(connection));
  }

  // Reserve the slot, then open outside the lock
  ++open_count_;
  lock.unlock();

  try {
    auto connection = std::make_unique<SqliteConnection>(config_.database_path, config_.busy_timeout_ms);
    RCLCPP_DEBUG(rclcpp::get_logger("connection_pool"), "Opened database connection to %s",
                 config_.database_path.c_str());
    return Lease(this, std::move(connection));
  } catch (const StorageError &) {
    lock.lock();
    --open_count_;
    lock.unlock();
    available_cv_.notify_one();
    throw;
  }
}

void ConnectionPool::release(std::unique_ptr<SqliteConnection> connection, bool discard) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (discard) {
      connection.reset();
      --open_count_;
    } else {
      idle_.push_back(std::move(connection));
    }
  }
  available_cv_.notify_one();
}

size_t ConnectionPool::open_connections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return open_count_;
}

size_t ConnectionPool::idle_connections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_.size();
}

}  // namespace visitor_badge
