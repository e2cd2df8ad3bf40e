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

#include <gtest/gtest.h>
#include <sqlite3.h>

#include <algorithm>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "visitor_badge/config.hpp"
#include "visitor_badge/storage/connection_pool.hpp"
#include "visitor_badge/storage/sqlite_counter_store.hpp"

using visitor_badge::ConnectionPool;
using visitor_badge::PoolConfigBuilder;
using visitor_badge::SqliteCounterStore;
using visitor_badge::StorageError;
using visitor_badge::Uuid;

class SqliteCounterStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    // Create a unique temp file for each test
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<uint64_t> dist;
    temp_db_path_ = std::filesystem::temp_directory_path() / ("test_counts_" + std::to_string(dist(gen)) + ".db");
    open_store();
  }

  void TearDown() override {
    close_store();
    std::filesystem::remove(temp_db_path_);
    // Also remove WAL and SHM files if they exist
    std::filesystem::remove(temp_db_path_.string() + "-wal");
    std::filesystem::remove(temp_db_path_.string() + "-shm");
  }

  void open_store(int max_connections = 8) {
    auto config = PoolConfigBuilder()
                      .with_database_url("sqlite://" + temp_db_path_.string())
                      .with_max_connections(max_connections)
                      .with_acquire_timeout(10000)
                      .build();
    pool_ = std::make_unique<ConnectionPool>(config);
    store_ = std::make_unique<SqliteCounterStore>(*pool_);
    store_->initialize_schema();
  }

  void close_store() {
    store_.reset();
    pool_.reset();
  }

  /// Read a stored count directly, bypassing the store
  std::optional<int64_t> read_count(const Uuid & id) {
    auto conn = pool_->acquire();
    sqlite3_stmt * stmt = nullptr;
    EXPECT_EQ(sqlite3_prepare_v2(conn->get(), "SELECT count FROM counts WHERE id = ?", -1, &stmt, nullptr), SQLITE_OK);
    const std::string text = id.to_string();
    sqlite3_bind_text(stmt, 1, text.c_str(), -1, SQLITE_TRANSIENT);
    std::optional<int64_t> count;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
      count = sqlite3_column_int64(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
  }

  std::filesystem::path temp_db_path_;
  std::unique_ptr<ConnectionPool> pool_;
  std::unique_ptr<SqliteCounterStore> store_;
};

TEST_F(SqliteCounterStoreTest, InitializeSchemaIsIdempotent) {
  EXPECT_NO_THROW(store_->initialize_schema());
  EXPECT_NO_THROW(store_->initialize_schema());
}

TEST_F(SqliteCounterStoreTest, CreateCounterStartsAtZero) {
  auto id = store_->create_counter();

  EXPECT_EQ(id.version(), 4);
  auto count = read_count(id);
  ASSERT_TRUE(count.has_value());
  EXPECT_EQ(*count, 0);
}

TEST_F(SqliteCounterStoreTest, CreateCounterReturnsUniqueIds) {
  std::set<Uuid> ids;
  for (int i = 0; i < 10000; ++i) {
    ids.insert(store_->create_counter());
  }
  EXPECT_EQ(ids.size(), 10000u);
}

TEST_F(SqliteCounterStoreTest, FirstIncrementReturnsOne) {
  auto id = store_->create_counter();

  auto count = store_->increment_and_get(id);
  ASSERT_TRUE(count.has_value());
  EXPECT_EQ(*count, 1);
}

TEST_F(SqliteCounterStoreTest, SequentialIncrementsAreMonotonic) {
  auto id = store_->create_counter();

  for (int64_t expected = 1; expected <= 100; ++expected) {
    auto count = store_->increment_and_get(id);
    ASSERT_TRUE(count.has_value());
    EXPECT_EQ(*count, expected);
  }
  EXPECT_EQ(read_count(id).value(), 100);
}

TEST_F(SqliteCounterStoreTest, CountersAreIndependent) {
  auto first = store_->create_counter();
  auto second = store_->create_counter();

  store_->increment_and_get(first);
  store_->increment_and_get(first);
  auto count = store_->increment_and_get(second);

  ASSERT_TRUE(count.has_value());
  EXPECT_EQ(*count, 1);
  EXPECT_EQ(read_count(first).value(), 2);
}

TEST_F(SqliteCounterStoreTest, UnknownIdReturnsNotFound) {
  auto unknown = Uuid::generate_v4();

  std::optional<int64_t> count;
  EXPECT_NO_THROW(count = store_->increment_and_get(unknown));
  EXPECT_FALSE(count.has_value());
  EXPECT_FALSE(read_count(unknown).has_value());
}

TEST_F(SqliteCounterStoreTest, IncrementDoesNotCreateMissingCounter) {
  auto unknown = Uuid::generate_v4();

  EXPECT_FALSE(store_->increment_and_get(unknown).has_value());
  EXPECT_FALSE(store_->increment_and_get(unknown).has_value());
}

TEST_F(SqliteCounterStoreTest, ConcurrentIncrementsReturnEveryValueOnce) {
  constexpr int kThreads = 8;
  constexpr int kIncrementsPerThread = 50;
  constexpr int kTotal = kThreads * kIncrementsPerThread;

  auto id = store_->create_counter();

  std::mutex results_mutex;
  std::vector<int64_t> results;
  std::vector<std::string> errors;
  results.reserve(kTotal);

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < kIncrementsPerThread; ++i) {
        try {
          auto count = store_->increment_and_get(id);
          std::lock_guard<std::mutex> lock(results_mutex);
          if (count) {
            results.push_back(*count);
          } else {
            errors.push_back("counter not found");
          }
        } catch (const StorageError & e) {
          std::lock_guard<std::mutex> lock(results_mutex);
          errors.push_back(e.what());
        }
      }
    });
  }
  for (auto & thread : threads) {
    thread.join();
  }

  ASSERT_TRUE(errors.empty()) << errors.front();
  ASSERT_EQ(results.size(), static_cast<size_t>(kTotal));

  std::sort(results.begin(), results.end());
  for (int i = 0; i < kTotal; ++i) {
    EXPECT_EQ(results[static_cast<size_t>(i)], i + 1);
  }
  EXPECT_EQ(read_count(id).value(), kTotal);
}

TEST_F(SqliteCounterStoreTest, CountsPersistAcrossReopen) {
  auto id = store_->create_counter();
  store_->increment_and_get(id);
  store_->increment_and_get(id);

  close_store();
  open_store();

  auto count = store_->increment_and_get(id);
  ASSERT_TRUE(count.has_value());
  EXPECT_EQ(*count, 3);
}

TEST_F(SqliteCounterStoreTest, StoresCanonicalIdText) {
  auto id = store_->create_counter();

  auto lease = pool_->acquire();
  sqlite3_stmt * stmt = nullptr;
  ASSERT_EQ(sqlite3_prepare_v2(lease->get(), "SELECT id FROM counts", -1, &stmt, nullptr), SQLITE_OK);
  ASSERT_EQ(sqlite3_step(stmt), SQLITE_ROW);
  std::string stored = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0));
  sqlite3_finalize(stmt);

  EXPECT_EQ(stored, id.to_string());
}

TEST_F(SqliteCounterStoreTest, ExhaustedPoolSurfacesAsStorageError) {
  close_store();
  auto config = PoolConfigBuilder()
                    .with_database_url(temp_db_path_.string())
                    .with_max_connections(1)
                    .with_acquire_timeout(50)
                    .build();
  pool_ = std::make_unique<ConnectionPool>(config);
  store_ = std::make_unique<SqliteCounterStore>(*pool_);
  store_->initialize_schema();
  auto id = store_->create_counter();

  auto held = pool_->acquire();
  EXPECT_THROW(store_->increment_and_get(id), StorageError);
  EXPECT_THROW(store_->create_counter(), StorageError);
}

TEST_F(SqliteCounterStoreTest, FailedStatementClosesConnection) {
  auto id = store_->create_counter();
  pool_->acquire()->exec("DROP TABLE counts;", "drop counts table");
  ASSERT_EQ(pool_->open_connections(), 1u);

  EXPECT_THROW(store_->increment_and_get(id), StorageError);
  EXPECT_THROW(store_->create_counter(), StorageError);

  EXPECT_EQ(pool_->open_connections(), 0u);
  EXPECT_EQ(pool_->idle_connections(), 0u);

  // The pool reopens on demand once the schema is back
  store_->initialize_schema();
  EXPECT_NO_THROW(store_->create_counter());
  EXPECT_EQ(pool_->open_connections(), 1u);
}
