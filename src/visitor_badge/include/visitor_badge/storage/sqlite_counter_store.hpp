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

#include <memory>
#include <string>

#include "visitor_badge/storage/connection_pool.hpp"
#include "visitor_badge/storage/counter_store.hpp"

namespace visitor_badge {

/// SQLite-based counter storage
/// A connection whose statement fails is discarded instead of returned to the pool.
/// Every operation is a single statement on a pooled connection; increments rely on
/// SQLite's write lock for atomicity, no in-process lock is taken.
class SqliteCounterStore : public CounterStore {
 public:
  /// Create a store over an existing pool. The pool must outlive the store.
  explicit SqliteCounterStore(ConnectionPool & pool);

  SqliteCounterStore(const SqliteCounterStore &) = delete;
  SqliteCounterStore & operator=(const SqliteCounterStore &) = delete;
  SqliteCounterStore(SqliteCounterStore &&) = delete;
  SqliteCounterStore & operator=(SqliteCounterStore &&) = delete;

  void initialize_schema() override;

  Uuid create_counter() override;

  std::optional<int64_t> increment_and_get(const Uuid & id) override;

 private:
  ConnectionPool & pool_;
};

}  // namespace visitor_badge
