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

#include <cstdint>
#include <optional>

#include "visitor_badge/storage/storage_error.hpp"
#include "visitor_badge/uuid.hpp"

namespace visitor_badge {

/// Abstract interface for counter storage backends
class CounterStore {
 public:
  virtual ~CounterStore() = default;

  /// Create the counts table if it does not exist yet. Idempotent.
  /// @throws StorageError on failure
  virtual void initialize_schema() = 0;

  /// Allocate a fresh random identifier and store it with count 0
  /// @return The new identifier
  /// @throws StorageError if the record cannot be inserted
  virtual Uuid create_counter() = 0;

  /// Atomically increment the count for id and return the new value
  /// @param id Counter identifier
  /// @return New count, or nullopt if no counter exists for id
  /// @throws StorageError if the database cannot be reached or the update fails
  virtual std::optional<int64_t> increment_and_get(const Uuid & id) = 0;

 protected:
  CounterStore() = default;
  CounterStore(const CounterStore &) = default;
  CounterStore & operator=(const CounterStore &) = default;
  CounterStore(CounterStore &&) = default;
  CounterStore & operator=(CounterStore &&) = default;
};

}  // namespace visitor_badge
