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

#include <stdexcept>
#include <string>

namespace visitor_badge {

/// Exception thrown when the counter database cannot serve a request
/// (pool exhausted, database unreachable, statement failure)
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string & message) : std::runtime_error(message) {
  }
};

/// Exception thrown when no pooled connection became free within the acquire timeout
class PoolExhaustedError : public StorageError {
 public:
  explicit PoolExhaustedError(int timeout_ms)
    : StorageError("Timed out after " + std::to_string(timeout_ms) + "ms waiting for a database connection")
    , timeout_ms_(timeout_ms) {
  }

  int timeout_ms() const noexcept {
    return timeout_ms_;
  }

 private:
  int timeout_ms_;
};

}  // namespace visitor_badge
