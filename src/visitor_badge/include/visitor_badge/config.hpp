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

#include <string>
#include <tl/expected.hpp>

namespace visitor_badge {

/// Environment variable holding the database connection string
constexpr const char * ENV_DATABASE_URL = "DATABASE_URL";

/// Environment variable holding the bind address ("host:port")
constexpr const char * ENV_HOST = "HOST";

/**
 * @brief Connection pool settings for the counter database
 */
struct PoolConfig {
  /// Database file path (":memory:" is rejected by the builder, see build())
  std::string database_path;

  /// Maximum number of open connections
  int max_connections{8};

  /// How long a request waits for a free connection before failing
  int acquire_timeout_ms{2000};

  /// SQLite busy timeout applied to every connection
  int busy_timeout_ms{5000};
};

/**
 * @brief Builder for PoolConfig with validation
 *
 * Usage:
 *   auto config = PoolConfigBuilder()
 *       .with_database_url("sqlite:///var/lib/visitor_badge/counts.db")
 *       .with_max_connections(8)
 *       .with_acquire_timeout(2000)
 *       .build();
 */
class PoolConfigBuilder {
 public:
  /// Accepts "sqlite://<path>", "file:<path>" or a bare path
  PoolConfigBuilder & with_database_url(const std::string & url);
  PoolConfigBuilder & with_max_connections(int max_connections);
  PoolConfigBuilder & with_acquire_timeout(int timeout_ms);
  PoolConfigBuilder & with_busy_timeout(int timeout_ms);

  /// Build and validate the configuration.
  /// @throws std::invalid_argument if configuration is invalid
  PoolConfig build();

 private:
  std::string url_;
  PoolConfig config_;
};

/**
 * @brief Host and port the HTTP server binds to
 */
struct BindAddress {
  std::string host;
  int port{0};
};

/**
 * @brief Parse a "host:port" or "[ipv6]:port" bind address
 * @return Parsed address, or an error message
 */
tl::expected<BindAddress, std::string> parse_bind_address(const std::string & value);

/**
 * @brief Convert a database connection string into a filesystem path
 *
 * "sqlite:///var/lib/db.sqlite" -> "/var/lib/db.sqlite"
 * "sqlite://counts.db"          -> "counts.db"
 * "file:counts.db"              -> "counts.db"
 * "counts.db"                   -> "counts.db"
 *
 * Any "?query" suffix is dropped.
 */
tl::expected<std::string, std::string> database_path_from_url(const std::string & url);

/// Read an environment variable; empty string when unset
std::string get_env(const char * name);

}  // namespace visitor_badge
