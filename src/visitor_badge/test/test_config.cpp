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

#include <stdexcept>
#include <string>

#include "visitor_badge/config.hpp"

using namespace visitor_badge;

// PoolConfigBuilder

TEST(PoolConfigBuilderTest, BuildsWithDefaults) {
  auto config = PoolConfigBuilder().with_database_url("sqlite:///tmp/counts.db").build();

  EXPECT_EQ(config.database_path, "/tmp/counts.db");
  EXPECT_EQ(config.max_connections, 8);
  EXPECT_EQ(config.acquire_timeout_ms, 2000);
  EXPECT_EQ(config.busy_timeout_ms, 5000);
}

TEST(PoolConfigBuilderTest, AppliesOverrides) {
  auto config = PoolConfigBuilder()
                    .with_database_url("counts.db")
                    .with_max_connections(2)
                    .with_acquire_timeout(150)
                    .with_busy_timeout(0)
                    .build();

  EXPECT_EQ(config.database_path, "counts.db");
  EXPECT_EQ(config.max_connections, 2);
  EXPECT_EQ(config.acquire_timeout_ms, 150);
  EXPECT_EQ(config.busy_timeout_ms, 0);
}

TEST(PoolConfigBuilderTest, RejectsInvalidValues) {
  EXPECT_THROW(PoolConfigBuilder().build(), std::invalid_argument);
  EXPECT_THROW(PoolConfigBuilder().with_database_url("postgres://localhost/db").build(), std::invalid_argument);
  EXPECT_THROW(PoolConfigBuilder().with_database_url(":memory:").build(), std::invalid_argument);
  EXPECT_THROW(PoolConfigBuilder().with_database_url("sqlite://:memory:").build(), std::invalid_argument);
  EXPECT_THROW(PoolConfigBuilder().with_database_url("counts.db").with_max_connections(0).build(),
               std::invalid_argument);
  EXPECT_THROW(PoolConfigBuilder().with_database_url("counts.db").with_acquire_timeout(0).build(),
               std::invalid_argument);
  EXPECT_THROW(PoolConfigBuilder().with_database_url("counts.db").with_busy_timeout(-1).build(),
               std::invalid_argument);
}

// database_path_from_url

TEST(DatabaseUrlTest, ConvertsSupportedForms) {
  EXPECT_EQ(database_path_from_url("sqlite:///var/lib/db.sqlite").value(), "/var/lib/db.sqlite");
  EXPECT_EQ(database_path_from_url("sqlite://counts.db").value(), "counts.db");
  EXPECT_EQ(database_path_from_url("file:counts.db").value(), "counts.db");
  EXPECT_EQ(database_path_from_url("/data/counts.db").value(), "/data/counts.db");
}

TEST(DatabaseUrlTest, DropsQuery) {
  EXPECT_EQ(database_path_from_url("sqlite:///data/counts.db?mode=rwc").value(), "/data/counts.db");
}

TEST(DatabaseUrlTest, RejectsUnsupportedScheme) {
  auto result = database_path_from_url("postgresql://user@localhost/badges");
  ASSERT_FALSE(result.has_value());
  EXPECT_NE(result.error().find("unsupported scheme"), std::string::npos);
}

TEST(DatabaseUrlTest, RejectsEmptyPath) {
  EXPECT_FALSE(database_path_from_url("").has_value());
  EXPECT_FALSE(database_path_from_url("sqlite://").has_value());
}

// parse_bind_address

TEST(BindAddressTest, ParsesHostAndPort) {
  auto address = parse_bind_address("0.0.0.0:3000");
  ASSERT_TRUE(address.has_value()) << address.error();
  EXPECT_EQ(address->host, "0.0.0.0");
  EXPECT_EQ(address->port, 3000);
}

TEST(BindAddressTest, ParsesBracketedIpv6) {
  auto address = parse_bind_address("[::1]:8080");
  ASSERT_TRUE(address.has_value()) << address.error();
  EXPECT_EQ(address->host, "::1");
  EXPECT_EQ(address->port, 8080);
}

TEST(BindAddressTest, RejectsMalformedValues) {
  EXPECT_FALSE(parse_bind_address("localhost").has_value());
  EXPECT_FALSE(parse_bind_address(":8080").has_value());
  EXPECT_FALSE(parse_bind_address("localhost:").has_value());
  EXPECT_FALSE(parse_bind_address("localhost:http").has_value());
  EXPECT_FALSE(parse_bind_address("localhost:0").has_value());
  EXPECT_FALSE(parse_bind_address("localhost:65536").has_value());
  EXPECT_FALSE(parse_bind_address("[::1]8080").has_value());
  EXPECT_FALSE(parse_bind_address("[::1:8080").has_value());
}
