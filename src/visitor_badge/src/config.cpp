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

#include "visitor_badge/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace visitor_badge {

namespace {

constexpr const char * kSqliteScheme = "sqlite://";
constexpr const char * kFileScheme = "file:";

bool starts_with(const std::string & value, const char * prefix) {
  return value.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

bool parse_port(const std::string & text, int & port) {
  if (text.empty() || text.size() > 5) {
    return false;
  }
  if (!std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
      })) {
    return false;
  }
  port = std::stoi(text);
  return port > 0 && port <= 65535;
}

}  // namespace

PoolConfigBuilder & PoolConfigBuilder::with_database_url(const std::string & url) {
  url_ = url;
  return *this;
}

PoolConfigBuilder & PoolConfigBuilder::with_max_connections(int max_connections) {
  config_.max_connections = max_connections;
  return *this;
}

PoolConfigBuilder & PoolConfigBuilder::with_acquire_timeout(int timeout_ms) {
  config_.acquire_timeout_ms = timeout_ms;
  return *this;
}

PoolConfigBuilder & PoolConfigBuilder::with_busy_timeout(int timeout_ms) {
  config_.busy_timeout_ms = timeout_ms;
  return *this;
}

PoolConfig PoolConfigBuilder::build() {
  auto path = database_path_from_url(url_);
  if (!path) {
    throw std::invalid_argument("database url: " + path.error());
  }
  // Every pooled connection would open its own private in-memory database
  if (*path == ":memory:") {
    throw std::invalid_argument("database url: in-memory databases cannot be shared by a connection pool");
  }
  config_.database_path = *path;

  if (config_.max_connections <= 0) {
    throw std::invalid_argument("max_connections must be > 0");
  }
  if (config_.acquire_timeout_ms <= 0) {
    throw std::invalid_argument("acquire_timeout_ms must be > 0");
  }
  if (config_.busy_timeout_ms < 0) {
    throw std::invalid_argument("busy_timeout_ms must be >= 0");
  }

  return std::move(config_);
}

tl::expected<BindAddress, std::string> parse_bind_address(const std::string & value) {
  BindAddress address;
  std::string port_text;

  if (!value.empty() && value.front() == '[') {
    auto close = value.find(']');
    if (close == std::string::npos) {
      return tl::make_unexpected("missing ']' in IPv6 address '" + value + "'");
    }
    address.host = value.substr(1, close - 1);
    if (close + 1 >= value.size() || value[close + 1] != ':') {
      return tl::make_unexpected("missing port in '" + value + "'");
    }
    port_text = value.substr(close + 2);
  } else {
    auto colon = value.rfind(':');
    if (colon == std::string::npos) {
      return tl::make_unexpected("expected host:port, got '" + value + "'");
    }
    address.host = value.substr(0, colon);
    port_text = value.substr(colon + 1);
  }

  if (address.host.empty()) {
    return tl::make_unexpected("empty host in '" + value + "'");
  }
  if (!parse_port(port_text, address.port)) {
    return tl::make_unexpected("invalid port '" + port_text + "'");
  }
  return address;
}

tl::expected<std::string, std::string> database_path_from_url(const std::string & url) {
  std::string path;
  if (starts_with(url, kSqliteScheme)) {
    path = url.substr(std::char_traits<char>::length(kSqliteScheme));
  } else if (starts_with(url, kFileScheme)) {
    path = url.substr(std::char_traits<char>::length(kFileScheme));
  } else if (url.find("://") != std::string::npos) {
    return tl::make_unexpected("unsupported scheme in '" + url + "', expected sqlite://");
  } else {
    path = url;
  }

  auto query = path.find('?');
  if (query != std::string::npos) {
    path.erase(query);
  }

  if (path.empty()) {
    return tl::make_unexpected("empty database path");
  }
  return path;
}

std::string get_env(const char * name) {
  const char * value = std::getenv(name);
  return value ? std::string(value) : std::string();
}

}  // namespace visitor_badge
