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

#include "visitor_badge/badge_server_node.hpp"

#include <chrono>
#include <filesystem>
#include <stdexcept>

using namespace std::chrono_literals;

namespace visitor_badge {

BadgeServerNode::BadgeServerNode(const rclcpp::NodeOptions & options) : Node("visitor_badge", options) {
  RCLCPP_INFO(get_logger(), "Initializing visitor badge server...");

  // Declare parameters with defaults
  declare_parameter("server.host", "127.0.0.1");
  declare_parameter("server.port", 8080);
  declare_parameter("server.worker_threads", 8);
  declare_parameter("database.url", "sqlite:///var/lib/visitor_badge/counts.db");
  declare_parameter("database.pool_size", 8);
  declare_parameter("database.acquire_timeout_ms", 2000);
  declare_parameter("database.busy_timeout_ms", 5000);

  load_server_config();

  std::string database_url = get_parameter("database.url").as_string();
  std::string env_database_url = get_env(ENV_DATABASE_URL);
  if (!env_database_url.empty()) {
    RCLCPP_INFO(get_logger(), "Using database from %s", ENV_DATABASE_URL);
    database_url = env_database_url;
  }

  // Throws std::invalid_argument if configuration is invalid
  pool_config_ = PoolConfigBuilder()
                     .with_database_url(database_url)
                     .with_max_connections(static_cast<int>(get_parameter("database.pool_size").as_int()))
                     .with_acquire_timeout(static_cast<int>(get_parameter("database.acquire_timeout_ms").as_int()))
                     .with_busy_timeout(static_cast<int>(get_parameter("database.busy_timeout_ms").as_int()))
                     .build();

  // Create parent directory if needed
  std::filesystem::path db_dir = std::filesystem::path(pool_config_.database_path).parent_path();
  if (!db_dir.empty() && !std::filesystem::exists(db_dir)) {
    std::error_code ec;
    std::filesystem::create_directories(db_dir, ec);
    if (ec) {
      throw std::runtime_error("Failed to create database directory " + db_dir.string() + ": " + ec.message());
    }
  }

  RCLCPP_INFO(get_logger(), "Configuration: REST API at %s:%d (%d workers), database %s (pool %d, timeout %dms)",
              server_host_.c_str(), server_port_, worker_threads_, pool_config_.database_path.c_str(),
              pool_config_.max_connections, pool_config_.acquire_timeout_ms);

  RCLCPP_INFO(get_logger(), "Connecting to database...");
  pool_ = std::make_unique<ConnectionPool>(pool_config_);
  counter_store_ = std::make_unique<SqliteCounterStore>(*pool_);

  RCLCPP_INFO(get_logger(), "Initializing database schema...");
  counter_store_->initialize_schema();

  rest_server_ = std::make_unique<RESTServer>(*counter_store_, server_host_, server_port_, worker_threads_);
  rest_server_->bind();
  start_rest_server();

  RCLCPP_INFO(get_logger(), "Visitor badge server ready on %s:%d", server_host_.c_str(), server_port_);
}

BadgeServerNode::~BadgeServerNode() {
  RCLCPP_INFO(get_logger(), "Shutting down visitor badge server...");
  stop_rest_server();
}

void BadgeServerNode::load_server_config() {
  server_host_ = get_parameter("server.host").as_string();
  server_port_ = static_cast<int>(get_parameter("server.port").as_int());
  worker_threads_ = static_cast<int>(get_parameter("server.worker_threads").as_int());

  std::string env_host = get_env(ENV_HOST);
  if (!env_host.empty()) {
    auto address = parse_bind_address(env_host);
    if (!address) {
      throw std::invalid_argument(std::string("Invalid ") + ENV_HOST + " value: " + address.error());
    }
    RCLCPP_INFO(get_logger(), "Using bind address from %s", ENV_HOST);
    server_host_ = address->host;
    server_port_ = address->port;
  }

  // Validate port range
  if (server_port_ < 1 || server_port_ > 65535) {
    RCLCPP_ERROR(get_logger(), "Invalid port %d. Must be between 1-65535. Using default 8080.", server_port_);
    server_port_ = 8080;
  }

  // Validate host
  if (server_host_.empty()) {
    RCLCPP_WARN(get_logger(), "Empty host specified. Using default 127.0.0.1");
    server_host_ = "127.0.0.1";
  }

  // Warn if binding to all interfaces
  if (server_host_ == "0.0.0.0" || server_host_ == "::") {
    RCLCPP_WARN(get_logger(), "Binding to %s - badge API accessible from ALL network interfaces!",
                server_host_.c_str());
  }

  if (worker_threads_ < 1 || worker_threads_ > 1024) {
    RCLCPP_WARN(get_logger(), "Invalid worker thread count %d. Must be between 1-1024. Using default 8.",
                worker_threads_);
    worker_threads_ = 8;
  }
}

void BadgeServerNode::start_rest_server() {
  server_thread_ = std::make_unique<std::thread>([this]() {
    {
      std::lock_guard<std::mutex> lock(server_mutex_);
      server_running_ = true;
      server_thread_started_ = true;
    }
    server_cv_.notify_all();

    try {
      rest_server_->start();
    } catch (const std::exception & e) {
      RCLCPP_ERROR(get_logger(), "REST server failed: %s", e.what());
    }

    {
      std::lock_guard<std::mutex> lock(server_mutex_);
      server_running_ = false;
    }
    server_cv_.notify_all();
  });

  // Wait for server thread to start
  std::unique_lock<std::mutex> lock(server_mutex_);
  server_cv_.wait(lock, [this] {
    return server_thread_started_;
  });
}

void BadgeServerNode::stop_rest_server() {
  if (!server_thread_ || !server_thread_->joinable()) {
    return;
  }

  // stop() is a no-op until the accept loop is entered, so repeat it until the thread reports exit
  {
    std::unique_lock<std::mutex> lock(server_mutex_);
    while (server_running_.load()) {
      rest_server_->stop();
      server_cv_.wait_for(lock, 50ms, [this] {
        return !server_running_.load();
      });
    }
  }
  server_thread_->join();
}

}  // namespace visitor_badge
