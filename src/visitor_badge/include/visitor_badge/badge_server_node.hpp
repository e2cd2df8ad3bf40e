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

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <rclcpp/rclcpp.hpp>
#include <string>
#include <thread>

#include "visitor_badge/config.hpp"
#include "visitor_badge/http/rest_server.hpp"
#include "visitor_badge/storage/connection_pool.hpp"
#include "visitor_badge/storage/sqlite_counter_store.hpp"

namespace visitor_badge {

/**
 * @brief Node hosting the visitor badge HTTP service
 *
 * On construction the node reads its parameters (with DATABASE_URL and HOST
 * environment overrides), opens the connection pool, creates the counts
 * table and starts the REST server on a dedicated thread. Any failure along
 * the way propagates out of the constructor.
 */
class BadgeServerNode : public rclcpp::Node {
 public:
  explicit BadgeServerNode(const rclcpp::NodeOptions & options = rclcpp::NodeOptions());
  ~BadgeServerNode() override;

  BadgeServerNode(const BadgeServerNode &) = delete;
  BadgeServerNode & operator=(const BadgeServerNode &) = delete;

 private:
  void load_server_config();
  void start_rest_server();
  void stop_rest_server();

  std::string server_host_;
  int server_port_{8080};
  int worker_threads_{8};
  PoolConfig pool_config_;

  std::unique_ptr<ConnectionPool> pool_;
  std::unique_ptr<SqliteCounterStore> counter_store_;
  std::unique_ptr<RESTServer> rest_server_;

  std::unique_ptr<std::thread> server_thread_;
  std::atomic<bool> server_running_{false};
  bool server_thread_started_{false};
  std::mutex server_mutex_;
  std::condition_variable server_cv_;
};

}  // namespace visitor_badge
