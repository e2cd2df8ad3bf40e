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

#include "visitor_badge/http/http_server.hpp"

#include <rclcpp/rclcpp.hpp>
#include <stdexcept>

namespace visitor_badge {

HttpServerManager::HttpServerManager(int worker_threads) : worker_threads_(worker_threads) {
  if (worker_threads_ <= 0) {
    throw std::invalid_argument("worker_threads must be positive");
  }

  server_ = std::make_unique<httplib::Server>();

  const auto pool_size = static_cast<size_t>(worker_threads_);
  server_->new_task_queue = [pool_size] {
    return new httplib::ThreadPool(pool_size);
  };

  server_->set_logger([](const httplib::Request & req, const httplib::Response & res) {
    if (res.status >= 400) {
      RCLCPP_DEBUG(rclcpp::get_logger("http_server"), "Request %s %s -> %d", req.method.c_str(), req.path.c_str(),
                   res.status);
    }
  });
}

httplib::Server * HttpServerManager::get_server() {
  return server_.get();
}

bool HttpServerManager::bind(const std::string & host, int port) {
  RCLCPP_INFO(rclcpp::get_logger("http_server"), "Binding HTTP server to %s:%d...", host.c_str(), port);
  return server_ && server_->bind_to_port(host, port);
}

bool HttpServerManager::listen_after_bind() {
  if (!server_) {
    return false;
  }
  RCLCPP_INFO(rclcpp::get_logger("http_server"), "Starting HTTP server with %d worker threads...", worker_threads_);
  return server_->listen_after_bind();
}

void HttpServerManager::stop() {
  if (server_ && server_->is_running()) {
    RCLCPP_INFO(rclcpp::get_logger("http_server"), "Stopping HTTP server...");
    server_->stop();
  }
}

bool HttpServerManager::is_running() const {
  return server_ && server_->is_running();
}

}  // namespace visitor_badge
