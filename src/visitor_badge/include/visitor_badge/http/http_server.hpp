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

#include <httplib.h>

#include <memory>
#include <string>

namespace visitor_badge {

/**
 * @brief Owns the cpp-httplib server instance
 *
 * Configures the worker thread pool and the request logger, and wraps
 * listen/stop so callers never touch the raw server lifecycle.
 */
class HttpServerManager {
 public:
  /**
   * @brief Construct HTTP server manager
   * @param worker_threads Size of the request worker pool
   * @throws std::invalid_argument if worker_threads is not positive
   */
  explicit HttpServerManager(int worker_threads);

  ~HttpServerManager() = default;

  // Non-copyable
  HttpServerManager(const HttpServerManager &) = delete;
  HttpServerManager & operator=(const HttpServerManager &) = delete;

  // Movable
  HttpServerManager(HttpServerManager &&) = default;
  HttpServerManager & operator=(HttpServerManager &&) = default;

  /**
   * @brief Get pointer to the server instance for route registration
   */
  httplib::Server * get_server();

  /**
   * @brief Bind the listening socket without accepting connections yet
   * @param host Host address to bind to
   * @param port Port number to bind to
   * @return false if the socket could not be bound
   */
  bool bind(const std::string & host, int port);

  /**
   * @brief Accept and serve connections on the bound socket until stop() is called
   * @return false if the accept loop ended with an error
   */
  bool listen_after_bind();

  /**
   * @brief Stop the server if running
   */
  void stop();

  /**
   * @brief Check if server is currently running
   */
  bool is_running() const;

  int worker_threads() const {
    return worker_threads_;
  }

 private:
  int worker_threads_;
  std::unique_ptr<httplib::Server> server_;
};

}  // namespace visitor_badge
