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

#include "visitor_badge/http/handlers/counter_handlers.hpp"
#include "visitor_badge/http/handlers/handler_context.hpp"
#include "visitor_badge/http/handlers/health_handlers.hpp"
#include "visitor_badge/http/http_server.hpp"
#include "visitor_badge/storage/counter_store.hpp"

namespace visitor_badge {

/**
 * @brief HTTP front end of the badge service.
 *
 * Routes:
 * - GET /health
 * - GET /      (create counter)
 * - GET /{id}  (increment and render badge)
 *
 * Request handling is delegated to handler classes sharing one HandlerContext.
 */
class RESTServer {
 public:
  /**
   * @param store Counter store; must outlive the server
   * @param host Bind host
   * @param port Bind port
   * @param worker_threads Size of the HTTP worker pool
   */
  RESTServer(CounterStore & store, const std::string & host, int port, int worker_threads);
  ~RESTServer();

  RESTServer(const RESTServer &) = delete;
  RESTServer & operator=(const RESTServer &) = delete;

  /// Bind the listening socket
  /// @throws std::runtime_error if the address cannot be bound
  void bind();

  /// Serve requests; blocks until stop() is called
  void start();
  void stop();

  bool is_running() const {
    return http_server_ && http_server_->is_running();
  }

 private:
  void setup_routes();

  std::string host_;
  int port_;

  std::unique_ptr<HttpServerManager> http_server_;

  std::unique_ptr<handlers::HandlerContext> handler_ctx_;
  std::unique_ptr<handlers::HealthHandlers> health_handlers_;
  std::unique_ptr<handlers::CounterHandlers> counter_handlers_;
};

}  // namespace visitor_badge
