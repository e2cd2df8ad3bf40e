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

#include "visitor_badge/http/rest_server.hpp"

#include <rclcpp/rclcpp.hpp>
#include <stdexcept>

#include "visitor_badge/http/http_utils.hpp"

namespace visitor_badge {

RESTServer::RESTServer(CounterStore & store, const std::string & host, int port, int worker_threads)
  : host_(host), port_(port) {
  http_server_ = std::make_unique<HttpServerManager>(worker_threads);

  handler_ctx_ = std::make_unique<handlers::HandlerContext>(store);
  health_handlers_ = std::make_unique<handlers::HealthHandlers>(*handler_ctx_);
  counter_handlers_ = std::make_unique<handlers::CounterHandlers>(*handler_ctx_);

  setup_routes();
}

RESTServer::~RESTServer() {
  stop();
}

void RESTServer::setup_routes() {
  httplib::Server * srv = http_server_->get_server();
  if (!srv) {
    throw std::runtime_error("No server instance available for route setup");
  }

  // Health check; registered ahead of the id route so it is never parsed as an id
  srv->Get("/health", [this](const httplib::Request & req, httplib::Response & res) {
    health_handlers_->handle_health(req, res);
  });

  srv->Get("/", [this](const httplib::Request & req, httplib::Response & res) {
    counter_handlers_->handle_create_counter(req, res);
  });

  srv->Get(BADGE_ROUTE_PATTERN, [this](const httplib::Request & req, httplib::Response & res) {
    counter_handlers_->handle_badge(req, res);
  });
}

void RESTServer::bind() {
  if (!http_server_->bind(host_, port_)) {
    throw std::runtime_error("Failed to bind HTTP server to " + host_ + ":" + std::to_string(port_));
  }
}

void RESTServer::start() {
  if (!http_server_->listen_after_bind()) {
    RCLCPP_ERROR(rclcpp::get_logger("rest_server"), "HTTP server on %s:%d stopped with an error", host_.c_str(),
                 port_);
  }
}

void RESTServer::stop() {
  if (http_server_) {
    http_server_->stop();
  }
}

}  // namespace visitor_badge
