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

#include <nlohmann/json.hpp>
#include <rclcpp/rclcpp.hpp>
#include <string>

#include "visitor_badge/storage/counter_store.hpp"

namespace visitor_badge {
namespace handlers {

/**
 * @brief Shared context for all HTTP handlers
 *
 * Gives handlers access to the counter store and the response helpers
 * used to produce every terminal response.
 */
class HandlerContext {
 public:
  explicit HandlerContext(CounterStore & store) : store_(store) {
  }

  /// Get counter store
  CounterStore & store() const {
    return store_;
  }

  /**
   * @brief Send a plain-text response
   * @param res HTTP response to fill
   * @param status HTTP status code
   * @param body Response body
   */
  static void send_text(httplib::Response & res, httplib::StatusCode status, const std::string & body);

  /**
   * @brief Send a JSON response with status 200
   */
  static void send_json(httplib::Response & res, const nlohmann::json & data);

  /**
   * @brief Get logger for handlers
   */
  static rclcpp::Logger logger() {
    return rclcpp::get_logger("rest_server");
  }

 private:
  CounterStore & store_;
};

}  // namespace handlers
}  // namespace visitor_badge
