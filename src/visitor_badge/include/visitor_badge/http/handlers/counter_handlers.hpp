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

#include "visitor_badge/http/handlers/handler_context.hpp"

namespace visitor_badge {
namespace handlers {

/**
 * @brief Counter endpoint handlers
 *
 * Handles:
 * - GET / - Create a counter and return onboarding text with its id
 * - GET /{id} - Increment the counter and return it rendered as an SVG badge
 */
class CounterHandlers {
 public:
  explicit CounterHandlers(HandlerContext & ctx) : ctx_(ctx) {
  }

  /// GET / - Allocate a new counter
  void handle_create_counter(const httplib::Request & req, httplib::Response & res);

  /**
   * @brief GET /{id} - Count a visit and render the badge
   *
   * Responses:
   * - 200 image/svg+xml with the new count
   * - 400 when the path segment is not a UUID (the store is not touched)
   * - 404 "UUID not found" when no counter exists for the id
   * - 500 with the error text when the store fails
   */
  void handle_badge(const httplib::Request & req, httplib::Response & res);

 private:
  HandlerContext & ctx_;
};

}  // namespace handlers
}  // namespace visitor_badge
