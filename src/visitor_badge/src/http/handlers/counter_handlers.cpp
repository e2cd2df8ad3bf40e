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

#include "visitor_badge/http/handlers/counter_handlers.hpp"

#include <string>

#include "visitor_badge/badge/badge_options.hpp"
#include "visitor_badge/badge/badge_renderer.hpp"
#include "visitor_badge/http/http_utils.hpp"
#include "visitor_badge/uuid.hpp"

using httplib::StatusCode;

namespace visitor_badge {
namespace handlers {

void CounterHandlers::handle_create_counter(const httplib::Request & req, httplib::Response & res) {
  (void)req;  // Unused parameter

  try {
    auto id = ctx_.store().create_counter();
    RCLCPP_INFO(HandlerContext::logger(), "Created counter %s", id.to_string().c_str());
    HandlerContext::send_text(res, StatusCode::OK_200, onboarding_message(id.to_string()));
  } catch (const StorageError & e) {
    RCLCPP_ERROR(HandlerContext::logger(), "Failed to create counter: %s", e.what());
    HandlerContext::send_text(res, StatusCode::InternalServerError_500, e.what());
  } catch (const std::exception & e) {
    RCLCPP_ERROR(HandlerContext::logger(), "Error in handle_create_counter: %s", e.what());
    HandlerContext::send_text(res, StatusCode::InternalServerError_500, e.what());
  }
}

void CounterHandlers::handle_badge(const httplib::Request & req, httplib::Response & res) {
  if (req.matches.size() < 2) {
    HandlerContext::send_text(res, StatusCode::BadRequest_400, "Invalid request");
    return;
  }

  const std::string raw_id = req.matches[1];
  auto id = Uuid::parse(raw_id);
  if (!id) {
    HandlerContext::send_text(res, StatusCode::BadRequest_400, "Invalid UUID: " + id.error());
    return;
  }

  try {
    auto count = ctx_.store().increment_and_get(*id);
    if (!count) {
      HandlerContext::send_text(res, StatusCode::NotFound_404, NOT_FOUND_MESSAGE);
      return;
    }

    auto options = badge_options_from_params(req.params);
    RCLCPP_DEBUG(HandlerContext::logger(), "Rendering %s badge for %s (count %lld)",
                 badge_style_to_string(options.style).c_str(), id->to_string().c_str(), static_cast<long long>(*count));
    res.status = StatusCode::OK_200;
    res.set_content(BadgeRenderer::render(std::to_string(*count), options), SVG_CONTENT_TYPE);
  } catch (const StorageError & e) {
    RCLCPP_ERROR(HandlerContext::logger(), "Failed to increment counter %s: %s", id->to_string().c_str(), e.what());
    HandlerContext::send_text(res, StatusCode::InternalServerError_500, e.what());
  } catch (const std::exception & e) {
    RCLCPP_ERROR(HandlerContext::logger(), "Error in handle_badge for %s: %s", raw_id.c_str(), e.what());
    HandlerContext::send_text(res, StatusCode::InternalServerError_500, e.what());
  }
}

}  // namespace handlers
}  // namespace visitor_badge
