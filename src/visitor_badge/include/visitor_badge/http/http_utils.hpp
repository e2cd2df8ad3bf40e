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

#include <string>

namespace visitor_badge {

constexpr const char * TEXT_CONTENT_TYPE = "text/plain; charset=utf-8";
constexpr const char * JSON_CONTENT_TYPE = "application/json";

/// Body of the 404 response for identifiers with no counter
constexpr const char * NOT_FOUND_MESSAGE = "UUID not found";

/// Route pattern for the badge endpoint; the single path segment is the counter id
constexpr const char * BADGE_ROUTE_PATTERN = R"(/([^/]+))";

/**
 * @brief Onboarding text returned when a new counter is created
 * @param id Canonical string form of the new identifier
 */
inline std::string onboarding_message(const std::string & id) {
  return "Welcome! This is a simple API for generating visitor count badges using shields.io.\n"
         "\n"
         "Your new unique ID is: " +
         id +
         "\n"
         "To begin tracking, visit: /" +
         id +
         "\n"
         "\n"
         "You can customize the badge appearance using any of the query parameters supported by shields.io static "
         "badges:\n"
         "https://shields.io/badges/static-badge\n"
         "\n"
         "Note: Only query parameters are supported.\n"
         "      `logoSize`, `cacheSeconds`, and `link` are not supported.\n"
         "      The default value for label is \"visitors\"";
}

}  // namespace visitor_badge
