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

#include <optional>
#include <string>

namespace visitor_badge {

constexpr const char * DEFAULT_LABEL_COLOR = "#555";
constexpr const char * DEFAULT_MESSAGE_COLOR = "#4c1";

/**
 * @brief Resolve a user-supplied color to an SVG paint value
 *
 * - shields.io names ("brightgreen", "red", ...) and their aliases
 *   ("success", "critical", "gray", ...) map to fixed hex values
 * - bare hex with 3, 4, 6 or 8 digits gets a '#' prefix
 * - anything else is returned unchanged (CSS names, rgb(), or garbage)
 *
 * @param color Color as given in the query string
 * @param fallback Value used when color is empty
 */
std::string normalize_color(const std::string & color, const std::string & fallback);

/**
 * @brief Perceived brightness (0..1) of a "#rgb[a]" / "#rrggbb[aa]" color
 * @return Brightness, or nullopt when color is not in hex notation
 */
std::optional<double> color_brightness(const std::string & color);

/// True if dark text should be drawn on this background
bool prefers_dark_text(const std::string & background);

}  // namespace visitor_badge
