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

/**
 * @brief Visual badge layouts (shields.io styles)
 */
enum class BadgeStyle {
  FLAT,           ///< Default, rounded corners with a subtle gradient
  FLAT_SQUARE,    ///< Square corners, no gradient
  PLASTIC,        ///< Shorter, glossy gradient
  FOR_THE_BADGE,  ///< Tall, upper-case bold text
  SOCIAL          ///< GitHub-like button with a count bubble
};

/**
 * @brief Parse BadgeStyle from string
 * @param str Style string: "flat", "flat-square", "plastic", "for-the-badge" or "social"
 * @return Parsed style (defaults to FLAT for empty or unrecognized input)
 */
BadgeStyle parse_badge_style(const std::string & str);

/**
 * @brief Convert BadgeStyle to string
 * @param style Badge style
 * @return String representation as accepted by parse_badge_style()
 */
std::string badge_style_to_string(BadgeStyle style);

}  // namespace visitor_badge
