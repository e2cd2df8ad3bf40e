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
 * @brief Fonts used by the badge styles
 */
enum class BadgeFont {
  VERDANA_11,         ///< flat, flat-square, plastic
  VERDANA_BOLD_10,    ///< for-the-badge
  HELVETICA_BOLD_11,  ///< social
};

/**
 * @brief Estimated rendered width of text in pixels
 *
 * Uses Verdana advance widths for printable ASCII. Characters outside that
 * range are measured as 'm'. Bold and Helvetica widths are derived from the
 * Verdana table by a constant factor. UTF-8 input is measured per code point.
 */
double text_width(const std::string & text, BadgeFont font);

/// Width rounded up to the next odd integer, so centred text lands on half pixels
int preferred_width(const std::string & text, BadgeFont font);

/// Number of UTF-8 code points in text
size_t utf8_length(const std::string & text);

}  // namespace visitor_badge
