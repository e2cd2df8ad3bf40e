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

#include <map>
#include <optional>
#include <string>

#include "visitor_badge/badge/badge_style.hpp"

namespace visitor_badge {

/// Label used when the request does not supply one
constexpr const char * DEFAULT_BADGE_LABEL = "visitors";

/// Query parameter names understood by the badge endpoint
constexpr const char * PARAM_STYLE = "style";
constexpr const char * PARAM_LABEL = "label";
constexpr const char * PARAM_LOGO = "logo";
constexpr const char * PARAM_LOGO_COLOR = "logoColor";
constexpr const char * PARAM_LABEL_COLOR = "labelColor";
constexpr const char * PARAM_COLOR = "color";
constexpr const char * PARAM_MESSAGE_COLOR = "messageColor";

/**
 * @brief Visual options for one badge
 *
 * Unset optionals mean "use the renderer default". Color and logo strings are
 * kept verbatim; the renderer decides how to interpret them.
 */
struct BadgeOptions {
  BadgeStyle style{BadgeStyle::FLAT};
  std::string label{DEFAULT_BADGE_LABEL};
  std::optional<std::string> logo;
  std::optional<std::string> logo_color;
  std::optional<std::string> label_color;
  std::optional<std::string> message_color;
};

/**
 * @brief Build BadgeOptions from query parameters
 *
 * - style: parsed with parse_badge_style(), unrecognized values fall back to flat
 * - label: defaults to DEFAULT_BADGE_LABEL when absent (an explicit empty label is kept)
 * - color takes precedence over its alias messageColor
 * - other parameters are ignored
 *
 * When a parameter is repeated, the last occurrence is used.
 *
 * @param params Decoded query parameters (same layout as httplib::Params)
 */
BadgeOptions badge_options_from_params(const std::multimap<std::string, std::string> & params);

}  // namespace visitor_badge
