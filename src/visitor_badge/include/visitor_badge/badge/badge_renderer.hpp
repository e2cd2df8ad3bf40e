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

#include "visitor_badge/badge/badge_options.hpp"

namespace visitor_badge {

/// MIME type of rendered badges
constexpr const char * SVG_CONTENT_TYPE = "image/svg+xml";

/**
 * @brief Renders shields.io-style SVG badges
 *
 * Stateless; render() is a pure function of its arguments and produces
 * byte-identical output for identical input.
 *
 * Layout follows the shields.io badge-maker templates: a label segment on the
 * left, the message segment on the right, text measured with Verdana metrics
 * and drawn at 10x scale. Color and logo values are not validated: unknown
 * colors are passed through to the SVG, unknown logo names are referenced as
 * simple-icons slugs.
 */
class BadgeRenderer {
 public:
  /**
   * @brief Render a complete SVG document
   * @param message Right-hand text (the visitor count)
   * @param options Style, label, colors and logo
   * @return SVG document text
   */
  static std::string render(const std::string & message, const BadgeOptions & options);

  /**
   * @brief Resolve the image reference used for a logo
   *
   * "data:" URIs are used unchanged. Anything else is treated as a
   * simple-icons slug: "https://cdn.simpleicons.org/<slug>[/<color>]".
   *
   * @note Browsers do not fetch external resources for an SVG displayed through
   * an <img> element (the way README badges are embedded), so a slug logo only
   * shows when the SVG is opened directly or inlined. Pass a "data:" URI for a
   * logo that renders everywhere.
   *
   * @param logo Logo parameter value
   * @param logo_color Logo color parameter, if any
   * @param default_color Color used when logo_color is unset (empty for the brand color)
   */
  static std::string logo_href(const std::string & logo, const std::optional<std::string> & logo_color,
                               const std::string & default_color);

  /// Escape text for use in XML character data and attribute values
  static std::string xml_escape(const std::string & text);
};

}  // namespace visitor_badge
