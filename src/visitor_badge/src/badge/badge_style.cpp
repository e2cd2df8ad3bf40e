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

#include "visitor_badge/badge/badge_style.hpp"

namespace visitor_badge {

BadgeStyle parse_badge_style(const std::string & str) {
  if (str == "flat-square") {
    return BadgeStyle::FLAT_SQUARE;
  }
  if (str == "plastic") {
    return BadgeStyle::PLASTIC;
  }
  if (str == "for-the-badge") {
    return BadgeStyle::FOR_THE_BADGE;
  }
  if (str == "social") {
    return BadgeStyle::SOCIAL;
  }
  return BadgeStyle::FLAT;
}

std::string badge_style_to_string(BadgeStyle style) {
  switch (style) {
    case BadgeStyle::FLAT_SQUARE:
      return "flat-square";
    case BadgeStyle::PLASTIC:
      return "plastic";
    case BadgeStyle::FOR_THE_BADGE:
      return "for-the-badge";
    case BadgeStyle::SOCIAL:
      return "social";
    default:
      return "flat";
  }
}

}  // namespace visitor_badge
