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

#include "visitor_badge/badge/badge_options.hpp"

#include <iterator>

namespace visitor_badge {

namespace {

// Repeated keys resolve to the last occurrence
std::optional<std::string> last_value(const std::multimap<std::string, std::string> & params, const char * key) {
  auto range = params.equal_range(key);
  if (range.first == range.second) {
    return std::nullopt;
  }
  return std::prev(range.second)->second;
}

}  // namespace

BadgeOptions badge_options_from_params(const std::multimap<std::string, std::string> & params) {
  BadgeOptions options;

  if (auto style = last_value(params, PARAM_STYLE)) {
    options.style = parse_badge_style(*style);
  }
  if (auto label = last_value(params, PARAM_LABEL)) {
    options.label = *label;
  }

  options.logo = last_value(params, PARAM_LOGO);
  options.logo_color = last_value(params, PARAM_LOGO_COLOR);
  options.label_color = last_value(params, PARAM_LABEL_COLOR);

  options.message_color = last_value(params, PARAM_COLOR);
  if (!options.message_color) {
    options.message_color = last_value(params, PARAM_MESSAGE_COLOR);
  }

  return options;
}

}  // namespace visitor_badge
