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

#include "visitor_badge/badge/color.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace visitor_badge {

namespace {

// Brightness above which backgrounds get dark text (shields.io threshold)
constexpr double kDarkTextBrightness = 0.69;

const std::unordered_map<std::string, std::string> & named_colors() {
  static const std::unordered_map<std::string, std::string> colors = {
      {"brightgreen", "#4c1"},   {"green", "#97ca00"},   {"yellow", "#dfb317"},
      {"yellowgreen", "#a4a61d"}, {"orange", "#fe7d37"},  {"red", "#e05d44"},
      {"blue", "#007ec6"},       {"grey", "#555"},        {"lightgrey", "#9f9f9f"},
  };
  return colors;
}

const std::unordered_map<std::string, std::string> & color_aliases() {
  static const std::unordered_map<std::string, std::string> aliases = {
      {"gray", "grey"},        {"lightgray", "lightgrey"},   {"critical", "red"},
      {"important", "orange"}, {"success", "brightgreen"},   {"informational", "blue"},
      {"inactive", "lightgrey"},
  };
  return aliases;
}

bool is_hex_digits(const std::string & value) {
  return std::all_of(value.begin(), value.end(), [](unsigned char c) {
    return std::isxdigit(c) != 0;
  });
}

bool is_hex_length(size_t length) {
  return length == 3 || length == 4 || length == 6 || length == 8;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  return std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
}

}  // namespace

std::string normalize_color(const std::string & color, const std::string & fallback) {
  if (color.empty()) {
    return fallback;
  }

  std::string key = color;
  auto alias = color_aliases().find(key);
  if (alias != color_aliases().end()) {
    key = alias->second;
  }
  auto named = named_colors().find(key);
  if (named != named_colors().end()) {
    return named->second;
  }

  if (is_hex_length(color.size()) && is_hex_digits(color)) {
    return "#" + color;
  }
  return color;
}

std::optional<double> color_brightness(const std::string & color) {
  if (color.size() < 2 || color.front() != '#') {
    return std::nullopt;
  }
  std::string hex = color.substr(1);
  if (!is_hex_length(hex.size()) || !is_hex_digits(hex)) {
    return std::nullopt;
  }

  int r = 0;
  int g = 0;
  int b = 0;
  if (hex.size() <= 4) {
    // #rgb / #rgba: each digit is doubled
    r = hex_value(hex[0]) * 17;
    g = hex_value(hex[1]) * 17;
    b = hex_value(hex[2]) * 17;
  } else {
    r = hex_value(hex[0]) * 16 + hex_value(hex[1]);
    g = hex_value(hex[2]) * 16 + hex_value(hex[3]);
    b = hex_value(hex[4]) * 16 + hex_value(hex[5]);
  }
  return (r * 299 + g * 587 + b * 114) / 255000.0;
}

bool prefers_dark_text(const std::string & background) {
  auto brightness = color_brightness(background);
  return brightness && *brightness >= kDarkTextBrightness;
}

}  // namespace visitor_badge
