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

#include "visitor_badge/badge/text_metrics.hpp"

#include <array>
#include <cmath>

namespace visitor_badge {

namespace {

constexpr double kUnitsPerEm = 2048.0;
constexpr double kBoldFactor = 1.1;
constexpr double kHelveticaFactor = 0.92;

// Verdana advance widths in font units, code points 0x20..0x7E
constexpr std::array<int, 95> kVerdanaAdvance = {
    720,  805,  934,  1837, 1433, 2489, 1643, 548,  895,  895,   // ' ' .. ')'
    1433, 1837, 733,  1042, 733,  1042, 1303, 1303, 1303, 1303,  // '*' .. '3'
    1303, 1303, 1303, 1303, 1303, 1303, 895,  895,  1837, 1837,  // '4' .. '='
    1837, 1117, 2048, 1401, 1405, 1430, 1577, 1294, 1178, 1583,  // '>' .. 'G'
    1540, 862,  931,  1418, 1141, 1729, 1532, 1612, 1235, 1612,  // 'H' .. 'Q'
    1424, 1401, 1262, 1499, 1401, 2025, 1403, 1259, 1403, 895,   // 'R' .. '['
    1042, 895,  1837, 1303, 1303, 1229, 1270, 1065, 1270, 1219,  // '\' .. 'e'
    720,  1270, 1298, 562,  684,  1186, 562,  1995, 1298, 1240,  // 'f' .. 'o'
    1270, 1270, 874,  1063, 807,  1298, 1186, 1675, 1186, 1186,  // 'p' .. 'y'
    1071, 1300, 895,  1300, 1837,                                // 'z' .. '~'
};

constexpr int kFallbackAdvance = 1995;  // 'm'

double font_size(BadgeFont font) {
  return font == BadgeFont::VERDANA_BOLD_10 ? 10.0 : 11.0;
}

double font_factor(BadgeFont font) {
  switch (font) {
    case BadgeFont::VERDANA_BOLD_10:
      return kBoldFactor;
    case BadgeFont::HELVETICA_BOLD_11:
      return kHelveticaFactor;
    default:
      return 1.0;
  }
}

bool is_continuation_byte(unsigned char c) {
  return (c & 0xC0) == 0x80;
}

}  // namespace

double text_width(const std::string & text, BadgeFont font) {
  long units = 0;
  for (char ch : text) {
    auto c = static_cast<unsigned char>(ch);
    if (is_continuation_byte(c)) {
      continue;
    }
    if (c >= 0x20 && c <= 0x7E) {
      units += kVerdanaAdvance[c - 0x20];
    } else {
      units += kFallbackAdvance;
    }
  }
  return static_cast<double>(units) / kUnitsPerEm * font_size(font) * font_factor(font);
}

int preferred_width(const std::string & text, BadgeFont font) {
  auto width = static_cast<int>(std::ceil(text_width(text, font)));
  return width % 2 == 0 ? width + 1 : width;
}

size_t utf8_length(const std::string & text) {
  size_t count = 0;
  for (char ch : text) {
    if (!is_continuation_byte(static_cast<unsigned char>(ch))) {
      ++count;
    }
  }
  return count;
}

}  // namespace visitor_badge
