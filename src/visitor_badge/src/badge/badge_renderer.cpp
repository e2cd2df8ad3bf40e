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

#include "visitor_badge/badge/badge_renderer.hpp"

#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

#include "visitor_badge/badge/color.hpp"
#include "visitor_badge/badge/text_metrics.hpp"

namespace visitor_badge {

namespace {

constexpr const char * kSimpleIconsCdn = "https://cdn.simpleicons.org/";
constexpr const char * kVerdanaFamily = "Verdana,Geneva,DejaVu Sans,sans-serif";
constexpr const char * kHelveticaFamily = "Helvetica Neue,Helvetica,Arial,sans-serif";
constexpr const char * kDefaultLogoColor = "whitesmoke";

constexpr int kLogoSize = 14;
constexpr int kLogoGap = 3;
constexpr int kHorizontalPadding = 5;

constexpr int kForTheBadgeHeight = 28;
constexpr int kForTheBadgePadding = 12;
constexpr int kForTheBadgeLogoX = 9;
constexpr int kForTheBadgeLogoGap = 6;
constexpr double kForTheBadgeLetterSpacing = 1.25;

constexpr int kSocialBubbleGap = 6;

/// Horizontal placement of one text run, in pixels
struct TextRun {
  std::string text;
  int start{0};
  int width{0};

  /// Centre in the 10x coordinate space used by the text elements
  int center_x10() const {
    return start * 10 + width * 5;
  }
};

/// Colors for text drawn over a background
struct TextPaint {
  const char * fill;
  const char * shadow;
};

TextPaint text_paint_for(const std::string & background) {
  if (prefers_dark_text(background)) {
    return {"#333", "#ccc"};
  }
  return {"#fff", "#010101"};
}

std::string url_encode(const std::string & value) {
  std::ostringstream out;
  out << std::uppercase << std::hex << std::setfill('0');
  for (char ch : value) {
    auto c = static_cast<unsigned char>(ch);
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out << ch;
    } else {
      out << '%' << std::setw(2) << static_cast<int>(c);
    }
  }
  return out.str();
}

std::string to_upper_ascii(const std::string & text) {
  std::string result = text;
  for (auto & ch : result) {
    ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
  }
  return result;
}

std::string capitalize_ascii(const std::string & text) {
  std::string result = text;
  if (!result.empty()) {
    result[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(result[0])));
  }
  return result;
}

std::string accessible_text(const std::string & label, const std::string & message) {
  return label.empty() ? message : label + ": " + message;
}

void open_svg(std::ostringstream & svg, int width, int height, const std::string & title) {
  const std::string escaped = BadgeRenderer::xml_escape(title);
  svg << R"(<svg xmlns="http://www.w3.org/2000/svg" xmlns:xlink="http://www.w3.org/1999/xlink" width=")" << width
      << R"(" height=")" << height << R"(" role="img" aria-label=")" << escaped << R"("><title>)" << escaped
      << "</title>";
}

void write_logo(std::ostringstream & svg, const std::optional<std::string> & href, int x, int y) {
  if (!href) {
    return;
  }
  svg << R"(<image x=")" << x << R"(" y=")" << y << R"(" width=")" << kLogoSize << R"(" height=")" << kLogoSize
      << R"(" xlink:href=")" << BadgeRenderer::xml_escape(*href) << R"("/>)";
}

/// Text drawn over an offset shadow copy (flat, plastic, social)
void write_shadowed_text(std::ostringstream & svg, const TextRun & run, int shadow_y, int text_y,
                         const TextPaint & paint, const char * shadow_opacity) {
  const std::string escaped = BadgeRenderer::xml_escape(run.text);
  svg << R"(<text aria-hidden="true" x=")" << run.center_x10() << R"(" y=")" << shadow_y << R"(" fill=")"
      << paint.shadow << R"(" fill-opacity=")" << shadow_opacity << R"svg(" transform="scale(.1)" textLength=")svg"
      << run.width * 10 << R"(">)" << escaped << "</text>";
  svg << R"(<text x=")" << run.center_x10() << R"(" y=")" << text_y << R"svg(" transform="scale(.1)" fill=")svg"
      << paint.fill << R"(" textLength=")" << run.width * 10 << R"(">)" << escaped << "</text>";
}

void write_plain_text(std::ostringstream & svg, const TextRun & run, int text_y, const TextPaint & paint,
                      const char * extra_attributes) {
  svg << R"(<text x=")" << run.center_x10() << R"(" y=")" << text_y << R"svg(" transform="scale(.1)" fill=")svg"
      << paint.fill << R"(" textLength=")" << run.width * 10 << '"' << extra_attributes << '>'
      << BadgeRenderer::xml_escape(run.text) << "</text>";
}

/// Label and message boxes shared by flat, flat-square and plastic
struct ClassicLayout {
  int left_width{0};
  int right_width{0};
  TextRun label;
  TextRun message;
  int logo_x{kHorizontalPadding};

  int total_width() const {
    return left_width + right_width;
  }
};

ClassicLayout layout_classic(const std::string & label, const std::string & message, bool has_logo) {
  ClassicLayout layout;
  const int logo_space = has_logo ? kLogoSize + kLogoGap : 0;

  layout.message.text = message;
  layout.message.width = preferred_width(message, BadgeFont::VERDANA_11);

  if (!label.empty()) {
    layout.label.text = label;
    layout.label.width = preferred_width(label, BadgeFont::VERDANA_11);
    layout.label.start = kHorizontalPadding + logo_space;
    layout.left_width = layout.label.start + layout.label.width + kHorizontalPadding;
    layout.message.start = layout.left_width + kHorizontalPadding;
    layout.right_width = layout.message.width + 2 * kHorizontalPadding;
  } else {
    // Without a label the logo moves into the message box
    layout.message.start = kHorizontalPadding + logo_space;
    layout.right_width = layout.message.start + layout.message.width + kHorizontalPadding;
  }
  return layout;
}

std::string render_classic(BadgeStyle style, const std::string & message, const BadgeOptions & options) {
  const bool plastic = style == BadgeStyle::PLASTIC;
  const bool square = style == BadgeStyle::FLAT_SQUARE;
  const int height = plastic ? 18 : 20;

  const std::string label_color = normalize_color(options.label_color.value_or(""), DEFAULT_LABEL_COLOR);
  const std::string message_color = normalize_color(options.message_color.value_or(""), DEFAULT_MESSAGE_COLOR);

  std::optional<std::string> logo;
  if (options.logo && !options.logo->empty()) {
    logo = BadgeRenderer::logo_href(*options.logo, options.logo_color, kDefaultLogoColor);
  }

  const ClassicLayout layout = layout_classic(options.label, message, logo.has_value());
  const int width = layout.total_width();

  std::ostringstream svg;
  open_svg(svg, width, height, accessible_text(options.label, message));

  if (square) {
    svg << R"(<g shape-rendering="crispEdges">)";
  } else {
    if (plastic) {
      svg << R"(<linearGradient id="s" x2="0" y2="100%"><stop offset="0" stop-color="#fff" stop-opacity=".7"/>)"
          << R"(<stop offset=".1" stop-color="#aaa" stop-opacity=".1"/><stop offset=".9" stop-color="#000" )"
          << R"(stop-opacity=".3"/><stop offset="1" stop-color="#000" stop-opacity=".5"/></linearGradient>)";
    } else {
      svg << R"(<linearGradient id="s" x2="0" y2="100%"><stop offset="0" stop-color="#bbb" stop-opacity=".1"/>)"
          << R"(<stop offset="1" stop-opacity=".1"/></linearGradient>)";
    }
    svg << R"(<clipPath id="r"><rect width=")" << width << R"(" height=")" << height << R"(" rx=")"
        << (plastic ? 4 : 3) << R"svg(" fill="#fff"/></clipPath><g clip-path="url(#r)">)svg";
  }

  if (layout.left_width > 0) {
    svg << R"(<rect width=")" << layout.left_width << R"(" height=")" << height << R"(" fill=")"
        << BadgeRenderer::xml_escape(label_color) << R"("/>)";
  }
  svg << R"(<rect x=")" << layout.left_width << R"(" width=")" << layout.right_width << R"(" height=")" << height
      << R"(" fill=")" << BadgeRenderer::xml_escape(message_color) << R"("/>)";
  if (!square) {
    svg << R"(<rect width=")" << width << R"(" height=")" << height << R"svg(" fill="url(#s)"/>)svg";
  }
  svg << "</g>";

  svg << R"(<g fill="#fff" text-anchor="middle" font-family=")" << kVerdanaFamily
      << R"(" text-rendering="geometricPrecision" font-size="110">)";
  write_logo(svg, logo, layout.logo_x, (height - kLogoSize) / 2);

  const int text_y = plastic ? 130 : 140;
  const int shadow_y = text_y + 10;
  if (!layout.label.text.empty()) {
    const TextPaint paint = text_paint_for(label_color);
    if (square) {
      write_plain_text(svg, layout.label, text_y, paint, "");
    } else {
      write_shadowed_text(svg, layout.label, shadow_y, text_y, paint, ".3");
    }
  }
  const TextPaint paint = text_paint_for(message_color);
  if (square) {
    write_plain_text(svg, layout.message, text_y, paint, "");
  } else {
    write_shadowed_text(svg, layout.message, shadow_y, text_y, paint, ".3");
  }

  svg << "</g></svg>";
  return svg.str();
}

int for_the_badge_width(const std::string & text) {
  const double spacing = kForTheBadgeLetterSpacing * static_cast<double>(utf8_length(text));
  return preferred_width(text, BadgeFont::VERDANA_BOLD_10) + static_cast<int>(std::lround(spacing));
}

std::string render_for_the_badge(const std::string & message, const BadgeOptions & options) {
  const int height = kForTheBadgeHeight;
  const std::string label_color = normalize_color(options.label_color.value_or(""), DEFAULT_LABEL_COLOR);
  const std::string message_color = normalize_color(options.message_color.value_or(""), DEFAULT_MESSAGE_COLOR);

  std::optional<std::string> logo;
  if (options.logo && !options.logo->empty()) {
    logo = BadgeRenderer::logo_href(*options.logo, options.logo_color, kDefaultLogoColor);
  }
  const int logo_end = logo ? kForTheBadgeLogoX + kLogoSize + kForTheBadgeLogoGap : 0;

  TextRun label{to_upper_ascii(options.label), 0, 0};
  TextRun value{to_upper_ascii(message), 0, 0};
  value.width = for_the_badge_width(value.text);

  int left_width = 0;
  if (!label.text.empty()) {
    label.width = for_the_badge_width(label.text);
    label.start = logo ? logo_end : kForTheBadgePadding;
    left_width = label.start + label.width + kForTheBadgePadding;
    value.start = left_width + kForTheBadgePadding;
  } else {
    value.start = logo ? logo_end : kForTheBadgePadding;
  }
  const int right_width = value.start - left_width + value.width + kForTheBadgePadding;
  const int width = left_width + right_width;

  std::ostringstream svg;
  open_svg(svg, width, height, accessible_text(options.label, message));

  svg << R"(<g shape-rendering="crispEdges">)";
  if (left_width > 0) {
    svg << R"(<rect width=")" << left_width << R"(" height=")" << height << R"(" fill=")"
        << BadgeRenderer::xml_escape(label_color) << R"("/>)";
  }
  svg << R"(<rect x=")" << left_width << R"(" width=")" << right_width << R"(" height=")" << height << R"(" fill=")"
      << BadgeRenderer::xml_escape(message_color) << R"("/></g>)";

  svg << R"(<g fill="#fff" text-anchor="middle" font-family=")" << kVerdanaFamily
      << R"(" text-rendering="geometricPrecision" font-size="100">)";
  write_logo(svg, logo, kForTheBadgeLogoX, (height - kLogoSize) / 2);
  if (!label.text.empty()) {
    write_plain_text(svg, label, 175, text_paint_for(label_color), R"( font-weight="bold")");
  }
  write_plain_text(svg, value, 175, text_paint_for(message_color), R"( font-weight="bold")");
  svg << "</g></svg>";
  return svg.str();
}

std::string render_social(const std::string & message, const BadgeOptions & options) {
  const int height = 20;

  std::optional<std::string> logo;
  if (options.logo && !options.logo->empty()) {
    logo = BadgeRenderer::logo_href(*options.logo, options.logo_color, "");
  }
  const int logo_space = logo ? kLogoSize + kLogoGap : 0;

  TextRun label{capitalize_ascii(options.label), 0, 0};
  TextRun value{message, 0, 0};
  value.width = preferred_width(value.text, BadgeFont::HELVETICA_BOLD_11);

  int left_width = 0;
  if (!label.text.empty()) {
    label.width = preferred_width(label.text, BadgeFont::HELVETICA_BOLD_11);
    label.start = kHorizontalPadding + logo_space;
    left_width = label.start + label.width + kHorizontalPadding;
  } else if (logo) {
    left_width = kHorizontalPadding + kLogoSize + kHorizontalPadding;
  }

  const bool has_left = left_width > 0;
  const int bubble_x = has_left ? left_width + kSocialBubbleGap : 0;
  const int bubble_width = value.width + 2 * kHorizontalPadding;
  value.start = bubble_x + kHorizontalPadding;
  const int width = bubble_x + bubble_width + 1;

  std::ostringstream svg;
  open_svg(svg, width, height, accessible_text(label.text, message));

  svg << R"(<style>a:hover #llink{fill:url(#b);stroke:#ccc}a:hover #rlink{fill:#4183c4}</style>)"
      << R"(<linearGradient id="a" x2="0" y2="100%"><stop offset="0" stop-color="#fcfcfc" stop-opacity="0"/>)"
      << R"(<stop offset="1" stop-opacity=".1"/></linearGradient>)"
      << R"(<linearGradient id="b" x2="0" y2="100%"><stop offset="0" stop-color="#ccc" stop-opacity=".1"/>)"
      << R"(<stop offset="1" stop-opacity=".1"/></linearGradient>)";

  svg << R"(<g stroke="#d5d5d5">)";
  if (has_left) {
    svg << R"(<rect stroke="none" fill="#fcfcfc" x=".5" y=".5" width=")" << left_width << R"(" height="19" rx="2"/>)";
  }
  svg << R"(<rect x=")" << bubble_x << R"(.5" y=".5" width=")" << bubble_width
      << R"(" height="19" rx="2" fill="#fafafa"/>)";
  if (has_left) {
    // Notch pointing from the bubble to the label box
    svg << R"(<rect x=")" << bubble_x - 1 << R"(" y="7.5" width=".5" height="5" stroke="#fafafa"/>)"
        << R"(<path d="M)" << bubble_x << R"(.5 6.5l-3 3v1l3 3" fill="#fafafa"/>)";
  }
  svg << "</g>";

  svg << R"(<g aria-hidden="true" fill="#333" text-anchor="middle" font-family=")" << kHelveticaFamily
      << R"(" text-rendering="geometricPrecision" font-weight="700" font-size="110px" line-height="14px">)";
  if (has_left) {
    svg << R"svg(<rect id="llink" stroke="#d5d5d5" fill="url(#a)" x=".5" y=".5" width=")svg" << left_width
        << R"(" height="19" rx="2"/>)";
  }
  write_logo(svg, logo, kHorizontalPadding, (height - kLogoSize) / 2);

  const TextPaint paint{"#333", "#fff"};
  if (!label.text.empty()) {
    write_shadowed_text(svg, label, 150, 140, paint, ".7");
  }
  write_shadowed_text(svg, value, 150, 140, paint, ".7");
  svg << "</g></svg>";
  return svg.str();
}

}  // namespace

std::string BadgeRenderer::render(const std::string & message, const BadgeOptions & options) {
  switch (options.style) {
    case BadgeStyle::FOR_THE_BADGE:
      return render_for_the_badge(message, options);
    case BadgeStyle::SOCIAL:
      return render_social(message, options);
    case BadgeStyle::FLAT_SQUARE:
    case BadgeStyle::PLASTIC:
      return render_classic(options.style, message, options);
    default:
      return render_classic(BadgeStyle::FLAT, message, options);
  }
}

std::string BadgeRenderer::logo_href(const std::string & logo, const std::optional<std::string> & logo_color,
                                     const std::string & default_color) {
  if (logo.compare(0, 5, "data:") == 0) {
    return logo;
  }

  std::string slug;
  for (char ch : logo) {
    slug.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  }

  std::string color = logo_color ? normalize_color(*logo_color, default_color) : default_color;
  if (!color.empty() && color.front() == '#') {
    color.erase(0, 1);
  }

  std::string href = kSimpleIconsCdn + url_encode(slug);
  if (!color.empty()) {
    href += "/" + url_encode(color);
  }
  return href;
}

std::string BadgeRenderer::xml_escape(const std::string & text) {
  std::string escaped;
  escaped.reserve(text.size());
  for (char ch : text) {
    switch (ch) {
      case '&':
        escaped += "&amp;";
        break;
      case '<':
        escaped += "&lt;";
        break;
      case '>':
        escaped += "&gt;";
        break;
      case '"':
        escaped += "&quot;";
        break;
      case '\'':
        escaped += "&apos;";
        break;
      default:
        escaped.push_back(ch);
        break;
    }
  }
  return escaped;
}

}  // namespace visitor_badge
