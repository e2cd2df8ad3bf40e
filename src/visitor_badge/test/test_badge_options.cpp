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

#include <gtest/gtest.h>

#include <map>
#include <string>

#include "visitor_badge/badge/badge_options.hpp"
#include "visitor_badge/badge/badge_style.hpp"
#include "visitor_badge/badge/color.hpp"
#include "visitor_badge/badge/text_metrics.hpp"

using namespace visitor_badge;

using Params = std::multimap<std::string, std::string>;

// =============================================================================
// Style parsing
// =============================================================================

TEST(BadgeStyleTest, ParsesKnownStyles) {
  EXPECT_EQ(parse_badge_style("flat"), BadgeStyle::FLAT);
  EXPECT_EQ(parse_badge_style("flat-square"), BadgeStyle::FLAT_SQUARE);
  EXPECT_EQ(parse_badge_style("plastic"), BadgeStyle::PLASTIC);
  EXPECT_EQ(parse_badge_style("for-the-badge"), BadgeStyle::FOR_THE_BADGE);
  EXPECT_EQ(parse_badge_style("social"), BadgeStyle::SOCIAL);
}

TEST(BadgeStyleTest, UnknownStyleFallsBackToFlat) {
  EXPECT_EQ(parse_badge_style(""), BadgeStyle::FLAT);
  EXPECT_EQ(parse_badge_style("bogus"), BadgeStyle::FLAT);
  EXPECT_EQ(parse_badge_style("FLAT-SQUARE"), BadgeStyle::FLAT);
}

TEST(BadgeStyleTest, ToStringMatchesParse) {
  for (auto style : {BadgeStyle::FLAT, BadgeStyle::FLAT_SQUARE, BadgeStyle::PLASTIC, BadgeStyle::FOR_THE_BADGE,
                     BadgeStyle::SOCIAL}) {
    EXPECT_EQ(parse_badge_style(badge_style_to_string(style)), style);
  }
}

// =============================================================================
// Query parameters -> BadgeOptions
// =============================================================================

TEST(BadgeOptionsTest, DefaultsWhenNoParams) {
  auto options = badge_options_from_params({});

  EXPECT_EQ(options.style, BadgeStyle::FLAT);
  EXPECT_EQ(options.label, "visitors");
  EXPECT_FALSE(options.logo.has_value());
  EXPECT_FALSE(options.logo_color.has_value());
  EXPECT_FALSE(options.label_color.has_value());
  EXPECT_FALSE(options.message_color.has_value());
}

TEST(BadgeOptionsTest, ReadsAllRecognizedParams) {
  Params params = {{"style", "plastic"},     {"label", "views"},   {"logo", "github"},
                   {"logoColor", "white"},   {"labelColor", "abc"}, {"color", "orange"},
                   {"unrelated", "ignored"}};

  auto options = badge_options_from_params(params);

  EXPECT_EQ(options.style, BadgeStyle::PLASTIC);
  EXPECT_EQ(options.label, "views");
  EXPECT_EQ(options.logo.value(), "github");
  EXPECT_EQ(options.logo_color.value(), "white");
  EXPECT_EQ(options.label_color.value(), "abc");
  EXPECT_EQ(options.message_color.value(), "orange");
}

TEST(BadgeOptionsTest, ColorTakesPrecedenceOverMessageColor) {
  Params params = {{"messageColor", "red"}, {"color", "blue"}};
  EXPECT_EQ(badge_options_from_params(params).message_color.value(), "blue");
}

TEST(BadgeOptionsTest, MessageColorUsedWhenColorAbsent) {
  Params params = {{"messageColor", "red"}};
  EXPECT_EQ(badge_options_from_params(params).message_color.value(), "red");
}

TEST(BadgeOptionsTest, UnknownStyleFallsBackToFlat) {
  Params params = {{"style", "neon"}};
  EXPECT_EQ(badge_options_from_params(params).style, BadgeStyle::FLAT);
}

TEST(BadgeOptionsTest, ExplicitEmptyLabelIsKept) {
  Params params = {{"label", ""}};
  EXPECT_EQ(badge_options_from_params(params).label, "");
}

TEST(BadgeOptionsTest, LastOccurrenceWins) {
  Params params;
  params.emplace("label", "first");
  params.emplace("label", "second");
  params.emplace("color", "red");
  params.emplace("messageColor", "green");
  params.emplace("color", "blue");

  auto options = badge_options_from_params(params);

  EXPECT_EQ(options.label, "second");
  EXPECT_EQ(options.message_color, "blue");
}

// =============================================================================
// Colors
// =============================================================================

TEST(ColorTest, NamedColorsAndAliases) {
  EXPECT_EQ(normalize_color("brightgreen", DEFAULT_MESSAGE_COLOR), "#4c1");
  EXPECT_EQ(normalize_color("success", DEFAULT_MESSAGE_COLOR), "#4c1");
  EXPECT_EQ(normalize_color("red", DEFAULT_MESSAGE_COLOR), "#e05d44");
  EXPECT_EQ(normalize_color("critical", DEFAULT_MESSAGE_COLOR), "#e05d44");
  EXPECT_EQ(normalize_color("gray", DEFAULT_MESSAGE_COLOR), "#555");
  EXPECT_EQ(normalize_color("lightgray", DEFAULT_MESSAGE_COLOR), "#9f9f9f");
  EXPECT_EQ(normalize_color("informational", DEFAULT_MESSAGE_COLOR), "#007ec6");
}

TEST(ColorTest, BareHexGetsPrefix) {
  EXPECT_EQ(normalize_color("abc", DEFAULT_MESSAGE_COLOR), "#abc");
  EXPECT_EQ(normalize_color("ff00aa", DEFAULT_MESSAGE_COLOR), "#ff00aa");
  EXPECT_EQ(normalize_color("ff00aa80", DEFAULT_MESSAGE_COLOR), "#ff00aa80");
}

TEST(ColorTest, OtherValuesPassThrough) {
  EXPECT_EQ(normalize_color("#123456", DEFAULT_MESSAGE_COLOR), "#123456");
  EXPECT_EQ(normalize_color("rebeccapurple", DEFAULT_MESSAGE_COLOR), "rebeccapurple");
  EXPECT_EQ(normalize_color("rgb(1,2,3)", DEFAULT_MESSAGE_COLOR), "rgb(1,2,3)");
  EXPECT_EQ(normalize_color("abcde", DEFAULT_MESSAGE_COLOR), "abcde");
}

TEST(ColorTest, EmptyUsesFallback) {
  EXPECT_EQ(normalize_color("", DEFAULT_LABEL_COLOR), "#555");
}

TEST(ColorTest, BrightnessSelectsTextColor) {
  EXPECT_TRUE(prefers_dark_text("#fff"));
  EXPECT_TRUE(prefers_dark_text("#eee"));
  EXPECT_FALSE(prefers_dark_text("#555"));
  EXPECT_FALSE(prefers_dark_text("#4c1"));
  // Non-hex colors keep light text
  EXPECT_FALSE(prefers_dark_text("white"));
  EXPECT_FALSE(color_brightness("white").has_value());
  EXPECT_DOUBLE_EQ(color_brightness("#000").value(), 0.0);
  EXPECT_DOUBLE_EQ(color_brightness("#ffffff").value(), 1.0);
}

// =============================================================================
// Text metrics
// =============================================================================

TEST(TextMetricsTest, PreferredWidthIsOdd) {
  EXPECT_EQ(preferred_width("1", BadgeFont::VERDANA_11), 7);
  EXPECT_EQ(preferred_width("visitors", BadgeFont::VERDANA_11), 41);
  for (const char * text : {"", "a", "12", "hello world", "for-the-badge"}) {
    EXPECT_EQ(preferred_width(text, BadgeFont::VERDANA_11) % 2, 1) << text;
  }
}

TEST(TextMetricsTest, WiderTextMeasuresWider) {
  EXPECT_GT(text_width("WWW", BadgeFont::VERDANA_11), text_width("iii", BadgeFont::VERDANA_11));
  EXPECT_GT(text_width("100", BadgeFont::VERDANA_11), text_width("10", BadgeFont::VERDANA_11));
}

TEST(TextMetricsTest, MultiByteCharactersCountOnce) {
  // "é" is two bytes in UTF-8
  EXPECT_EQ(utf8_length("caf\xC3\xA9"), 4u);
  EXPECT_DOUBLE_EQ(text_width("\xC3\xA9", BadgeFont::VERDANA_11), text_width("m", BadgeFont::VERDANA_11));
}
