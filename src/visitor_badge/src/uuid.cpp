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

#include "visitor_badge/uuid.hpp"

#include <algorithm>
#include <functional>
#include <iomanip>
#include <random>
#include <sstream>

namespace visitor_badge {

namespace {

constexpr size_t kHyphenatedLength = 36;
constexpr size_t kSimpleLength = 32;
constexpr const char * kUrnPrefix = "urn:uuid:";

int hex_value(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

bool is_hyphen_position(size_t pos) {
  return pos == 8 || pos == 13 || pos == 18 || pos == 23;
}

constexpr size_t kSeedWords = 8;

// Seed with 256 bits so that separate generators do not replay the same stream
std::mt19937_64 make_seeded_engine() {
  std::random_device rd;
  std::array<std::random_device::result_type, kSeedWords> seed_words{};
  std::generate(seed_words.begin(), seed_words.end(), std::ref(rd));
  std::seed_seq seq(seed_words.begin(), seed_words.end());
  return std::mt19937_64(seq);
}

}  // namespace

Uuid Uuid::generate_v4() {
  thread_local std::mt19937_64 gen = make_seeded_engine();
  thread_local std::uniform_int_distribution<uint64_t> dis;

  uint64_t high = dis(gen);
  uint64_t low = dis(gen);

  std::array<uint8_t, kSize> bytes{};
  for (size_t i = 0; i < 8; ++i) {
    bytes[i] = static_cast<uint8_t>(high >> (56 - 8 * i));
    bytes[8 + i] = static_cast<uint8_t>(low >> (56 - 8 * i));
  }

  // RFC 4122: version 4, variant 10xx
  bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

  return Uuid(bytes);
}

tl::expected<Uuid, std::string> Uuid::parse(const std::string & text) {
  std::string body = text;

  if (body.size() > 2 && body.front() == '{' && body.back() == '}') {
    body = body.substr(1, body.size() - 2);
  } else if (body.compare(0, std::char_traits<char>::length(kUrnPrefix), kUrnPrefix) == 0) {
    body = body.substr(std::char_traits<char>::length(kUrnPrefix));
  }

  std::string digits;
  if (body.size() == kHyphenatedLength) {
    for (size_t i = 0; i < body.size(); ++i) {
      if (is_hyphen_position(i)) {
        if (body[i] != '-') {
          return tl::make_unexpected("invalid group separator at position " + std::to_string(i));
        }
        continue;
      }
      digits.push_back(body[i]);
    }
  } else if (body.size() == kSimpleLength) {
    digits = body;
  } else {
    return tl::make_unexpected("invalid length: expected 32 or 36 characters, found " +
                               std::to_string(body.size()));
  }

  std::array<uint8_t, kSize> bytes{};
  for (size_t i = 0; i < kSize; ++i) {
    int hi = hex_value(digits[2 * i]);
    int lo = hex_value(digits[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      return tl::make_unexpected("invalid character: expected a hex digit");
    }
    bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
  }

  return Uuid(bytes);
}

std::string Uuid::to_string() const {
  std::ostringstream ss;
  ss << std::hex << std::setfill('0');
  for (size_t i = 0; i < kSize; ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      ss << '-';
    }
    ss << std::setw(2) << static_cast<int>(bytes_[i]);
  }
  return ss.str();
}

}  // namespace visitor_badge
