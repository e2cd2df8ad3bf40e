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

#include <array>
#include <cstdint>
#include <string>
#include <tl/expected.hpp>

namespace visitor_badge {

/**
 * @brief 128-bit counter identifier.
 *
 * Generated server-side as a random (version 4) UUID. The canonical text form
 * is the lowercase hyphenated one ("xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx"),
 * which is also the form stored in the database.
 */
class Uuid {
 public:
  static constexpr size_t kSize = 16;

  /// Nil UUID (all zero bytes)
  Uuid() = default;

  explicit Uuid(const std::array<uint8_t, kSize> & bytes) : bytes_(bytes) {
  }

  /// Generate a random version 4 UUID.
  /// Uses a thread-local 64-bit Mersenne Twister seeded with 256 bits from std::random_device.
  static Uuid generate_v4();

  /**
   * @brief Parse a UUID from text
   *
   * Accepted forms (hex digits case-insensitive):
   * - hyphenated: "67e55044-10b1-426f-9247-bb680e5fe0c8"
   * - simple:     "67e5504410b1426f9247bb680e5fe0c8"
   * - braced:     "{67e55044-10b1-426f-9247-bb680e5fe0c8}"
   * - URN:        "urn:uuid:67e55044-10b1-426f-9247-bb680e5fe0c8"
   *
   * @return Parsed UUID, or an error message describing the first problem found
   */
  static tl::expected<Uuid, std::string> parse(const std::string & text);

  /// Lowercase hyphenated form
  std::string to_string() const;

  const std::array<uint8_t, kSize> & bytes() const {
    return bytes_;
  }

  /// Version nibble (4 for generated identifiers)
  int version() const {
    return bytes_[6] >> 4;
  }

  bool operator==(const Uuid & other) const {
    return bytes_ == other.bytes_;
  }

  bool operator!=(const Uuid & other) const {
    return bytes_ != other.bytes_;
  }

  bool operator<(const Uuid & other) const {
    return bytes_ < other.bytes_;
  }

 private:
  std::array<uint8_t, kSize> bytes_{};
};

}  // namespace visitor_badge
