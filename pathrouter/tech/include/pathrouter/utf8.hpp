#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace pathrouter {

constexpr bool IsUtf8Continuation(char ch) noexcept { return (static_cast<unsigned char>(ch) & 0xC0U) == 0x80U; }

// Returns the number of bytes of the UTF-8 sequence introduced by 'lead', or 0 if 'lead'
// cannot start a sequence (continuation byte or invalid lead byte).
constexpr std::size_t Utf8SequenceLength(char lead) noexcept {
  const auto byte = static_cast<unsigned char>(lead);
  if (byte < 0x80U) {
    return 1U;
  }
  if (byte < 0xC2U) {
    return 0U;
  }
  if (byte < 0xE0U) {
    return 2U;
  }
  if (byte < 0xF0U) {
    return 3U;
  }
  if (byte < 0xF5U) {
    return 4U;
  }
  return 0U;
}

// Tells whether 'str' is well-formed UTF-8 (no overlong forms, no surrogates, nothing above U+10FFFF).
bool IsValidUtf8(std::string_view str) noexcept;

// Number of codepoints in 'str', which should be valid UTF-8.
constexpr std::size_t Utf8CodepointCount(std::string_view str) noexcept {
  std::size_t count = 0;
  for (char ch : str) {
    count += IsUtf8Continuation(ch) ? 0U : 1U;
  }
  return count;
}

// Returns the largest codepoint boundary of 'str' not greater than 'pos'.
// Prerequisite: pos <= str.size()
constexpr std::size_t Utf8FloorBoundary(std::string_view str, std::size_t pos) noexcept {
  while (pos != 0 && pos < str.size() && IsUtf8Continuation(str[pos])) {
    --pos;
  }
  return pos;
}

// Length of the longest common prefix of 'lhs' and 'rhs' that ends on a codepoint boundary
// of both strings. A multi-byte sequence shared only partially is never counted.
std::size_t Utf8CommonPrefixLength(std::string_view lhs, std::string_view rhs) noexcept;

// Packs the bytes of the first UTF-8 sequence of 'str' into an integer, usable as a lookup key.
// Truncated or invalid sequences produce keys that no complete sequence can produce.
// Prerequisite: str is not empty
uint32_t Utf8LeadKey(std::string_view str) noexcept;

}  // namespace pathrouter
