#include "pathrouter/utf8.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace pathrouter {

bool IsValidUtf8(std::string_view str) noexcept {
  for (std::size_t pos = 0; pos < str.size();) {
    const std::size_t len = Utf8SequenceLength(str[pos]);
    if (len == 0 || pos + len > str.size()) {
      return false;
    }
    const auto lead = static_cast<unsigned char>(str[pos]);
    for (std::size_t idx = 1; idx < len; ++idx) {
      if (!IsUtf8Continuation(str[pos + idx])) {
        return false;
      }
    }
    if (len > 2U) {
      // Second byte restrictions rule out overlong forms, surrogates and values above U+10FFFF.
      const auto second = static_cast<unsigned char>(str[pos + 1]);
      if ((lead == 0xE0U && second < 0xA0U) || (lead == 0xEDU && second > 0x9FU) ||
          (lead == 0xF0U && second < 0x90U) || (lead == 0xF4U && second > 0x8FU)) {
        return false;
      }
    }
    pos += len;
  }
  return true;
}

std::size_t Utf8CommonPrefixLength(std::string_view lhs, std::string_view rhs) noexcept {
  const auto [lhsIt, rhsIt] = std::ranges::mismatch(lhs, rhs);
  const auto mismatchPos = static_cast<std::size_t>(lhsIt - lhs.begin());
  // Both strings hold identical bytes before mismatchPos, so a boundary of one is a boundary of the other,
  // except at the mismatch position itself where each string may continue differently.
  return std::min(Utf8FloorBoundary(lhs, mismatchPos), Utf8FloorBoundary(rhs, mismatchPos));
}

uint32_t Utf8LeadKey(std::string_view str) noexcept {
  std::size_t len = Utf8SequenceLength(str.front());
  if (len == 0) {
    len = 1U;
  }
  len = std::min(len, str.size());
  uint32_t key = 0;
  for (std::size_t idx = 0; idx < len; ++idx) {
    key = (key << 8U) | static_cast<unsigned char>(str[idx]);
  }
  return key;
}

}  // namespace pathrouter
