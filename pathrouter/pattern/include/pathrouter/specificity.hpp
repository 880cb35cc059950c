#pragma once

#include <compare>
#include <cstdint>

namespace pathrouter {

// Ranking key of a path pattern. Greater means more specific:
//   - fewer variables is more specific,
//   - with equal variable counts, more literal codepoints is more specific.
struct Specificity {
  constexpr std::strong_ordering operator<=>(const Specificity& other) const noexcept {
    if (variableCount != other.variableCount) {
      return other.variableCount <=> variableCount;
    }
    return literalCharCount <=> other.literalCharCount;
  }

  constexpr bool operator==(const Specificity&) const noexcept = default;

  uint32_t variableCount{};
  uint32_t literalCharCount{};
};

}  // namespace pathrouter
