#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

namespace pathrouter {

// Set of endpoint positions (in ranked order) whose matcher needs to be evaluated for one path.
// Iterating with next() yields positions in increasing order, which is the ranking order.
// Up to 64 positions are stored inline, without allocation.
class CandidateSet {
 public:
  static constexpr uint32_t kEnd = std::numeric_limits<uint32_t>::max();

  explicit CandidateSet(uint32_t capacity) { reset(capacity); }

  // Empties the set and sets its capacity. Storage grown by a previous reset is kept, so a set reused for
  // the same capacity does not allocate.
  void reset(uint32_t capacity) {
    _words.assign(capacity > kBitsPerWord ? ((capacity + kBitsPerWord - 1U) / kBitsPerWord) : 0U, 0);
    _inlineWord = 0;
    _capacity = capacity;
  }

  // Prerequisite: pos < capacity
  void set(uint32_t pos) noexcept { word(pos / kBitsPerWord) |= uint64_t{1} << (pos % kBitsPerWord); }

  [[nodiscard]] bool contains(uint32_t pos) const noexcept {
    return pos < _capacity && ((word(pos / kBitsPerWord) >> (pos % kBitsPerWord)) & 1U) != 0;
  }

  // Returns the smallest position >= 'from' in the set, or kEnd.
  [[nodiscard]] uint32_t next(uint32_t from) const noexcept {
    if (from >= _capacity) {
      return kEnd;
    }
    const uint32_t nbWords = wordCount();
    uint32_t wordPos = from / kBitsPerWord;
    uint64_t bits = word(wordPos) & (~uint64_t{0} << (from % kBitsPerWord));
    while (bits == 0) {
      if (++wordPos == nbWords) {
        return kEnd;
      }
      bits = word(wordPos);
    }
    return (wordPos * kBitsPerWord) + static_cast<uint32_t>(std::countr_zero(bits));
  }

  [[nodiscard]] bool empty() const noexcept { return next(0) == kEnd; }

  [[nodiscard]] uint32_t capacity() const noexcept { return _capacity; }

 private:
  static constexpr uint32_t kBitsPerWord = 64;

  [[nodiscard]] uint32_t wordCount() const noexcept {
    return _words.empty() ? 1U : static_cast<uint32_t>(_words.size());
  }

  uint64_t& word(uint32_t wordPos) noexcept { return _words.empty() ? _inlineWord : _words[wordPos]; }
  [[nodiscard]] uint64_t word(uint32_t wordPos) const noexcept {
    return _words.empty() ? _inlineWord : _words[wordPos];
  }

  std::vector<uint64_t> _words;  // used above 64 positions
  uint64_t _inlineWord{};
  uint32_t _capacity{0};
};

}  // namespace pathrouter
