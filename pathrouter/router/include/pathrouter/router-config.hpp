#pragma once

#include <cstdint>
#include <string_view>

namespace pathrouter {

// Representation of the structure used to find the endpoints that may match a path.
// Flat and Trie always produce the same results, only their speed differs.
enum class CandidateIndexKind : std::uint8_t { Auto, Flat, Trie };

std::string_view CandidateIndexKindToStr(CandidateIndexKind kind);

struct RouterConfig {
  // Candidate index representation.
  // Auto selects Flat when the number of endpoints with variables is at most 'flatScanMaxEndpoints', Trie otherwise.
  // Default: Auto
  CandidateIndexKind candidateIndex{CandidateIndexKind::Auto};

  // Threshold used by the Auto policy.
  // Default: 64
  uint32_t flatScanMaxEndpoints{64};

  RouterConfig& withCandidateIndex(CandidateIndexKind kind);

  RouterConfig& withFlatScanMaxEndpoints(uint32_t maxEndpoints);
};

}  // namespace pathrouter
