#include "pathrouter/router-config.hpp"

#include <cstdint>
#include <stdexcept>
#include <string_view>

namespace pathrouter {

std::string_view CandidateIndexKindToStr(CandidateIndexKind kind) {
  switch (kind) {
    case CandidateIndexKind::Auto:
      return "auto";
    case CandidateIndexKind::Flat:
      return "flat";
    case CandidateIndexKind::Trie:
      return "trie";
    default:
      throw std::invalid_argument("Unknown candidate index kind");
  }
}

RouterConfig& RouterConfig::withCandidateIndex(CandidateIndexKind kind) {
  candidateIndex = kind;
  return *this;
}

RouterConfig& RouterConfig::withFlatScanMaxEndpoints(uint32_t maxEndpoints) {
  flatScanMaxEndpoints = maxEndpoints;
  return *this;
}

}  // namespace pathrouter
