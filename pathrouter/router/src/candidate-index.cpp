#include "pathrouter/candidate-index.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <span>

#include "flat-candidate-index.hpp"
#include "pathrouter/log.hpp"
#include "pathrouter/path-pattern.hpp"
#include "pathrouter/router-config.hpp"
#include "trie-candidate-index.hpp"

namespace pathrouter {

std::unique_ptr<CandidateIndex> CandidateIndex::Create(const RouterConfig& config,
                                                       std::span<const PathPattern* const> rankedPatterns) {
  const auto nbVariablePatterns = static_cast<std::size_t>(
      std::ranges::count_if(rankedPatterns, [](const PathPattern* pattern) { return !pattern->isLiteral(); }));

  CandidateIndexKind kind = config.candidateIndex;
  if (kind == CandidateIndexKind::Auto) {
    kind = nbVariablePatterns <= config.flatScanMaxEndpoints ? CandidateIndexKind::Flat : CandidateIndexKind::Trie;
  }

  if (kind == CandidateIndexKind::Flat) {
    auto index = std::make_unique<FlatCandidateIndex>(rankedPatterns);
    log::debug("Built flat candidate index over {} endpoint(s), {} with variables, {} exact path(s)",
               rankedPatterns.size(), nbVariablePatterns, index->exactPathCount());
    return index;
  }

  auto index = std::make_unique<TrieCandidateIndex>(rankedPatterns);
  if (log::get_level() <= log::level::debug) {
    log::debug("Built trie candidate index over {} endpoint(s), {} with variables, {} node(s), max depth {}",
               rankedPatterns.size(), nbVariablePatterns, index->nodeCount(), index->maxDepth());
  }
  return index;
}

}  // namespace pathrouter
