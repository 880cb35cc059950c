#include "flat-candidate-index.hpp"

#include <algorithm>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "pathrouter/candidate-set.hpp"
#include "pathrouter/path-pattern.hpp"

namespace pathrouter {

FlatCandidateIndex::FlatCandidateIndex(std::span<const PathPattern* const> rankedPatterns) {
  _endpointCount = static_cast<uint32_t>(rankedPatterns.size());
  for (uint32_t pos = 0; pos < _endpointCount; ++pos) {
    const PathPattern& pattern = *rankedPatterns[pos];
    auto& entries = pattern.isLiteral() ? _exactPaths : _prefixes;
    entries.emplace_back(std::string(pattern.literalPrefix()), pos);
  }
  std::ranges::sort(_exactPaths, {}, &Entry::text);
}

uint32_t FlatCandidateIndex::collect(std::string_view path, CandidateSet& candidates) const {
  for (const Entry& entry : _prefixes) {
    if (path.starts_with(entry.text)) {
      candidates.set(entry.endpoint);
    }
  }
  const auto it = std::ranges::lower_bound(_exactPaths, path, {}, [](const Entry& entry) -> std::string_view {
    return entry.text;
  });
  if (it != _exactPaths.end() && it->text == path) {
    return it->endpoint;
  }
  return kNoEndpoint;
}

}  // namespace pathrouter
