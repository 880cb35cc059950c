#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "pathrouter/candidate-index.hpp"
#include "pathrouter/candidate-set.hpp"
#include "pathrouter/path-pattern.hpp"
#include "pathrouter/router-config.hpp"

namespace pathrouter {

// Linear scan over the literal prefixes, with a sorted table of literal patterns.
class FlatCandidateIndex final : public CandidateIndex {
 public:
  explicit FlatCandidateIndex(std::span<const PathPattern* const> rankedPatterns);

  uint32_t collect(std::string_view path, CandidateSet& candidates) const override;

  [[nodiscard]] CandidateIndexKind kind() const noexcept override { return CandidateIndexKind::Flat; }

  [[nodiscard]] std::size_t exactPathCount() const noexcept { return _exactPaths.size(); }

 private:
  struct Entry {
    std::string text;
    uint32_t endpoint;
  };

  std::vector<Entry> _prefixes;    // in ranked order
  std::vector<Entry> _exactPaths;  // sorted by text
};

}  // namespace pathrouter
