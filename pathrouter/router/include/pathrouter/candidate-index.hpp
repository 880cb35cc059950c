#pragma once

#include <cstdint>
#include <limits>
#include <memory>
#include <span>
#include <string_view>

#include "pathrouter/candidate-set.hpp"
#include "pathrouter/path-pattern.hpp"
#include "pathrouter/router-config.hpp"

namespace pathrouter {

// Finds, for a path, the endpoints whose matcher must be evaluated.
// Endpoints are designated by their position in ranked order.
// Implementations are immutable after construction and safe to query concurrently.
class CandidateIndex {
 public:
  static constexpr uint32_t kNoEndpoint = std::numeric_limits<uint32_t>::max();

  CandidateIndex() noexcept = default;
  CandidateIndex(const CandidateIndex&) = delete;
  CandidateIndex& operator=(const CandidateIndex&) = delete;
  virtual ~CandidateIndex() = default;

  // Builds the index over 'rankedPatterns' with the representation selected by 'config'.
  static std::unique_ptr<CandidateIndex> Create(const RouterConfig& config,
                                                std::span<const PathPattern* const> rankedPatterns);

  // Adds to 'candidates' the positions of the patterns with variables whose literal prefix is a prefix of 'path'.
  // Returns the position of the literal pattern equal to 'path', or kNoEndpoint.
  // Prerequisite: candidates.capacity() == endpointCount()
  virtual uint32_t collect(std::string_view path, CandidateSet& candidates) const = 0;

  // Either Flat or Trie.
  [[nodiscard]] virtual CandidateIndexKind kind() const noexcept = 0;

  [[nodiscard]] uint32_t endpointCount() const noexcept { return _endpointCount; }

 protected:
  uint32_t _endpointCount{0};
};

}  // namespace pathrouter
