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

// Radix trie over the literal prefixes. Edges are labeled with UTF-8 text and are only ever split on codepoint
// boundaries. A query walks down from the root following 'path', collecting the endpoints of every visited node.
// All nodes live in a single table addressed by index, so building, copying and destroying the trie never recurse.
class TrieCandidateIndex final : public CandidateIndex {
 public:
  explicit TrieCandidateIndex(std::span<const PathPattern* const> rankedPatterns);

  uint32_t collect(std::string_view path, CandidateSet& candidates) const override;

  [[nodiscard]] CandidateIndexKind kind() const noexcept override { return CandidateIndexKind::Trie; }

  [[nodiscard]] std::size_t nodeCount() const noexcept { return _nodes.size(); }

  // Number of edges on the longest root to leaf path.
  [[nodiscard]] std::size_t maxDepth() const;

 private:
  struct Edge {
    uint32_t key;  // Utf8LeadKey of the child label
    uint32_t child;
  };

  struct Node {
    std::string label;                       // text of the edge leading to this node, empty for the root
    std::vector<Edge> edges;                 // sorted by key
    std::vector<uint32_t> endpoints;         // patterns with variables whose literal prefix ends here
    uint32_t exactEndpoint{kNoEndpoint};     // literal pattern whose text ends here
  };

  // Returns the node whose root path spells 'text', creating and splitting nodes as needed.
  uint32_t insert(std::string_view text);

  std::vector<Node> _nodes;
};

}  // namespace pathrouter
