#include "trie-candidate-index.hpp"

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pathrouter/candidate-set.hpp"
#include "pathrouter/path-pattern.hpp"
#include "pathrouter/utf8.hpp"

namespace pathrouter {

TrieCandidateIndex::TrieCandidateIndex(std::span<const PathPattern* const> rankedPatterns) {
  _endpointCount = static_cast<uint32_t>(rankedPatterns.size());
  _nodes.emplace_back();
  for (uint32_t pos = 0; pos < _endpointCount; ++pos) {
    const PathPattern& pattern = *rankedPatterns[pos];
    const uint32_t nodePos = insert(pattern.literalPrefix());
    if (pattern.isLiteral()) {
      assert(_nodes[nodePos].exactEndpoint == kNoEndpoint);
      _nodes[nodePos].exactEndpoint = pos;
    } else {
      // Positions are inserted in increasing order, which keeps each list sorted.
      _nodes[nodePos].endpoints.push_back(pos);
    }
  }
}

uint32_t TrieCandidateIndex::insert(std::string_view text) {
  const auto byKey = [](const Edge& edge) { return edge.key; };

  uint32_t nodePos = 0;
  while (!text.empty()) {
    const uint32_t key = Utf8LeadKey(text);
    auto& edges = _nodes[nodePos].edges;
    const auto edgeIt = std::ranges::lower_bound(edges, key, {}, byKey);
    if (edgeIt == edges.end() || edgeIt->key != key) {
      // No edge shares the first codepoint: the remaining text becomes a new leaf.
      const auto childPos = static_cast<uint32_t>(_nodes.size());
      edges.insert(edgeIt, Edge{key, childPos});
      _nodes.emplace_back().label = text;
      return childPos;
    }

    const uint32_t childPos = edgeIt->child;
    const std::size_t commonLen = Utf8CommonPrefixLength(_nodes[childPos].label, text);
    assert(commonLen != 0);
    if (commonLen < _nodes[childPos].label.size()) {
      // Split the edge: the child keeps the label tail, a new intermediate node takes the common head.
      const auto midPos = static_cast<uint32_t>(_nodes.size());
      edgeIt->child = midPos;  // 'edges' is not used after this point, _nodes may reallocate below
      Node& mid = _nodes.emplace_back();
      Node& child = _nodes[childPos];
      mid.label = child.label.substr(0, commonLen);
      child.label.erase(0, commonLen);
      mid.edges.push_back(Edge{Utf8LeadKey(child.label), childPos});
      nodePos = midPos;
    } else {
      nodePos = childPos;
    }
    text.remove_prefix(commonLen);
  }
  return nodePos;
}

uint32_t TrieCandidateIndex::collect(std::string_view path, CandidateSet& candidates) const {
  uint32_t nodePos = 0;
  while (true) {
    const Node& node = _nodes[nodePos];
    for (uint32_t endpoint : node.endpoints) {
      candidates.set(endpoint);
    }
    if (path.empty()) {
      return node.exactEndpoint;
    }
    // Truncated or invalid sequences in 'path' produce keys that no edge carries.
    const uint32_t key = Utf8LeadKey(path);
    const auto edgeIt = std::ranges::lower_bound(node.edges, key, {}, [](const Edge& edge) { return edge.key; });
    if (edgeIt == node.edges.end() || edgeIt->key != key) {
      return kNoEndpoint;
    }
    const std::string& label = _nodes[edgeIt->child].label;
    if (!path.starts_with(label)) {
      return kNoEndpoint;
    }
    path.remove_prefix(label.size());
    nodePos = edgeIt->child;
  }
}

std::size_t TrieCandidateIndex::maxDepth() const {
  std::size_t deepest = 0;
  std::vector<std::pair<uint32_t, std::size_t>> nodesToVisit;
  nodesToVisit.emplace_back(0, 0);
  while (!nodesToVisit.empty()) {
    const auto [nodePos, depth] = nodesToVisit.back();
    nodesToVisit.pop_back();
    deepest = std::max(deepest, depth);
    for (const Edge& edge : _nodes[nodePos].edges) {
      nodesToVisit.emplace_back(edge.child, depth + 1);
    }
  }
  return deepest;
}

}  // namespace pathrouter
