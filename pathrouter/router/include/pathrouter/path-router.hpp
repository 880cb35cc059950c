#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

#include "pathrouter/candidate-index.hpp"
#include "pathrouter/candidate-set.hpp"
#include "pathrouter/endpoint.hpp"
#include "pathrouter/match-result.hpp"
#include "pathrouter/matching-endpoints.hpp"
#include "pathrouter/path-pattern.hpp"
#include "pathrouter/route-skeleton-registry.hpp"
#include "pathrouter/router-config.hpp"

namespace pathrouter {

template <class V>
class PathRouterBuilder;

// Routes paths to the values associated to the path patterns matching them.
// A router is immutable once built: all queries are const, lock free, and safe to run concurrently.
// Copies share the same endpoints.
//
// Ranking of the endpoints matching a path:
//   1. the literal pattern equal to the path, if any,
//   2. the endpoints with variables, ordered by the comparator given at build time (most specific first by default),
//   3. registration order.
template <class V>
class PathRouter {
 public:
  using value_type = V;

  // Creates an empty router, matching no path.
  PathRouter() : PathRouter(std::vector<Endpoint<V>>{}, RouterConfig{}) {}

  static PathRouterBuilder<V> builder(RouterConfig config = {}) { return PathRouterBuilder<V>(std::move(config)); }

  // Returns the best ranked endpoint matching 'path' in full, or std::nullopt.
  // Only the returned match allocates: candidates are collected in a per thread buffer, reused across calls.
  [[nodiscard]] std::optional<MatchingEndpoint<V>> find(std::string_view path) const {
    thread_local CandidateSet candidates(0);
    candidates.reset(_index->endpointCount());
    const uint32_t exactEndpoint = _index->collect(path, candidates);
    if (exactEndpoint != CandidateIndex::kNoEndpoint) {
      return MatchingEndpoint<V>((*_endpoints)[exactEndpoint], PathVariables{});
    }
    for (uint32_t pos = candidates.next(0); pos != CandidateSet::kEnd; pos = candidates.next(pos + 1U)) {
      const Endpoint<V>& endpoint = (*_endpoints)[pos];
      MatchResult result = endpoint.pathPattern().match(path);
      if (result.matches()) {
        return MatchingEndpoint<V>(endpoint, std::move(result).variables());
      }
    }
    return std::nullopt;
  }

  // Returns all endpoints matching 'path' in full, lazily, in ranked order.
  // 'path' must outlive the returned range.
  [[nodiscard]] MatchingEndpoints<V> findAll(std::string_view path) const {
    return MatchingEndpoints<V>(std::span<const Endpoint<V>>(*_endpoints), *_index, path);
  }

  // All endpoints in ranked order. Literal endpoints are ranked among them but only ever match their own text.
  [[nodiscard]] std::span<const Endpoint<V>> endpoints() const noexcept { return *_endpoints; }

  [[nodiscard]] std::size_t size() const noexcept { return _endpoints->size(); }

  [[nodiscard]] bool empty() const noexcept { return _endpoints->empty(); }

  // Representation selected for the candidate index, either Flat or Trie.
  [[nodiscard]] CandidateIndexKind candidateIndexKind() const noexcept { return _index->kind(); }

 private:
  friend class PathRouterBuilder<V>;

  PathRouter(std::vector<Endpoint<V>> rankedEndpoints, const RouterConfig& config)
      : _endpoints(std::make_shared<const std::vector<Endpoint<V>>>(std::move(rankedEndpoints))) {
    std::vector<const PathPattern*> rankedPatterns;
    rankedPatterns.reserve(_endpoints->size());
    for (const Endpoint<V>& endpoint : *_endpoints) {
      rankedPatterns.push_back(&endpoint.pathPattern());
    }
    _index = CandidateIndex::Create(config, rankedPatterns);
  }

  std::shared_ptr<const std::vector<Endpoint<V>>> _endpoints;
  std::shared_ptr<const CandidateIndex> _index;
};

// Collects (pattern, value) pairs and builds PathRouter instances.
// Not thread safe. Building does not consume the builder: more routes may be added and another router built,
// without affecting routers already built.
template <class V>
class PathRouterBuilder {
 public:
  explicit PathRouterBuilder(RouterConfig config = {}) : _config(std::move(config)) {}

  // Parses 'pattern' and registers it with 'value'.
  // Throws PatternSyntaxError if 'pattern' is invalid, and DuplicateRouteError if a registered pattern matches
  // exactly the same paths (same literal text and value patterns, whatever the variable names).
  PathRouterBuilder& add(std::string_view pattern, V value) { return add(PathPattern(pattern), std::move(value)); }

  // Registers an already compiled pattern with 'value'.
  // Throws DuplicateRouteError if a registered pattern matches exactly the same paths.
  PathRouterBuilder& add(PathPattern pattern, V value) {
    _registry.registerRoute(pattern);
    _endpoints.emplace_back(std::move(pattern), std::move(value));
    return *this;
  }

  // Builds a router ranking the endpoints with variables from the most to the least specific.
  [[nodiscard]] PathRouter<V> build() const { return build(MoreSpecific<V>); }

  // Builds a router ranking the endpoints with variables with 'comparator', which should return true if its
  // first argument is to be preferred over its second one. Equivalent endpoints keep their registration order.
  // A literal endpoint equal to the queried path is always ranked first.
  [[nodiscard]] PathRouter<V> build(EndpointComparator<V> comparator) const {
    if (!comparator) {
      throw std::invalid_argument("Cannot build a router with an empty endpoint comparator");
    }
    std::vector<Endpoint<V>> rankedEndpoints = _endpoints;
    std::ranges::stable_sort(rankedEndpoints, comparator);
    return PathRouter<V>(std::move(rankedEndpoints), _config);
  }

  [[nodiscard]] std::size_t size() const noexcept { return _endpoints.size(); }

 private:
  RouterConfig _config;
  RouteSkeletonRegistry _registry;
  std::vector<Endpoint<V>> _endpoints;
};

}  // namespace pathrouter
