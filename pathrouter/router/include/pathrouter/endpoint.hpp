#pragma once

#include <functional>
#include <utility>

#include "pathrouter/match-result.hpp"
#include "pathrouter/path-pattern.hpp"

namespace pathrouter {

// A compiled path pattern paired with the value the caller associated to it.
template <class V>
class Endpoint {
 public:
  using value_type = V;

  Endpoint(PathPattern pathPattern, V value) : _pathPattern(std::move(pathPattern)), _value(std::move(value)) {}

  [[nodiscard]] const PathPattern& pathPattern() const noexcept { return _pathPattern; }

  [[nodiscard]] const V& value() const noexcept { return _value; }

 private:
  PathPattern _pathPattern;
  V _value;
};

// An endpoint whose pattern matched a path, with the variables bound by that match.
// It refers to the endpoint stored in the router, which must outlive it.
template <class V>
class MatchingEndpoint {
 public:
  MatchingEndpoint(const Endpoint<V>& endpoint, PathVariables variables)
      : _endpoint(&endpoint), _variables(std::move(variables)) {}

  [[nodiscard]] const Endpoint<V>& endpoint() const noexcept { return *_endpoint; }

  [[nodiscard]] const PathPattern& pathPattern() const noexcept { return _endpoint->pathPattern(); }

  [[nodiscard]] const V& value() const noexcept { return _endpoint->value(); }

  [[nodiscard]] const PathVariables& variables() const noexcept { return _variables; }

 private:
  const Endpoint<V>* _endpoint;
  PathVariables _variables;
};

// Strict weak ordering over endpoints, returns true if 'lhs' should be preferred to 'rhs'.
template <class V>
using EndpointComparator = std::function<bool(const Endpoint<V>&, const Endpoint<V>&)>;

// Most specific endpoint first.
template <class V>
bool MoreSpecific(const Endpoint<V>& lhs, const Endpoint<V>& rhs) {
  return lhs.pathPattern().specificity() > rhs.pathPattern().specificity();
}

}  // namespace pathrouter
