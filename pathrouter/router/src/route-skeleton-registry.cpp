#include "pathrouter/route-skeleton-registry.hpp"

#include <string>

#include "pathrouter/duplicate-route-error.hpp"
#include "pathrouter/log.hpp"
#include "pathrouter/path-pattern.hpp"

namespace pathrouter {

void RouteSkeletonRegistry::registerRoute(const PathPattern& pattern) {
  const auto [it, inserted] = _sourcesBySkeleton.try_emplace(std::string(pattern.skeleton()), pattern.source());
  if (!inserted) {
    log::error("Rejecting route '{}', it matches the same paths as '{}'", pattern.source(), it->second);
    throw DuplicateRouteError(pattern.source(), it->second);
  }
  log::debug("Registered route '{}' ({} variable(s), literal prefix '{}')", pattern.source(), pattern.variableCount(),
             pattern.literalPrefix());
}

}  // namespace pathrouter
