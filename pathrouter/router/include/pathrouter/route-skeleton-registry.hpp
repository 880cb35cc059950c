#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <string>

#include "pathrouter/path-pattern.hpp"

namespace pathrouter {

// Remembers the skeletons of the registered routes to reject structural duplicates.
class RouteSkeletonRegistry {
 public:
  // Throws DuplicateRouteError if a pattern with the same skeleton was already registered.
  void registerRoute(const PathPattern& pattern);

  [[nodiscard]] std::size_t size() const noexcept { return _sourcesBySkeleton.size(); }

 private:
  std::map<std::string, std::string, std::less<>> _sourcesBySkeleton;
};

}  // namespace pathrouter
