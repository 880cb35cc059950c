#include "pathrouter/duplicate-route-error.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <string_view>

namespace pathrouter {

namespace {
std::string BuildMessage(std::string_view pattern, std::string_view conflictingPattern) {
  if (pattern == conflictingPattern) {
    return fmt::format("Duplicate route '{}'", pattern);
  }
  return fmt::format("Route '{}' duplicates already registered route '{}'", pattern, conflictingPattern);
}
}  // namespace

DuplicateRouteError::DuplicateRouteError(std::string_view pattern, std::string_view conflictingPattern)
    : std::logic_error(BuildMessage(pattern, conflictingPattern)),
      _pattern(pattern),
      _conflictingPattern(conflictingPattern) {}

}  // namespace pathrouter
