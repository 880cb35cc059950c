#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace pathrouter {

// Raised when a route matching exactly the same paths as an already registered route is added,
// for instance "/a/{c}" after "/a/{b}".
class DuplicateRouteError : public std::logic_error {
 public:
  DuplicateRouteError(std::string_view pattern, std::string_view conflictingPattern);

  // Source of the rejected pattern.
  [[nodiscard]] const std::string& pattern() const noexcept { return _pattern; }

  // Source of the already registered pattern.
  [[nodiscard]] const std::string& conflictingPattern() const noexcept { return _conflictingPattern; }

 private:
  std::string _pattern;
  std::string _conflictingPattern;
};

}  // namespace pathrouter
