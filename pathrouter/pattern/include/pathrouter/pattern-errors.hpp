#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace pathrouter {

// Raised when a path pattern cannot be parsed or compiled.
class PatternSyntaxError : public std::invalid_argument {
 public:
  PatternSyntaxError(std::string_view pattern, std::string_view reason);

  // The offending pattern source, as given by the caller.
  [[nodiscard]] const std::string& pattern() const noexcept { return _pattern; }

 private:
  std::string _pattern;
};

}  // namespace pathrouter
