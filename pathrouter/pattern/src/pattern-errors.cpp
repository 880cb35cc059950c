#include "pathrouter/pattern-errors.hpp"

#include <fmt/format.h>

#include <stdexcept>
#include <string_view>

namespace pathrouter {

PatternSyntaxError::PatternSyntaxError(std::string_view pattern, std::string_view reason)
    : std::invalid_argument(fmt::format("Invalid path pattern '{}': {}", pattern, reason)), _pattern(pattern) {}

}  // namespace pathrouter
