#pragma once

#include <re2/re2.h>

#include <string_view>
#include <vector>

#include "pathrouter/path-segment.hpp"

namespace pathrouter::detail {

// Value pattern of a variable declared without an explicit regex: one or more characters, line breaks included.
inline constexpr std::string_view kDefaultValuePattern = "(?s:.+)";

// Options shared by every regex compiled for a path pattern (UTF-8, leftmost-first submatches, silent errors).
RE2::Options MatcherOptions();

// Splits 'pattern' into segments without validating variable names nor value patterns.
// Only the UTF-8 encoding and the brace structure of 'pattern' are checked.
PathSegments ScanPathSegments(std::string_view pattern);

// Checks the variable names, their uniqueness and the value patterns of 'segments', and the encoding of the literal
// text. Named groups must be unique across all value patterns. Returns the number of capturing groups of each variable's value pattern, in declaration order.
// 'pattern' is only used for error reporting.
std::vector<int> ValidatePathSegments(std::string_view pattern, const PathSegments& segments);

}  // namespace pathrouter::detail
