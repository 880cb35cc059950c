#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "pathrouter/path-segment.hpp"
#include "pathrouter/pattern-errors.hpp"
#include "pathrouter/utf8.hpp"
#include "pattern-grammar.hpp"

namespace pathrouter {

namespace detail {

namespace {

// Returns the position of the '}' closing the declaration opened at 'openPos'.
std::size_t FindDeclarationEnd(std::string_view pattern, std::size_t openPos) {
  int nestedOpeningBraces = 0;
  for (std::size_t pos = openPos + 1; pos < pattern.size(); ++pos) {
    switch (pattern[pos]) {
      case '}':
        if (nestedOpeningBraces == 0) {
          return pos;
        }
        --nestedOpeningBraces;
        break;
      case '{':
        ++nestedOpeningBraces;
        break;
      case '\\':
        ++pos;
        break;
      default:
        break;
    }
  }
  throw PatternSyntaxError(pattern, "unclosed variable declaration starting at index " + std::to_string(openPos));
}

VariableSegment MakeVariable(std::string_view declaration) {
  const auto colonPos = declaration.find(':');
  if (colonPos == std::string_view::npos) {
    return VariableSegment{std::string(declaration), std::string(kDefaultValuePattern), true};
  }
  return VariableSegment{std::string(declaration.substr(0, colonPos)), std::string(declaration.substr(colonPos + 1)),
                         false};
}

}  // namespace

PathSegments ScanPathSegments(std::string_view pattern) {
  if (!IsValidUtf8(pattern)) {
    throw PatternSyntaxError(pattern, "not valid UTF-8");
  }

  PathSegments segments;
  std::string literal;

  const auto flushLiteral = [&segments, &literal]() {
    if (!literal.empty()) {
      segments.emplace_back(LiteralSegment{std::move(literal)});
      literal.clear();
    }
  };

  std::size_t pos = 0;
  while (pos < pattern.size()) {
    const auto openPos = pattern.find('{', pos);
    if (openPos == std::string_view::npos) {
      literal.append(pattern.substr(pos));
      break;
    }
    if (openPos > pos && pattern[openPos - 1] == '\\') {
      // "\{" is a literal '{', the backslash is dropped
      literal.append(pattern.substr(pos, openPos - 1 - pos));
      literal.push_back('{');
      pos = openPos + 1;
      continue;
    }
    literal.append(pattern.substr(pos, openPos - pos));
    const auto closePos = FindDeclarationEnd(pattern, openPos);
    flushLiteral();
    segments.emplace_back(MakeVariable(pattern.substr(openPos + 1, closePos - openPos - 1)));
    pos = closePos + 1;
  }
  flushLiteral();
  return segments;
}

}  // namespace detail

PathSegments ParsePathSegments(std::string_view pattern) {
  PathSegments segments = detail::ScanPathSegments(pattern);
  detail::ValidatePathSegments(pattern, segments);
  return segments;
}

}  // namespace pathrouter
