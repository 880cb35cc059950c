#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "pathrouter/match-result.hpp"
#include "pathrouter/path-segment.hpp"
#include "pathrouter/specificity.hpp"

namespace re2 {
class RE2;
}  // namespace re2

namespace pathrouter {

// A compiled path pattern, for instance "/results/{uuid:[\w-]+}.json".
// Matching is always performed against the full path.
// Immutable once constructed. Copies share the compiled matcher, and concurrent calls to 'match' are safe.
class PathPattern {
 public:
  // Parses and compiles 'source'.
  // Throws PatternSyntaxError if 'source' is not a valid pattern.
  explicit PathPattern(std::string_view source);

  // Compiles an already split segment sequence. Adjacent literal segments are merged and empty ones dropped.
  // The source of the resulting pattern is rebuilt from the segments, with literal '{' escaped as "\{".
  // Throws PatternSyntaxError if a segment is invalid, or if a literal ending with '\' precedes a variable
  // (no source text can express it).
  static PathPattern Compile(PathSegments segments);

  // Matches 'path' in full, binding the pattern variables on success.
  [[nodiscard]] MatchResult match(std::string_view path) const;

  // Same as match(path).matches(), without extracting variables.
  [[nodiscard]] bool matches(std::string_view path) const;

  [[nodiscard]] std::string_view source() const noexcept { return _source; }

  [[nodiscard]] const PathSegments& segments() const noexcept { return _segments; }

  // A literal pattern has no variable and only matches its own literal text.
  [[nodiscard]] bool isLiteral() const noexcept { return _captures.empty(); }

  // Literal text preceding the first variable, or the whole literal text of a literal pattern.
  [[nodiscard]] std::string_view literalPrefix() const noexcept { return _literalPrefix; }

  // Canonical form of the segment sequence with variable names erased.
  // Two patterns with equal skeletons match exactly the same paths.
  [[nodiscard]] std::string_view skeleton() const noexcept { return _skeleton; }

  [[nodiscard]] uint32_t variableCount() const noexcept { return static_cast<uint32_t>(_captures.size()); }

  // Number of literal codepoints, an escaped "\{" counting as one.
  [[nodiscard]] uint32_t literalCharCount() const noexcept { return _literalCharCount; }

  [[nodiscard]] Specificity specificity() const noexcept { return {variableCount(), _literalCharCount}; }

  bool operator==(const PathPattern& other) const noexcept { return _source == other._source; }

 private:
  struct VariableCapture {
    std::string name;
    int groupNumber;
  };

  PathPattern(std::string source, PathSegments segments);

  std::string _source;
  PathSegments _segments;
  std::vector<VariableCapture> _captures;
  std::string _literalPrefix;
  std::string _skeleton;
  std::shared_ptr<const re2::RE2> _matcher;  // null for literal patterns
  int _submatchCount{0};                     // 1 + group number of the last variable
  uint32_t _literalCharCount{0};
};

}  // namespace pathrouter
