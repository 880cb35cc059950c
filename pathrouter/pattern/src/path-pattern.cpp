#include "pathrouter/path-pattern.hpp"

#include <fmt/format.h>
#include <re2/re2.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "pathrouter/match-result.hpp"
#include "pathrouter/path-segment.hpp"
#include "pathrouter/pattern-errors.hpp"
#include "pathrouter/utf8.hpp"
#include "pattern-grammar.hpp"

namespace pathrouter {

namespace {

constexpr std::size_t kInlineSubmatches = 16;

re2::StringPiece ToStringPiece(std::string_view sv) { return {sv.data(), sv.size()}; }

// Merges adjacent literals and drops empty ones, and normalizes default variables.
PathSegments NormalizeSegments(PathSegments segments) {
  PathSegments normalized;
  normalized.reserve(segments.size());
  for (PathSegment& segment : segments) {
    if (auto* literal = std::get_if<LiteralSegment>(&segment)) {
      if (literal->text.empty()) {
        continue;
      }
      if (!normalized.empty()) {
        if (auto* previous = std::get_if<LiteralSegment>(&normalized.back())) {
          previous->text.append(literal->text);
          continue;
        }
      }
    } else {
      auto& variable = std::get<VariableSegment>(segment);
      if (variable.isDefault) {
        variable.valuePattern = detail::kDefaultValuePattern;
      }
    }
    normalized.push_back(std::move(segment));
  }
  return normalized;
}

// Rebuilds a source string which parses back into 'segments'.
std::string BuildSource(const PathSegments& segments) {
  std::string source;
  bool backslashBeforeVariable = false;
  for (std::size_t pos = 0; pos < segments.size(); ++pos) {
    if (const auto* literal = std::get_if<LiteralSegment>(&segments[pos])) {
      for (char ch : literal->text) {
        if (ch == '{') {
          source.push_back('\\');
        }
        source.push_back(ch);
      }
      backslashBeforeVariable |= pos + 1 < segments.size() && literal->text.ends_with('\\');
      continue;
    }
    const auto& variable = std::get<VariableSegment>(segments[pos]);
    if (variable.isDefault) {
      fmt::format_to(std::back_inserter(source), "{{{}}}", variable.name);
    } else {
      fmt::format_to(std::back_inserter(source), "{{{}:{}}}", variable.name, variable.valuePattern);
    }
  }
  if (backslashBeforeVariable) {
    throw PatternSyntaxError(source, "a literal ending with '\\' cannot precede a variable");
  }
  return source;
}

}  // namespace

PathPattern::PathPattern(std::string_view source) : PathPattern(std::string(source), detail::ScanPathSegments(source)) {}

PathPattern PathPattern::Compile(PathSegments segments) {
  PathSegments normalized = NormalizeSegments(std::move(segments));
  std::string source = BuildSource(normalized);
  return {std::move(source), std::move(normalized)};
}

PathPattern::PathPattern(std::string source, PathSegments segments)
    : _source(std::move(source)), _segments(std::move(segments)) {
  const std::vector<int> groupCounts = detail::ValidatePathSegments(_source, _segments);

  std::string regex;
  int groupNumber = 1;
  auto groupCountIt = groupCounts.begin();
  bool inLiteralPrefix = true;

  for (const PathSegment& segment : _segments) {
    if (const auto* literal = std::get_if<LiteralSegment>(&segment)) {
      regex.append(RE2::QuoteMeta(ToStringPiece(literal->text)));
      _literalCharCount += static_cast<uint32_t>(Utf8CodepointCount(literal->text));
      if (inLiteralPrefix) {
        _literalPrefix.append(literal->text);
      }
      fmt::format_to(std::back_inserter(_skeleton), "L{}:{}", literal->text.size(), literal->text);
      continue;
    }
    inLiteralPrefix = false;
    const auto& variable = std::get<VariableSegment>(segment);
    // Each value pattern sits in its own group: inline flags set inside it stop at the closing parenthesis.
    regex.push_back('(');
    regex.append(variable.valuePattern);
    regex.push_back(')');
    _captures.emplace_back(variable.name, groupNumber);
    _submatchCount = groupNumber + 1;
    groupNumber += 1 + *groupCountIt++;
    fmt::format_to(std::back_inserter(_skeleton), "V{}:{}", variable.valuePattern.size(), variable.valuePattern);
  }

  if (_captures.empty()) {
    return;
  }

  auto matcher = std::make_shared<const RE2>(ToStringPiece(regex), detail::MatcherOptions());
  if (!matcher->ok()) {
    throw PatternSyntaxError(_source, fmt::format("cannot compile '{}': {}", regex, matcher->error()));
  }
  _matcher = std::move(matcher);
}

MatchResult PathPattern::match(std::string_view path) const {
  if (!_matcher) {
    return path == _literalPrefix ? MatchResult::Positive() : MatchResult::Negative();
  }

  std::array<re2::StringPiece, kInlineSubmatches> inlineSubmatches;
  std::vector<re2::StringPiece> heapSubmatches;
  re2::StringPiece* submatches = inlineSubmatches.data();
  if (static_cast<std::size_t>(_submatchCount) > kInlineSubmatches) {
    heapSubmatches.resize(static_cast<std::size_t>(_submatchCount));
    submatches = heapSubmatches.data();
  }

  if (!_matcher->Match(ToStringPiece(path), 0, path.size(), RE2::ANCHOR_BOTH, submatches, _submatchCount)) {
    return MatchResult::Negative();
  }

  PathVariables variables;
  for (const VariableCapture& capture : _captures) {
    const re2::StringPiece& value = submatches[capture.groupNumber];
    variables.emplace(capture.name, std::string_view(value.data(), value.size()));
  }
  return MatchResult::Positive(std::move(variables));
}

bool PathPattern::matches(std::string_view path) const {
  if (!_matcher) {
    return path == _literalPrefix;
  }
  return _matcher->Match(ToStringPiece(path), 0, path.size(), RE2::ANCHOR_BOTH, nullptr, 0);
}

}  // namespace pathrouter
