#include "pattern-grammar.hpp"

#include <fmt/format.h>
#include <re2/re2.h>

#include <algorithm>
#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "pathrouter/path-segment.hpp"
#include "pathrouter/pattern-errors.hpp"
#include "pathrouter/utf8.hpp"

namespace pathrouter::detail {

namespace {

void ValidateVariableName(std::string_view pattern, std::string_view name) {
  static const RE2 kVariableName(R"([$_\p{L}][$_\p{L}\p{Nd}]*)", MatcherOptions());

  if (!RE2::FullMatch(re2::StringPiece(name.data(), name.size()), kVariableName)) {
    throw PatternSyntaxError(pattern, fmt::format("invalid variable name '{}'", name));
  }
}

// Compiles the value pattern of 'variable' alone, and records its named groups in 'groupNames'.
// Returns its number of capturing groups.
int CompileValuePattern(std::string_view pattern, const VariableSegment& variable,
                        std::set<std::string, std::less<>>& groupNames) {
  if (variable.valuePattern.empty()) {
    throw PatternSyntaxError(pattern, fmt::format("empty regular expression for variable '{}'", variable.name));
  }
  const RE2 regex(re2::StringPiece(variable.valuePattern.data(), variable.valuePattern.size()), MatcherOptions());
  if (!regex.ok()) {
    throw PatternSyntaxError(pattern, fmt::format("invalid regular expression '{}' for variable '{}': {}",
                                                  variable.valuePattern, variable.name, regex.error()));
  }
  // Named groups share one namespace in the combined matcher.
  for (const auto& [groupName, groupNumber] : regex.NamedCapturingGroups()) {
    if (!groupNames.insert(groupName).second) {
      throw PatternSyntaxError(pattern, fmt::format("duplicate named group '{}' in variable '{}'", groupName,
                                                    variable.name));
    }
  }
  return regex.NumberOfCapturingGroups();
}

}  // namespace

std::vector<int> ValidatePathSegments(std::string_view pattern, const PathSegments& segments) {
  std::vector<std::string_view> names;
  std::vector<int> groupCounts;
  std::set<std::string, std::less<>> groupNames;
  for (const PathSegment& segment : segments) {
    if (const auto* literal = std::get_if<LiteralSegment>(&segment)) {
      if (!IsValidUtf8(literal->text)) {
        throw PatternSyntaxError(pattern, "literal text is not valid UTF-8");
      }
      continue;
    }
    const auto& variable = std::get<VariableSegment>(segment);
    ValidateVariableName(pattern, variable.name);
    if (std::ranges::find(names, std::string_view(variable.name)) != names.end()) {
      throw PatternSyntaxError(pattern, fmt::format("duplicate variable name '{}'", variable.name));
    }
    names.emplace_back(variable.name);
    groupCounts.push_back(CompileValuePattern(pattern, variable, groupNames));
  }
  return groupCounts;
}

RE2::Options MatcherOptions() {
  RE2::Options options;
  options.set_encoding(RE2::Options::EncodingUTF8);
  options.set_log_errors(false);
  return options;
}

}  // namespace pathrouter::detail
