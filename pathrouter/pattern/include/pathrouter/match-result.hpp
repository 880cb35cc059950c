#pragma once

#include <functional>
#include <map>
#include <string>
#include <utility>

namespace pathrouter {

// Variable name -> bound value. Transparent comparator, so lookups accept std::string_view.
using PathVariables = std::map<std::string, std::string, std::less<>>;

// Outcome of matching one path against one PathPattern.
class MatchResult {
 public:
  static MatchResult Negative() noexcept { return {}; }

  static MatchResult Positive(PathVariables variables = {}) noexcept {
    MatchResult result;
    result._variables = std::move(variables);
    result._matches = true;
    return result;
  }

  [[nodiscard]] bool matches() const noexcept { return _matches; }

  // Bound variables, always empty for a negative result.
  [[nodiscard]] const PathVariables& variables() const& noexcept { return _variables; }

  [[nodiscard]] PathVariables variables() && noexcept { return std::move(_variables); }

  bool operator==(const MatchResult&) const noexcept = default;

 private:
  MatchResult() noexcept = default;

  PathVariables _variables;
  bool _matches{false};
};

}  // namespace pathrouter
