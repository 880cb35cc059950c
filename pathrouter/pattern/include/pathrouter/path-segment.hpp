#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pathrouter {

// Fixed text that must appear verbatim in a matching path.
struct LiteralSegment {
  bool operator==(const LiteralSegment&) const noexcept = default;

  std::string text;
};

// Named placeholder binding a substring of the path.
// 'valuePattern' is the regular expression the bound value must fully match.
// 'isDefault' is true when the declaration carried no explicit pattern ("{name}").
struct VariableSegment {
  bool operator==(const VariableSegment&) const noexcept = default;

  std::string name;
  std::string valuePattern;
  bool isDefault{false};
};

using PathSegment = std::variant<LiteralSegment, VariableSegment>;

using PathSegments = std::vector<PathSegment>;

// Splits 'pattern' into its ordered literal and variable segments.
// Grammar:
//   - '{' starts a variable declaration, unless immediately preceded by '\' (the backslash is dropped and the
//     brace is kept as literal text).
//   - A declaration is '{name}' or '{name:regex}'. Braces inside 'regex' nest, and a '\' inside the declaration
//     escapes the following character for brace counting purposes (it is kept in the regex).
//   - Variable names start with a letter, '_' or '$', followed by letters, digits, '_' or '$'.
//   - A variable name may appear at most once per pattern.
// Adjacent literal text is merged, so two literal segments never follow each other.
// Throws PatternSyntaxError on malformed input (including input that is not valid UTF-8).
PathSegments ParsePathSegments(std::string_view pattern);

}  // namespace pathrouter
