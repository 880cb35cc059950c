#include "pathrouter/log.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>

namespace pathrouter {

TEST(LogTest, DebugIsFilteredByDefault) { EXPECT_GT(log::get_level(), log::level::debug); }

TEST(LogTest, FormatsArguments) {
  const std::string source = "/a/{b}";
  EXPECT_NO_THROW(log::debug("Registered route '{}' ({} variable(s))", source, 1U));
  EXPECT_NO_THROW(log::error("Rejecting route '{}', it matches the same paths as '{}'", std::string_view(source),
                             "/a/{c}"));
}

}  // namespace pathrouter
