#include "pathrouter/utf8.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string_view>

namespace pathrouter {

namespace {
constexpr std::string_view kEmoji = "\xF0\x9F\x98\x80";  // U+1F600
constexpr std::string_view kOtherEmoji = "\xF0\x9F\x98\x81";
constexpr std::string_view kEAcute = "\xC3\xA9";
}  // namespace

TEST(Utf8Test, SequenceLength) {
  EXPECT_EQ(Utf8SequenceLength('a'), 1U);
  EXPECT_EQ(Utf8SequenceLength('\xC3'), 2U);
  EXPECT_EQ(Utf8SequenceLength('\xE5'), 3U);
  EXPECT_EQ(Utf8SequenceLength('\xF0'), 4U);
  EXPECT_EQ(Utf8SequenceLength('\x80'), 0U);
  EXPECT_EQ(Utf8SequenceLength('\xC0'), 0U);
  EXPECT_EQ(Utf8SequenceLength('\xF5'), 0U);
  EXPECT_EQ(Utf8SequenceLength('\xFF'), 0U);
}

TEST(Utf8Test, ValidStrings) {
  EXPECT_TRUE(IsValidUtf8(""));
  EXPECT_TRUE(IsValidUtf8("/plain/ascii"));
  EXPECT_TRUE(IsValidUtf8(kEmoji));
  EXPECT_TRUE(IsValidUtf8("\xEF\xBC\xA1\xEF\xBC\x91"));  // fullwidth A and 1
  EXPECT_TRUE(IsValidUtf8("\xF4\x8F\xBF\xBF"));          // U+10FFFF
}

TEST(Utf8Test, InvalidStrings) {
  EXPECT_FALSE(IsValidUtf8("\xF0\x9F"));          // truncated
  EXPECT_FALSE(IsValidUtf8("\x80"));              // lone continuation
  EXPECT_FALSE(IsValidUtf8("\xC0\xAF"));          // overlong '/'
  EXPECT_FALSE(IsValidUtf8("\xE0\x80\xAF"));      // overlong
  EXPECT_FALSE(IsValidUtf8("\xF0\x80\x80\xAF"));  // overlong
  EXPECT_FALSE(IsValidUtf8("\xED\xA0\x80"));      // surrogate D800
  EXPECT_FALSE(IsValidUtf8("\xF4\x90\x80\x80"));  // above U+10FFFF
  EXPECT_FALSE(IsValidUtf8("a\xC3z"));            // bad continuation
}

TEST(Utf8Test, CodepointCount) {
  EXPECT_EQ(Utf8CodepointCount(""), 0U);
  EXPECT_EQ(Utf8CodepointCount("abc"), 3U);
  EXPECT_EQ(Utf8CodepointCount(kEmoji), 1U);
  EXPECT_EQ(Utf8CodepointCount("/caf\xC3\xA9"), 5U);
}

TEST(Utf8Test, FloorBoundary) {
  EXPECT_EQ(Utf8FloorBoundary(kEmoji, 0), 0U);
  EXPECT_EQ(Utf8FloorBoundary(kEmoji, 2), 0U);
  EXPECT_EQ(Utf8FloorBoundary(kEmoji, 3), 0U);
  EXPECT_EQ(Utf8FloorBoundary(kEmoji, 4), 4U);
  EXPECT_EQ(Utf8FloorBoundary("ab", 1), 1U);
}

TEST(Utf8Test, CommonPrefixNeverSplitsSequence) {
  EXPECT_EQ(Utf8CommonPrefixLength("/abc", "/abd"), 3U);
  EXPECT_EQ(Utf8CommonPrefixLength("/abc", "/abc"), 4U);
  EXPECT_EQ(Utf8CommonPrefixLength("", "/abc"), 0U);
  // Both emojis share their first three bytes, but not their codepoint.
  EXPECT_EQ(Utf8CommonPrefixLength(kEmoji, kOtherEmoji), 0U);
  EXPECT_EQ(Utf8CommonPrefixLength(std::string_view("/\xF0\x9F\x98\x80x"), std::string_view("/\xF0\x9F\x98\x81x")), 1U);
  // A truncated sequence shares no complete codepoint with the full one.
  EXPECT_EQ(Utf8CommonPrefixLength(kEmoji, "\xF0\x9F"), 0U);
  EXPECT_EQ(Utf8CommonPrefixLength(kEAcute, kEAcute), 2U);
}

TEST(Utf8Test, LeadKey) {
  EXPECT_EQ(Utf8LeadKey("abc"), static_cast<uint32_t>('a'));
  EXPECT_EQ(Utf8LeadKey(kEmoji), 0xF09F9880U);
  EXPECT_NE(Utf8LeadKey(kEmoji), Utf8LeadKey(kOtherEmoji));
  EXPECT_EQ(Utf8LeadKey(kEAcute), 0xC3A9U);
  // Truncated input yields a key distinct from any complete sequence starting the same way.
  EXPECT_EQ(Utf8LeadKey("\xF0\x9F"), 0xF09FU);
  EXPECT_NE(Utf8LeadKey("\xF0\x9F"), Utf8LeadKey(kEmoji));
  EXPECT_EQ(Utf8LeadKey("\xFF"), 0xFFU);
}

}  // namespace pathrouter
