#include <gtest/gtest.h>

#include "codebox/utils/string_utils.hpp"

#include <cstring>
#include <stdexcept>

using codebox::utils::kMaxOutputBytes;
using codebox::utils::kTruncationMarker;
using codebox::utils::StringUtils;

TEST(StringUtilsTest, TrimAndBlank) {
  EXPECT_EQ(StringUtils::Trim("  abc \n"), "abc");
  EXPECT_EQ(StringUtils::Trim(" \t "), "");
  EXPECT_TRUE(StringUtils::IsBlank(" \n\t"));
  EXPECT_TRUE(StringUtils::IsBlank(""));
  EXPECT_FALSE(StringUtils::IsBlank(" x "));
}

TEST(StringUtilsTest, SplitSkipsEmptyTokens) {
  EXPECT_EQ(StringUtils::Split("a,,b,", ','), (std::vector<std::string>{"a", "b"}));
}

TEST(StringUtilsTest, SplitListAcceptsCommaList) {
  EXPECT_EQ(StringUtils::SplitList(" json , math,, re "),
            (std::vector<std::string>{"json", "math", "re"}));
  EXPECT_TRUE(StringUtils::SplitList("   ").empty());
}

TEST(StringUtilsTest, SplitListAcceptsJsonArray) {
  EXPECT_EQ(StringUtils::SplitList(R"([" pypi.org ", "", "example.com"])"),
            (std::vector<std::string>{"pypi.org", "example.com"}));
}

TEST(StringUtilsTest, SplitListRejectsMalformedJson) {
  EXPECT_THROW(StringUtils::SplitList("[\"a\", "), std::runtime_error);
  EXPECT_THROW(StringUtils::SplitList("[1, 2]"), std::runtime_error);
}

TEST(StringUtilsTest, Abbreviate) {
  EXPECT_EQ(StringUtils::Abbreviate("short", 10), "short");
  EXPECT_EQ(StringUtils::Abbreviate("abcdefghij", 6), "abc...");
}

TEST(StringUtilsTest, SanitizeUtf8ReplacesInvalidBytes) {
  EXPECT_EQ(StringUtils::SanitizeUtf8("caf\xC3\xA9"), "caf\xC3\xA9");
  EXPECT_EQ(StringUtils::SanitizeUtf8("a\xFF" "b"), "a\xEF\xBF\xBD" "b");
}

TEST(StringUtilsTest, TruncateOutputLeavesSmallOutputAlone) {
  const std::string text(kMaxOutputBytes, 'x');
  EXPECT_EQ(StringUtils::TruncateOutput(text), text);
}

TEST(StringUtilsTest, TruncateOutputCutsAndMarks) {
  const std::string text(kMaxOutputBytes + 500, 'x');
  const auto truncated = StringUtils::TruncateOutput(text);
  EXPECT_EQ(truncated.size(), kMaxOutputBytes + std::strlen(kTruncationMarker));
  EXPECT_TRUE(StringUtils::EndsWith(truncated, kTruncationMarker));
  // Idempotent
  EXPECT_EQ(StringUtils::TruncateOutput(truncated), truncated);
}

TEST(StringUtilsTest, TruncateOutputKeepsCodepointsWhole) {
  // 'é' is two bytes; put one across the cut
  std::string text(9, 'x');
  text += "\xC3\xA9";
  text += std::string(20, 'y');
  const auto truncated = StringUtils::TruncateOutput(text, 10);
  EXPECT_EQ(truncated, std::string(9, 'x') + kTruncationMarker);
}
