#include <Argonaut/Core/Unicode.hpp>
#include <Argonaut/Utils/Types.hpp>

#include "gtest/gtest.h"

using namespace argonaut::core::unicode;
using argonaut::utils::types::Option, argonaut::utils::types::String;

class UnicodeTest : public testing::Test {};

TEST_F(UnicodeTest, Normalize_BorrowsAsciiInput) {
  const Normalized normalized = Normalize("verbose");

  EXPECT_TRUE(normalized.isBorrowed());
  EXPECT_EQ(normalized.view(), "verbose");
}

TEST_F(UnicodeTest, Normalize_ComposesDecomposedInput) {
  // "e" followed by U+0301 COMBINING ACUTE ACCENT.
  const Normalized normalized = Normalize("caf\x65\xcc\x81");

  EXPECT_FALSE(normalized.isBorrowed());
  EXPECT_EQ(normalized.view(), "caf\xc3\xa9");
}

TEST_F(UnicodeTest, Normalize_FoldsCjkCompatibilityIdeographs) {
  // U+F900 is a compatibility variant of U+8C48.
  EXPECT_EQ(Normalize("\xef\xa4\x80").toString(), "\xe8\xb1\x88");
}

TEST_F(UnicodeTest, IsValidUtf8_RejectsBrokenSequences) {
  EXPECT_TRUE(IsValidUtf8("gr\xc3\xb6\xc3\x9f" "e"));
  EXPECT_FALSE(IsValidUtf8("\xff"));
  EXPECT_FALSE(IsValidUtf8("\xc3"));
}

TEST_F(UnicodeTest, GraphemeCount_CountsUserPerceivedCharacters) {
  EXPECT_EQ(GraphemeCount(""), 0U);
  EXPECT_EQ(GraphemeCount("abc"), 3U);
  EXPECT_EQ(GraphemeCount("e\xcc\x81"), 1U);
  // Flag of Germany, two regional indicators.
  EXPECT_EQ(GraphemeCount("\xf0\x9f\x87\xa9\xf0\x9f\x87\xaa"), 1U);
  EXPECT_EQ(GraphemeCount("\r\n"), 1U);
}

TEST_F(UnicodeTest, Graphemes_SplitsWithoutBreakingClusters) {
  // "a", thumbs up with skin tone modifier, "b".
  const auto graphemes = Graphemes("a\xf0\x9f\x91\x8d\xf0\x9f\x8f\xbd" "b");

  ASSERT_EQ(graphemes.size(), 3U);
  EXPECT_EQ(graphemes[0], "a");
  EXPECT_EQ(graphemes[1], "\xf0\x9f\x91\x8d\xf0\x9f\x8f\xbd");
  EXPECT_EQ(graphemes[2], "b");
}

TEST_F(UnicodeTest, Comparison_CaseSensitiveMatchesExactly) {
  const Comparison name("verbose", Case::Sensitive);

  EXPECT_TRUE(name.matches("verbose"));
  EXPECT_FALSE(name.matches("Verbose"));
}

TEST_F(UnicodeTest, Comparison_CaseInsensitiveUsesFullFolding) {
  const Comparison name("stra\xc3\x9f" "e", Case::Insensitive);

  EXPECT_TRUE(name.matches("STRASSE"));
  EXPECT_TRUE(name.matches("Stra\xc3\x9f" "e"));
  EXPECT_FALSE(name.matches("strase"));
}

TEST_F(UnicodeTest, Comparison_MatchesAcrossNormalizationForms) {
  const Comparison name("caf\xc3\xa9", Case::Sensitive);

  EXPECT_TRUE(name.matches("caf\x65\xcc\x81"));
}

TEST_F(UnicodeTest, StripPrefixOf_ReturnsRemainder) {
  const Comparison prefix("--", Case::Sensitive);

  EXPECT_EQ(prefix.stripPrefixOf("--flag"), Option<String>("flag"));
  EXPECT_EQ(prefix.stripPrefixOf("--"), Option<String>(""));
  EXPECT_FALSE(prefix.stripPrefixOf("-flag").has_value());
}

TEST_F(UnicodeTest, StripPrefixOf_NeverSplitsAGrapheme) {
  const Comparison prefix("e", Case::Sensitive);

  // The accent belongs to the first grapheme, so "e" alone is not a prefix.
  EXPECT_FALSE(prefix.stripPrefixOf("e\xcc\xb8x").has_value());
}

TEST_F(UnicodeTest, StripPrefixOf_CaseInsensitiveTakesLongestPrefix) {
  const Comparison prefix("ss", Case::Insensitive);

  EXPECT_EQ(prefix.stripPrefixOf("\xc3\x9fx"), Option<String>("x"));
  EXPECT_EQ(prefix.stripPrefixOf("SSx"), Option<String>("x"));
}

TEST_F(UnicodeTest, StripPrefixOf_InvalidUtf8NeverMatches) {
  const Comparison prefix("--", Case::Sensitive);

  EXPECT_FALSE(prefix.stripPrefixOf("--\xff").has_value());
}

TEST_F(UnicodeTest, Comparison_EqualityRespectsCasePolicy) {
  EXPECT_EQ(Comparison("-", Case::Sensitive), Comparison("-", Case::Sensitive));
  EXPECT_FALSE(Comparison("-", Case::Sensitive) == Comparison("-", Case::Insensitive));
  EXPECT_EQ(Comparison("Name", Case::Insensitive), Comparison("nAME", Case::Insensitive));
}
