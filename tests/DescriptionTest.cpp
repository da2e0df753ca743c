#include <Argonaut/Core/Description.hpp>
#include <Argonaut/Core/Outcome.hpp>
#include <Argonaut/Utils/Types.hpp>

#include "gtest/gtest.h"

using namespace argonaut::core;
using argonaut::utils::error::ArgoErrorCode;
using argonaut::utils::types::i32, argonaut::utils::types::None, argonaut::utils::types::Option, argonaut::utils::types::String;
using argonaut::utils::types::Vec;

class DescriptionTest : public testing::Test {};

TEST_F(DescriptionTest, Create_TakesPrefixesFromLanguage) {
  Result<Description<i32>> description = Description<i32>::Create({ "count", "number" }, { "c" }, String("How many."), 3);

  ASSERT_TRUE(description.has_value());
  EXPECT_EQ(description->names.longPrefix.str(), "--");
  EXPECT_EQ(description->names.shortPrefix.str(), "-");
  EXPECT_EQ(description->names.longNames.size(), 2U);
  EXPECT_EQ(description->names.longNames.head().str(), "count");
  EXPECT_EQ(description->names.longNames.head().caseSensitivity(), unicode::Case::Insensitive);
  EXPECT_EQ(description->help, Option<String>("How many."));
  EXPECT_EQ(description->defaultValue, Option<i32>(3));
}

TEST_F(DescriptionTest, Create_RejectsMissingLongName) {
  Result<Description<bool>> description = Description<bool>::Create({}, { "f" }, None, None);

  ASSERT_FALSE(description.has_value());
  EXPECT_EQ(description.error().code, ArgoErrorCode::InvalidArgument);
}

TEST_F(DescriptionTest, Create_RejectsEmptyLongName) {
  Result<Description<bool>> description = Description<bool>::Create({ "flag", "" }, {}, None, None);

  ASSERT_FALSE(description.has_value());
  EXPECT_EQ(description.error().code, ArgoErrorCode::InvalidArgument);
}

TEST_F(DescriptionTest, Create_RejectsShortNameLongerThanOneGrapheme) {
  Result<Description<bool>> tooLong = Description<bool>::Create({ "flag" }, { "fl" }, None, None);
  Result<Description<bool>> empty   = Description<bool>::Create({ "flag" }, { "" }, None, None);

  ASSERT_FALSE(tooLong.has_value());
  EXPECT_EQ(tooLong.error().code, ArgoErrorCode::InvalidArgument);
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error().code, ArgoErrorCode::InvalidArgument);
}

TEST_F(DescriptionTest, Create_AcceptsMultiCodePointGraphemeAsShortName) {
  // "e" followed by a combining acute accent.
  Result<Description<bool>> description = Description<bool>::Create({ "accent" }, { "e\xcc\x81" }, None, None);

  ASSERT_TRUE(description.has_value());
  EXPECT_EQ(description->names.shortNames.front().str(), "\xc3\xa9");
}

TEST_F(DescriptionTest, Create_RejectsInvalidUtf8) {
  Result<Description<bool>> description = Description<bool>::Create({ "fl\xff" }, {}, None, None);

  ASSERT_FALSE(description.has_value());
  EXPECT_EQ(description.error().code, ArgoErrorCode::InvalidUnicode);
}

TEST_F(DescriptionTest, CreateWith_UsesCustomPrefixesAndCase) {
  Result<Description<bool>> description = Description<bool>::CreateWith("/", { "Quiet" }, "+", { "q" }, None, None, unicode::Case::Sensitive);

  ASSERT_TRUE(description.has_value());
  EXPECT_EQ(description->names.longPrefix.str(), "/");
  EXPECT_EQ(description->names.shortPrefix.str(), "+");
  EXPECT_TRUE(description->names.longNames.head().matches("Quiet"));
  EXPECT_FALSE(description->names.longNames.head().matches("quiet"));
}

TEST_F(DescriptionTest, ToDisplay_ShowsDefaultAndReturnsTypedValue) {
  Result<Description<i32>> description = Description<i32>::Create({ "count" }, {}, None, 12);
  ASSERT_TRUE(description.has_value());

  auto [display, defaultValue] = std::move(*description).toDisplay([](const i32 value) { return std::format("{} items", value); });

  EXPECT_EQ(display.defaultValue, Option<String>("12 items"));
  EXPECT_EQ(defaultValue, Option<i32>(12));
  EXPECT_EQ(display.names.longNames.head().str(), "count");
}

TEST_F(DescriptionTest, DisplayNames_KeepNormalizedNames) {
  Result<Description<bool>> description = Description<bool>::Create({ "flag", "switch" }, { "f" }, None, None);
  ASSERT_TRUE(description.has_value());

  const DisplayNames names = DisplayNames::FromNames(description->names);

  EXPECT_EQ(names.longPrefix, "--");
  EXPECT_EQ(names.longNames.toVec(), Vec<String>({ "flag", "switch" }));
  EXPECT_EQ(names.shortNames, Vec<String>({ "f" }));
}

TEST_F(DescriptionTest, JoinNames_WrapsAliases) {
  EXPECT_EQ(JoinNames({ "single" }), "single");
  EXPECT_EQ(JoinNames({ "a", "b", "c" }), "(a|b|c)");
}
