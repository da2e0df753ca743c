#include <Argonaut/Core/Combine.hpp>
#include <Argonaut/Core/Flag.hpp>
#include <Argonaut/Core/Value.hpp>
#include <Argonaut/Utils/Types.hpp>

#include "gtest/gtest.h"

using namespace argonaut::core;
using argonaut::utils::error::ArgoErrorCode;
using argonaut::utils::types::Empty, argonaut::utils::types::None, argonaut::utils::types::Option;
using argonaut::utils::types::String, argonaut::utils::types::Vec;

class EarlyExitTest : public testing::Test {
 protected:
  static fn Verbose(Option<bool> defaultValue = false) -> Arguments<bool, String> {
    Result<Description<bool>> description = Description<bool>::Create({ "verbose" }, {}, String("Print more."), defaultValue);

    EXPECT_TRUE(description.has_value());

    return FlagBool(*std::move(description));
  }

  static fn Versioned(Arguments<bool, String> arguments) -> Arguments<bool, String> {
    Result<Arguments<bool, String>> result = std::move(arguments).version("MyProg", "1.0");

    EXPECT_TRUE(result.has_value());

    return *std::move(result);
  }
};

TEST_F(EarlyExitTest, Version_LongName) {
  const Arguments<bool, String> arguments = Versioned(Verbose());

  auto [outcome, leftover] = arguments.parse({ "--version" });

  ASSERT_TRUE(outcome.isEarlyExit());
  EXPECT_EQ(outcome.messages().toVec(), Vec<String>({ "MyProg 1.0" }));
  EXPECT_TRUE(leftover.empty());
}

TEST_F(EarlyExitTest, Version_ShortName) {
  const Arguments<bool, String> arguments = Versioned(Verbose());

  auto [outcome, leftover] = arguments.parse({ "-v" });

  ASSERT_TRUE(outcome.isEarlyExit());
  EXPECT_EQ(outcome.messages().head(), "MyProg 1.0");
}

TEST_F(EarlyExitTest, EveryOccurrence_AddsAMessage) {
  const Arguments<bool, String> arguments = Versioned(Verbose());

  auto [outcome, leftover] = arguments.parse({ "--version", "-v" });

  ASSERT_TRUE(outcome.isEarlyExit());
  EXPECT_EQ(outcome.messages().size(), 2U);
}

TEST_F(EarlyExitTest, Absent_PassesInnerOutcomeThrough) {
  const Arguments<bool, String> arguments = Versioned(Verbose());

  auto [outcome, leftover] = arguments.parse({ "--verbose" });

  ASSERT_TRUE(outcome.isValue());
  EXPECT_TRUE(outcome.value());
}

TEST_F(EarlyExitTest, InnerMatcher_StillClaimsItsTokens) {
  const Arguments<bool, String> arguments = Versioned(Verbose());

  auto [outcome, leftover] = arguments.parse({ "--version", "--verbose", "-x" });

  ASSERT_TRUE(outcome.isEarlyExit());
  EXPECT_EQ(leftover, Vec<String>({ "-x" }));
}

TEST_F(EarlyExitTest, Message_OverridesInnerErrors) {
  const Arguments<bool, String> arguments = Versioned(Verbose(None));

  auto [outcome, leftover] = arguments.parse({ "--version" });

  ASSERT_TRUE(outcome.isEarlyExit());
  EXPECT_EQ(outcome.messages().head(), "MyProg 1.0");
}

TEST_F(EarlyExitTest, UnknownShortName_IsLeftOver) {
  Result<Arguments<bool, String>> arguments = Verbose().helpAndVersion("MyProg", None, "1.0");
  ASSERT_TRUE(arguments.has_value());

  auto [outcome, leftover] = arguments->parse({ "-x" });

  ASSERT_TRUE(outcome.isValue());
  EXPECT_EQ(leftover, Vec<String>({ "-x" }));
}

TEST_F(EarlyExitTest, Help_PrintsHelpTextIncludingItself) {
  Result<Arguments<bool, String>> arguments = Verbose().help("MyProg", "Does things.", "1.0");
  ASSERT_TRUE(arguments.has_value());

  auto [outcome, leftover] = arguments->parse({ "-h" });

  ASSERT_TRUE(outcome.isEarlyExit());
  ASSERT_EQ(outcome.messages().size(), 1U);

  const String& text = outcome.messages().head();

  EXPECT_EQ(text, arguments->helpText("MyProg", "Does things.", "1.0"));
  EXPECT_TRUE(text.starts_with("MyProg 1.0\nDoes things.\n"));
  EXPECT_NE(text.find("  --help"), String::npos);
  EXPECT_NE(text.find(" | -h"), String::npos);
  EXPECT_NE(text.find("Show this text."), String::npos);
}

TEST_F(EarlyExitTest, HelpAndVersion_BundledShortNamesGiveBothMessages) {
  Result<Arguments<bool, String>> arguments = Verbose().helpAndVersion("MyProg", None, "1.0");
  ASSERT_TRUE(arguments.has_value());

  auto [outcome, leftover] = arguments->parse({ "-vh" });

  ASSERT_TRUE(outcome.isEarlyExit());
  ASSERT_EQ(outcome.messages().size(), 2U);
  EXPECT_EQ(outcome.messages()[0], "MyProg 1.0");
  EXPECT_TRUE(outcome.messages()[1].starts_with("MyProg 1.0\n"));
  EXPECT_NE(outcome.messages()[1].find("  --version"), String::npos);
}

TEST_F(EarlyExitTest, HelpAndVersion_GermanNames) {
  const Language& german = Language::German();

  Result<Arguments<bool, String>> arguments = Verbose().helpAndVersion("MeinProg", None, "2.0", german);
  ASSERT_TRUE(arguments.has_value());

  auto [outcome, leftover] = arguments->parse({ "--hilfe" });

  ASSERT_TRUE(outcome.isEarlyExit());
  EXPECT_NE(outcome.messages().head().find("Zeige diesen Text an."), String::npos);
  EXPECT_NE(outcome.messages().head().find("OPTIONEN:"), String::npos);
}

TEST_F(EarlyExitTest, CustomEarlyExit_UsesGivenMessage) {
  Result<Description<Empty>> license = Description<Empty>::Create({ "license" }, {}, String("Show the license."), None);
  ASSERT_TRUE(license.has_value());

  const Arguments<bool, String> arguments = Verbose().earlyExit(*std::move(license), "MIT");

  auto [outcome, leftover] = arguments.parse({ "--LICENSE" });

  ASSERT_TRUE(outcome.isEarlyExit());
  EXPECT_EQ(outcome.messages().head(), "MIT");
  EXPECT_EQ(arguments.configurations().size(), 2U);
}

TEST_F(EarlyExitTest, InvalidNames_AreReportedAsErrors) {
  Result<Arguments<bool, String>> arguments = Verbose().versionWithNames({ "version" }, { "vv" }, "MyProg", "1.0");

  ASSERT_FALSE(arguments.has_value());
  EXPECT_EQ(arguments.error().code, ArgoErrorCode::InvalidArgument);
}

TEST_F(EarlyExitTest, ParseWithEarlyExit_ReturnsErrorsAndLeftovers) {
  const Arguments<bool, String> arguments = Versioned(Verbose(None));

  auto [result, leftover] = arguments.parseWithEarlyExit({ "extra" });

  ASSERT_FALSE(result.has_value());
  EXPECT_TRUE(std::holds_alternative<MissingFlag>(result.error().head()));
  EXPECT_EQ(leftover, Vec<String>({ "extra" }));
}

TEST_F(EarlyExitTest, ParseComplete_ReturnsValueOnCleanSuccess) {
  const Arguments<bool, String> arguments = Versioned(Verbose());

  EXPECT_TRUE(arguments.parseComplete({ "--verbose" }));
}

TEST_F(EarlyExitTest, VersionShortName_ClaimsUppercaseUnderCaseInsensitiveLanguage) {
  Result<Description<bool>> description = Description<bool>::Create({ "verbose" }, { "V" }, None, false);
  ASSERT_TRUE(description.has_value());

  Result<Arguments<bool, String>> arguments = FlagBool(*std::move(description)).helpAndVersion("MyProg", None, "1.0");
  ASSERT_TRUE(arguments.has_value());

  auto [outcome, leftover] = arguments->parse({ "-V" });

  ASSERT_TRUE(outcome.isEarlyExit());
  EXPECT_EQ(outcome.messages().head(), "MyProg 1.0");
}

TEST_F(EarlyExitTest, DistinctShortName_SetsFlagNextToHelpAndVersion) {
  Result<Description<bool>> description = Description<bool>::Create({ "verbose" }, { "d" }, None, false);
  ASSERT_TRUE(description.has_value());

  Result<Arguments<bool, String>> arguments = FlagBool(*std::move(description)).helpAndVersion("MyProg", None, "1.0");
  ASSERT_TRUE(arguments.has_value());

  auto [outcome, leftover] = arguments->parse({ "-d" });

  ASSERT_TRUE(outcome.isValue());
  EXPECT_TRUE(outcome.value());
  EXPECT_TRUE(leftover.empty());
}

class EarlyExitDeathTest : public EarlyExitTest {};

TEST_F(EarlyExitDeathTest, ParseComplete_VersionExitsWithZero) {
  const Arguments<bool, String> arguments = Versioned(Verbose());

  EXPECT_EXIT((void)arguments.parseComplete({ "--version" }), testing::ExitedWithCode(0), "");
}

TEST_F(EarlyExitDeathTest, ParseComplete_ErrorsExitWithErrorCode) {
  const Arguments<bool, String> arguments = Versioned(Verbose(None));

  EXPECT_EXIT((void)arguments.parseComplete({}, 3), testing::ExitedWithCode(3), "Missing Flag: --\\[no-\\]verbose");
}

TEST_F(EarlyExitDeathTest, ParseComplete_LeftoversExitWithErrorCode) {
  const Arguments<bool, String> arguments = Versioned(Verbose());

  EXPECT_EXIT((void)arguments.parseComplete({ "--bogus" }, 2), testing::ExitedWithCode(2), "Unused argument\\(s\\): \\[\"--bogus\"\\]");
}
