#include <Argonaut/Core/Arguments.hpp>
#include <Argonaut/Core/Outcome.hpp>
#include <Argonaut/Utils/Types.hpp>

#include "gtest/gtest.h"

using namespace argonaut::core;
using argonaut::utils::types::i32, argonaut::utils::types::NonEmpty;
using argonaut::utils::types::String, argonaut::utils::types::Vec;

class OutcomeTest : public testing::Test {
 protected:
  static fn Names() -> DisplayNames {
    return {
      .longPrefix  = "--",
      .longNames   = NonEmpty<String>("flag", { "switch" }),
      .shortPrefix = "-",
      .shortNames  = { "f" },
    };
  }
};

TEST_F(OutcomeTest, Value_IsOnlyValue) {
  const auto outcome = Outcome<i32, String>::Value(7);

  EXPECT_TRUE(outcome.isValue());
  EXPECT_FALSE(outcome.isEarlyExit());
  EXPECT_FALSE(outcome.isErrors());
  EXPECT_EQ(outcome.value(), 7);
}

TEST_F(OutcomeTest, Map_TransformsValueOnly) {
  auto mapped = Outcome<i32, String>::Value(7).map([](const i32 value) { return value * 2; });
  ASSERT_TRUE(mapped.isValue());
  EXPECT_EQ(mapped.value(), 14);

  auto exited = Outcome<i32, String>::EarlyExit(NonEmpty<String>("bye")).map([](const i32 value) { return value * 2; });
  ASSERT_TRUE(exited.isEarlyExit());
  EXPECT_EQ(exited.messages().head(), "bye");
}

TEST_F(OutcomeTest, MissingFlagMessage_ShowsInvertedForm) {
  const ParseError<String> error = MissingFlag { .names = Names(), .invertPrefix = "no", .invertInfix = "-" };

  EXPECT_EQ(ErrorMessage(error, Language::English()), "Missing Flag: --[no-](flag|switch) | -f");
}

TEST_F(OutcomeTest, MissingValueMessage_UsesLanguageLabel) {
  const ParseError<String> error = MissingValue { .names = Names(), .valueInfix = "=", .metaVar = "WERT" };

  EXPECT_EQ(ErrorMessage(error, Language::German()), "Fehlender Wert: --(flag|switch)(=| )WERT | -f[=| ]WERT");
}

TEST_F(OutcomeTest, InvalidStringMessage_ShowsRawToken) {
  const ParseError<String> error = ParseFailure<String> {
    .names      = Names(),
    .valueInfix = "=",
    .metaVar    = "VALUE",
    .reason     = InvalidString { .raw = "raw" },
  };

  EXPECT_EQ(ErrorMessage(error, Language::English()), "Parse Error: --(flag|switch)(=| )VALUE | -f[=| ]VALUE\nInvalid String: raw");
}

TEST_F(OutcomeTest, UnusedArgumentsMessage_QuotesEveryToken) {
  EXPECT_EQ(UnusedArgumentsMessage({ "a", "b" }, Language::English()), "Unused argument(s): [\"a\", \"b\"]");
  EXPECT_EQ(UnusedArgumentsMessage({ "x" }, Language::German()), "Nicht alle Argumente verwendet: [\"x\"]");
}

TEST_F(OutcomeTest, NonEmpty_FromVecRejectsEmpty) {
  EXPECT_FALSE(NonEmpty<i32>::FromVec({}).has_value());

  auto items = NonEmpty<i32>::FromVec({ 1, 2 });
  ASSERT_TRUE(items.has_value());

  items->extend(Vec<i32>({ 3 }));
  items->push(4);

  EXPECT_EQ(items->toVec(), Vec<i32>({ 1, 2, 3, 4 }));
  EXPECT_EQ(items->head(), 1);
}
