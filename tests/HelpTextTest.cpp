#include <utility> // std::exchange

#include <Argonaut/Core/Combine.hpp>
#include <Argonaut/Core/Flag.hpp>
#include <Argonaut/Core/HelpText.hpp>
#include <Argonaut/Core/Value.hpp>
#include <Argonaut/Utils/Types.hpp>

#include "gtest/gtest.h"

using namespace argonaut::core;
using argonaut::utils::types::i32, argonaut::utils::types::u8;
using argonaut::utils::types::None, argonaut::utils::types::Option, argonaut::utils::types::String, argonaut::utils::types::Vec;

namespace {
  enum class Colour : u8 {
    Red,
    Green,
    Blue,
  };

  template <typename T>
  fn Describe(const Vec<String>& longNames, const Vec<String>& shortNames, Option<String> help, Option<T> defaultValue = None) -> Description<T> {
    Result<Description<T>> description = Description<T>::Create(longNames, shortNames, std::move(help), std::move(defaultValue));

    EXPECT_TRUE(description.has_value());

    return *std::move(description);
  }

  fn Lines(const String& text) -> Vec<String> {
    Vec<String> lines;
    String      current;

    for (const char chr : text)
      if (chr == '\n')
        lines.push_back(std::exchange(current, {}));
      else
        current.push_back(chr);

    if (!current.empty())
      lines.push_back(current);

    return lines;
  }
} // namespace

class HelpTextTest : public testing::Test {
 protected:
  static fn FlagAndCount() -> Vec<Configuration> {
    const auto arguments = Combine(
      [](const bool flag, const i32 count) { return std::pair { flag, count }; },
      FlagBool(Describe<bool>({ "flag" }, { "f" }, String("A flag."), false)),
      FromString(Describe<i32>({ "count" }, { "c" }, String("Count."), 3))
    );

    return arguments.configurations();
  }
};

TEST_F(HelpTextTest, Header_ContainsNameVersionDescriptionAndUsage) {
  const String text = HelpText(FlagAndCount(), "Prog", "Description.", "1.0", Language::English(), "prog");

  EXPECT_TRUE(text.starts_with("Prog 1.0\nDescription.\n\nprog [OPTIONS]\n\nOPTIONS:\n"));
}

TEST_F(HelpTextTest, Header_OmitsMissingVersionAndDescription) {
  const String text = HelpText({}, "Prog", None, None, Language::English(), "prog");

  EXPECT_EQ(text, "Prog\n\nprog [OPTIONS]\n\nOPTIONS:\n");
}

TEST_F(HelpTextTest, Rows_AreAlignedInColumns) {
  const Vec<String> lines = Lines(HelpText(FlagAndCount(), "Prog", None, None, Language::English(), "prog"));

  ASSERT_EQ(lines.size(), 7U);
  EXPECT_EQ(lines[5], "  --[no-]flag" + String(6, ' ') + " | -f" + String(12, ' ') + "A flag. [Default: false]");
  EXPECT_EQ(lines[6], "  --count(=| )VALUE | -c[=| ]VALUE  Count. [Default: 3]");
}

TEST_F(HelpTextTest, AllowedValues_AreListedBeforeDefault) {
  const Arguments<Colour, String> colour = Enum(Describe<Colour>({ "colour" }, {}, String("Colour."), Colour::Red));

  const String text = HelpText(colour.configurations(), "Prog", None, None, Language::English(), "prog");

  EXPECT_NE(text.find("  --colour(=| )VALUE  Colour. [Possible values: Red, Green, Blue | Default: Red]\n"), String::npos);
}

TEST_F(HelpTextTest, RowWithoutHelpOrDefault_EndsAfterNames) {
  const Arguments<bool, String> flag = FlagBool(Describe<bool>({ "quiet" }, {}, None));

  const String text = HelpText(flag.configurations(), "Prog", None, None, Language::English(), "prog");

  EXPECT_TRUE(text.ends_with("OPTIONS:\n  --[no-]quiet  \n"));
}

TEST_F(HelpTextTest, Alignment_CountsGraphemesNotBytes) {
  const auto arguments = Combine(
    [](const bool umlaut, const bool size) { return std::pair { umlaut, size }; },
    FlagBool(Describe<bool>({ "\xc3\xbc" "ber" }, { "\xc3\xbc" }, String("Umlaut."))),
    FlagBool(Describe<bool>({ "size" }, { "s" }, String("Size.")))
  );

  const Vec<String> lines = Lines(HelpText(arguments.configurations(), "Prog", None, None, Language::English(), "prog"));

  ASSERT_EQ(lines.size(), 7U);
  EXPECT_EQ(lines[5], "  --[no-]\xc3\xbc" "ber | -\xc3\xbc  Umlaut.");
  EXPECT_EQ(lines[6], "  --[no-]size | -s  Size.");
}

TEST_F(HelpTextTest, GermanLabels_AreUsed) {
  const Arguments<i32, String> count = FromString(Describe<i32>({ "anzahl" }, {}, None, 2), None, None, Language::German());

  const String text = HelpText(count.configurations(), "Prog", None, None, Language::German(), "prog");

  EXPECT_NE(text.find("prog [OPTIONEN]\n\nOPTIONEN:\n"), String::npos);
  EXPECT_NE(text.find("--anzahl(=| )WERT  [Standard: 2]"), String::npos);
}

TEST_F(HelpTextTest, CurrentExecutableName_NamesTheTestBinary) {
  EXPECT_EQ(CurrentExecutableName("fallback"), "argonaut-tests");
}
