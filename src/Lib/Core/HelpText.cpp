#include "Argonaut/Core/HelpText.hpp"

#include <algorithm>    // std::max
#include <filesystem>   // std::filesystem::{path, read_symlink}
#include <format>       // std::format
#include <system_error> // std::error_code

#include "Argonaut/Core/Outcome.hpp"
#include "Argonaut/Utils/Logging.hpp"

namespace argonaut::core {
  namespace {
    using unicode::Comparison;
    using unicode::GraphemeCount;

    using utils::types::NonEmpty;
    using utils::types::Unit;
    using utils::types::usize;

    fn Strings(const auto& names) -> Vec<String> {
      Vec<String> strings;

      for (const Comparison& name : names)
        strings.push_back(name.str());

      return strings;
    }

    /// One row of the option list before alignment.
    struct Row {
      String                          longPart;
      String                          shortPart;
      const Description<String>*      description;
      const Option<NonEmpty<String>>* allowedValues;
    };

    fn MakeRow(const Configuration& configuration) -> Row {
      static const Option<NonEmpty<String>> NoValues = utils::types::None;

      if (const auto* flag = std::get_if<FlagConfiguration>(&configuration)) {
        const ArgumentNames& names = flag->description.names;

        String longPart = names.longPrefix.str();

        if (flag->invert)
          longPart += std::format("[{}{}]", flag->invert->first.str(), flag->invert->second.str());

        longPart += JoinNames(Strings(names.longNames));

        String shortPart;

        if (!names.shortNames.empty())
          shortPart = std::format("{}{}", names.shortPrefix.str(), JoinNames(Strings(names.shortNames)));

        return { .longPart = std::move(longPart), .shortPart = std::move(shortPart), .description = &flag->description, .allowedValues = &NoValues };
      }

      const auto&          value = std::get<ValueConfiguration>(configuration);
      const ArgumentNames& names = value.description.names;

      String longPart = std::format("{}{}({}| ){}", names.longPrefix.str(), JoinNames(Strings(names.longNames)), value.valueInfix.str(), value.metaVar);

      String shortPart;

      if (!names.shortNames.empty())
        shortPart = std::format("{}{}[{}| ]{}", names.shortPrefix.str(), JoinNames(Strings(names.shortNames)), value.valueInfix.str(), value.metaVar);

      return { .longPart = std::move(longPart), .shortPart = std::move(shortPart), .description = &value.description, .allowedValues = &value.allowedValues };
    }

    fn AppendSuffix(String& line, const Row& row, const Language& language) -> Unit {
      const Option<String>&           help          = row.description->help;
      const Option<String>&           defaultValue  = row.description->defaultValue;
      const Option<NonEmpty<String>>& allowedValues = *row.allowedValues;

      if (help)
        line += *help;

      if (!allowedValues && !defaultValue)
        return;

      if (help)
        line.push_back(' ');

      line.push_back('[');

      if (allowedValues) {
        line += std::format("{}: ", language.allowedValues);

        bool first = true;
        for (const String& allowed : *allowedValues) {
          if (!first)
            line += ", ";

          line += allowed;
          first = false;
        }

        if (defaultValue)
          line += " | ";
      }

      if (defaultValue)
        line += std::format("{}: {}", language.defaultValue, *defaultValue);

      line.push_back(']');
    }
  } // namespace

  fn CurrentExecutableName(const StringView fallback) -> String {
    std::error_code errc;

    const std::filesystem::path executable = std::filesystem::read_symlink("/proc/self/exe", errc);

    if (errc || executable.filename().empty()) {
      debug_log("Executable name unavailable ({}), using '{}'", errc.message(), fallback);
      return String(fallback);
    }

    return executable.filename().string();
  }

  fn HelpText(
    const Vec<Configuration>& configurations,
    const StringView          programName,
    const Option<StringView>  description,
    const Option<StringView>  version,
    const Language&           language,
    const Option<StringView>  executable
  ) -> String {
    String text(programName);

    if (version)
      text += std::format(" {}", *version);

    text.push_back('\n');

    if (description)
      text += std::format("{}\n", *description);

    const String executableName = executable ? String(*executable) : CurrentExecutableName(programName);

    text += std::format("\n{} [{}]\n\n{}:\n", executableName, language.options, language.options);

    Vec<Row> rows;
    rows.reserve(configurations.size());

    usize maxLongWidth = 0;

    for (const Configuration& configuration : configurations) {
      rows.push_back(MakeRow(configuration));
      maxLongWidth = std::max(maxLongWidth, GraphemeCount(rows.back().longPart));
    }

    Vec<String> nameColumns;
    nameColumns.reserve(rows.size());

    usize maxNameWidth = 0;

    for (const Row& row : rows) {
      String column = row.longPart;

      if (!row.shortPart.empty())
        column += std::format("{} | {}", String(maxLongWidth - GraphemeCount(row.longPart), ' '), row.shortPart);

      maxNameWidth = std::max(maxNameWidth, GraphemeCount(column));
      nameColumns.push_back(std::move(column));
    }

    for (usize i = 0; i < rows.size(); ++i) {
      String line = std::format("  {}{}", nameColumns[i], String(2 + maxNameWidth - GraphemeCount(nameColumns[i]), ' '));

      AppendSuffix(line, rows[i], language);

      text += line;
      text.push_back('\n');
    }

    return text;
  }
} // namespace argonaut::core
