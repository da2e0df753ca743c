/**
 * @file Language.hpp
 * @brief Localized strings used for help text, error messages and default names.
 */

#pragma once

#include <filesystem>                // std::filesystem::path
#include <toml++/impl/node.hpp>      // toml::node
#include <toml++/impl/node_view.hpp> // toml::node_view
#include <toml++/impl/table.hpp>     // toml::table

#include "Argonaut/Core/Unicode.hpp"
#include "Argonaut/Utils/Error.hpp"
#include "Argonaut/Utils/Types.hpp"

namespace argonaut::core {
  namespace {
    using utils::types::Result;
    using utils::types::String;
  } // namespace

  /**
   * @struct Language
   * @brief Every user-visible string the library produces on its own.
   *
   * A Language is a plain value, it is passed explicitly to every function
   * that needs one. Two built-in tables exist, any field can be overridden
   * from a TOML file with LoadLanguage.
   */
  struct Language {
    String longPrefix;   ///< Prefix of long names, e.g. "--".
    String shortPrefix;  ///< Prefix of short names, e.g. "-".
    String invertPrefix; ///< Prefix that negates a flag, e.g. "no" in "--no-flag".
    String invertInfix;  ///< Separator between invert prefix and name, e.g. "-".
    String valueInfix;   ///< Separator between name and inline value, e.g. "=".
    String metaVar;      ///< Default placeholder for values in help text.

    String options;         ///< Heading of the option list.
    String defaultValue;    ///< Label of a default value in help text.
    String allowedValues;   ///< Label of the allowed values in help text.
    String missingFlag;     ///< Error label for an absent required flag.
    String missingValue;    ///< Error label for an absent required value.
    String parseError;      ///< Error label for a value that could not be converted.
    String invalidString;   ///< Error label for a value that is not valid UTF-8.
    String unusedArguments; ///< Error label for tokens nothing claimed.

    String helpDescription;    ///< Help text of the help flag.
    String helpLong;           ///< Long name of the help flag.
    String helpShort;          ///< Short name of the help flag.
    String versionDescription; ///< Help text of the version flag.
    String versionLong;        ///< Long name of the version flag.
    String versionShort;       ///< Short name of the version flag.

    unicode::Case caseSensitivity = unicode::Case::Insensitive; ///< How names are compared.

    static fn English() -> const Language&;
    static fn German() -> const Language&;

    /**
     * @brief Creates a Language from a TOML table.
     * @param tbl The table with snake_case keys (e.g. `invert_prefix`).
     * @param base Values used for every key missing from @p tbl.
     * @return The merged Language.
     */
    static fn fromToml(const toml::table& tbl, const Language& base) -> Language;
  };

  /**
   * @brief Loads a Language from a TOML file.
   * @param path Path of the file. A `[language]` table is used if present,
   *             otherwise the root table.
   * @param base Values used for every key missing from the file.
   * @return The Language, NotFound if the file is missing, ConfigurationError on a syntax error.
   */
  fn LoadLanguage(const std::filesystem::path& path, const Language& base = Language::English()) -> Result<Language>;
} // namespace argonaut::core
