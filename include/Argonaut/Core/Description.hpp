/**
 * @file Description.hpp
 * @brief Names, help text and default value of a single argument.
 */

#pragma once

#include <variant> // std::variant

#include "Argonaut/Core/Language.hpp"
#include "Argonaut/Core/Unicode.hpp"
#include "Argonaut/Utils/Error.hpp"
#include "Argonaut/Utils/Types.hpp"

namespace argonaut::core {
  namespace {
    using unicode::Case;
    using unicode::Comparison;

    using utils::types::NonEmpty;
    using utils::types::None;
    using utils::types::Option;
    using utils::types::Pair;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::Vec;
  } // namespace

  /**
   * @struct ArgumentNames
   * @brief The validated, normalized names of an argument together with their prefixes.
   */
  struct ArgumentNames {
    Comparison           longPrefix;  ///< Prefix of long names, e.g. "--".
    NonEmpty<Comparison> longNames;   ///< Long names, the first one is shown in help text.
    Comparison           shortPrefix; ///< Prefix of short names, e.g. "-".
    Vec<Comparison>      shortNames;  ///< Short names, exactly one grapheme each.
  };

  /**
   * @brief Validates and normalizes argument names.
   *
   * Fails with InvalidArgument if there is no long name, a name is empty or a
   * short name is not exactly one grapheme, and with InvalidUnicode if a name
   * or prefix is not valid UTF-8.
   */
  fn CreateArgumentNames(
    StringView         longPrefix,
    const Vec<String>& longNames,
    StringView         shortPrefix,
    const Vec<String>& shortNames,
    Case               caseSensitivity
  ) -> Result<ArgumentNames>;

  /**
   * @struct Description
   * @brief Immutable metadata of one logical argument.
   *
   * Built once before the matcher and consumed by exactly one matcher
   * constructor, which keeps the typed default for parsing and turns the
   * rest into a display-only Configuration.
   *
   * @tparam T Type of the default value.
   */
  template <typename T>
  struct Description {
    ArgumentNames  names;        ///< Prefixes and names.
    Option<String> help;         ///< Help text shown next to the names.
    Option<T>      defaultValue; ///< Value used when the argument is absent.

    /**
     * @brief Creates a Description with prefixes and case policy from a Language.
     * @param longNames Long names, the first one is canonical.
     * @param shortNames Short names, one grapheme each.
     * @param help Optional help text.
     * @param defaultValue Optional default value.
     * @param language Source of prefixes and case policy.
     */
    static fn Create(
      const Vec<String>& longNames,
      const Vec<String>& shortNames,
      Option<String>     help,
      Option<T>          defaultValue,
      const Language&    language = Language::English()
    ) -> Result<Description> {
      return CreateWith(
        language.longPrefix,
        longNames,
        language.shortPrefix,
        shortNames,
        std::move(help),
        std::move(defaultValue),
        language.caseSensitivity
      );
    }

    /**
     * @brief Creates a Description with custom prefixes.
     */
    static fn CreateWith(
      const StringView   longPrefix,
      const Vec<String>& longNames,
      const StringView   shortPrefix,
      const Vec<String>& shortNames,
      Option<String>     help,
      Option<T>          defaultValue,
      const Case         caseSensitivity
    ) -> Result<Description> {
      Result<ArgumentNames> names = CreateArgumentNames(longPrefix, longNames, shortPrefix, shortNames, caseSensitivity);

      if (!names)
        return utils::types::Err(std::move(names).error());

      return Description { .names = *std::move(names), .help = std::move(help), .defaultValue = std::move(defaultValue) };
    }

    /**
     * @brief Splits off the typed default, leaving a display-only description.
     * @param show Converts the default to the string shown in help text.
     */
    template <typename Show>
    [[nodiscard]] fn toDisplay(Show&& show) && -> Pair<Description<String>, Option<T>> {
      Option<String> shown;

      if (defaultValue)
        shown = show(*defaultValue);

      return {
        Description<String> { .names = std::move(names), .help = std::move(help), .defaultValue = std::move(shown) },
        std::move(defaultValue),
      };
    }
  };

  /**
   * @struct FlagConfiguration
   * @brief Display data of a flag or early-exit argument.
   */
  struct FlagConfiguration {
    Description<String>                  description; ///< Names, help and shown default.
    Option<Pair<Comparison, Comparison>> invert;      ///< Invert prefix and infix; absent for early-exit flags.
  };

  /**
   * @struct ValueConfiguration
   * @brief Display data of a value argument.
   */
  struct ValueConfiguration {
    Description<String>      description;   ///< Names, help and shown default.
    Comparison               valueInfix;    ///< Separator of an inline value, e.g. "=".
    String                   metaVar;       ///< Placeholder for the value, e.g. "VALUE".
    Option<NonEmpty<String>> allowedValues; ///< Display strings of all allowed values, if enumerable.
  };

  /// Display data of one argument, collected for help text and introspection.
  using Configuration = std::variant<FlagConfiguration, ValueConfiguration>;
} // namespace argonaut::core
