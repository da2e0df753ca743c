/**
 * @file Value.hpp
 * @brief Matchers for arguments carrying a value, e.g. `--count=3`, `--count 3` or `-c3`.
 */

#pragma once

#include <charconv>     // std::from_chars
#include <expected>     // std::expected, std::unexpected
#include <format>       // std::format
#include <magic_enum/magic_enum.hpp>
#include <system_error> // std::errc
#include <type_traits>  // std::is_arithmetic_v, std::is_same_v, std::type_identity_t

#include "Argonaut/Core/Arguments.hpp"

namespace argonaut::core {
  namespace value {
    /**
     * @brief Parses a complete string with std::from_chars.
     * @return The number, or a message if the string is empty, malformed or out of range.
     */
    template <typename T>
    fn ParseNumber(const StringView text) -> std::expected<T, String> {
      T number {};

      const char* first = text.data();
      const char* last  = text.data() + text.size();

      // from_chars has no notion of an explicit '+' sign.
      if (first != last && *first == '+') {
        ++first;

        if (first != last && *first == '-')
          return std::unexpected(std::format("'{}' is not a valid number", text));
      }

      const auto [ptr, errc] = std::from_chars(first, last, number);

      if (errc == std::errc::result_out_of_range)
        return std::unexpected(std::format("'{}' is out of range", text));

      if (errc != std::errc() || ptr != last || first == last)
        return std::unexpected(std::format("'{}' is not a valid number", text));

      return number;
    }

    /// true/false, yes/no, on/off or 1/0, ignoring ASCII case.
    fn ParseBool(StringView text) -> std::expected<bool, String>;

    /**
     * @brief Text-to-value conversion used by FromString.
     */
    template <typename T>
    fn ParseText(const StringView text) -> std::expected<T, String> {
      if constexpr (std::is_same_v<T, String>)
        return String(text);
      else if constexpr (std::is_same_v<T, bool>)
        return ParseBool(text);
      else {
        static_assert(std::is_arithmetic_v<T>, "FromString supports numbers, bool and String");
        return ParseNumber<T>(text);
      }
    }

    /**
     * @brief Value-to-text conversion used by FromString.
     */
    template <typename T>
    fn ShowText(const T& value) -> String {
      if constexpr (std::is_same_v<T, bool>)
        return value ? "true" : "false";
      else
        return std::format("{}", value);
    }

    /**
     * @brief Parses an enumerator name, exactly first, then ignoring ASCII case.
     * @return The enumerator, or "'x' is not one of a, b".
     */
    template <typename T>
    fn ParseEnum(const StringView text) -> std::expected<T, String> {
      if (const Option<T> exact = magic_enum::enum_cast<T>(text))
        return *exact;

      if (const Option<T> folded = magic_enum::enum_cast<T>(text, magic_enum::case_insensitive))
        return *folded;

      String names;

      for (const StringView name : magic_enum::enum_names<T>()) {
        if (!names.empty())
          names += ", ";

        names += name;
      }

      return std::unexpected(std::format("'{}' is not one of {}", text, names));
    }
  } // namespace value

  /**
   * @brief Creates a value argument.
   *
   * Accepts `--{long}{infix}VALUE`, `--{long} VALUE`, `-{short}{infix}VALUE`,
   * `-{short}VALUE` and `-{short} VALUE`. The last successful value wins.
   * Every failed conversion, and a name without a value, is recorded as an
   * error; errors take precedence over any value. Without any occurrence the
   * default is used, otherwise the result is a MissingValue error.
   *
   * Short names of value arguments are not available for bundling.
   *
   * @param description Names, help and default.
   * @param metaVar Placeholder shown for the value, e.g. "FILE".
   * @param allowedValues Values listed in help text, if the set is finite.
   * @param parse Converts the value text, StringView -> std::expected<T, E>.
   * @param show Renders a T for help text.
   * @param valueInfix Separator between name and inline value, e.g. "=".
   */
  template <typename E, typename T, typename Parse, typename Show>
  fn Value(
    Description<T>                           description,
    String                                   metaVar,
    std::type_identity_t<Option<NonEmpty<T>>> allowedValues,
    Parse                                    parse,
    Show&&                                   show,
    const StringView                         valueInfix
  ) -> Arguments<T, E> {
    Comparison    infix(valueInfix, description.names.longPrefix.caseSensitivity());
    ArgumentNames names = description.names;

    Option<NonEmpty<String>> shownValues;

    if (allowedValues)
      shownValues = allowedValues->map([&show](const T& allowed) { return String(show(allowed)); });

    auto [display, defaultValue] = std::move(description).toDisplay(std::forward<Show>(show));

    const DisplayNames displayNames = DisplayNames::FromNames(display.names);

    MissingValue missing {
      .names      = displayNames,
      .valueInfix = infix.str(),
      .metaVar    = metaVar,
    };

    ParseFailure<E> failureTemplate {
      .names      = displayNames,
      .valueInfix = infix.str(),
      .metaVar    = metaVar,
      .reason     = InvalidString {},
    };

    Vec<Configuration> configurations;
    configurations.push_back(ValueConfiguration {
      .description   = std::move(display),
      .valueInfix    = infix,
      .metaVar       = std::move(metaVar),
      .allowedValues = std::move(shownValues),
    });

    typename Arguments<T, E>::ParseFn parseFn =
      [names = std::move(names), infix = std::move(infix), defaultValue = std::move(defaultValue), missing = std::move(missing), failureTemplate = std::move(failureTemplate), parse = std::move(parse)](
        Tokens tokens
      ) -> Pair<Outcome<T, E>, Tokens> {
      Option<T>          result;
      Vec<ParseError<E>> errors;
      Tokens             remaining;
      remaining.reserve(tokens.size());

      const auto evaluate = [&](const StringView text) -> Unit {
        if (!unicode::IsValidUtf8(text)) {
          ParseFailure<E> failure = failureTemplate;
          failure.reason          = InvalidString { .raw = String(text) };
          errors.emplace_back(std::move(failure));
          return;
        }

        std::expected<T, E> parsed = parse(text);

        if (parsed) {
          result = std::move(*parsed);
          return;
        }

        ParseFailure<E> failure = failureTemplate;
        failure.reason.template emplace<1>(std::move(parsed).error());
        errors.emplace_back(std::move(failure));
      };

      bool awaitingValue = false;

      for (Option<String>& token : tokens) {
        if (awaitingValue) {
          awaitingValue = false;

          if (token)
            evaluate(*token);
          else
            errors.emplace_back(missing);

          remaining.emplace_back(None);
          continue;
        }

        if (!token) {
          remaining.emplace_back(None);
          continue;
        }

        ValueTokenMatch match = MatchValueToken(names, infix, *token);

        switch (match.kind) {
          case ValueTokenMatch::Kind::NoMatch:
            remaining.push_back(std::move(token));
            break;
          case ValueTokenMatch::Kind::AwaitsValue:
            awaitingValue = true;
            remaining.emplace_back(None);
            break;
          case ValueTokenMatch::Kind::InlineValue:
            evaluate(*match.value);
            remaining.emplace_back(None);
            break;
        }
      }

      if (awaitingValue)
        errors.emplace_back(missing);

      if (Option<NonEmpty<ParseError<E>>> collected = NonEmpty<ParseError<E>>::FromVec(std::move(errors)))
        return { Outcome<T, E>::Errors(std::move(*collected)), std::move(remaining) };

      if (result)
        return { Outcome<T, E>::Value(std::move(*result)), std::move(remaining) };

      if (defaultValue)
        return { Outcome<T, E>::Value(*defaultValue), std::move(remaining) };

      return { Outcome<T, E>::Errors(NonEmpty<ParseError<E>>(ParseError<E>(missing))), std::move(remaining) };
    };

    return Arguments<T, E>(std::move(configurations), ShortFormTable {}, std::move(parseFn));
  }

  /**
   * @brief Creates a value argument using the value infix of a Language.
   */
  template <typename E, typename T, typename Parse, typename Show>
  fn Value(
    Description<T>                           description,
    String                                   metaVar,
    std::type_identity_t<Option<NonEmpty<T>>> allowedValues,
    Parse                                    parse,
    Show&&                                   show,
    const Language&                          language = Language::English()
  ) -> Arguments<T, E> {
    return Value<E>(std::move(description), std::move(metaVar), std::move(allowedValues), std::move(parse), std::forward<Show>(show), StringView(language.valueInfix));
  }

  /**
   * @brief Creates a value argument for numbers, bool or String.
   *
   * Numbers are read with std::from_chars and must use the whole value.
   * Booleans accept true/false, yes/no, on/off and 1/0.
   *
   * @param metaVar Placeholder for the value; the language's default if absent.
   */
  template <typename T>
  fn FromString(
    Description<T>                           description,
    Option<String>                           metaVar       = None,
    std::type_identity_t<Option<NonEmpty<T>>> allowedValues = None,
    const Language&                          language      = Language::English()
  ) -> Arguments<T, String> {
    return Value<String>(
      std::move(description),
      metaVar.value_or(language.metaVar),
      std::move(allowedValues),
      [](const StringView text) { return value::ParseText<T>(text); },
      [](const T& shown) { return value::ShowText<T>(shown); },
      language
    );
  }

  /**
   * @brief Creates a value argument for a scoped enum.
   *
   * All enumerators are allowed values and are shown by name. Parsing falls
   * back to a case-insensitive comparison of the names.
   */
  template <typename T>
    requires std::is_enum_v<T>
  fn Enum(Description<T> description, Option<String> metaVar = None, const Language& language = Language::English()) -> Arguments<T, String> {
    Option<NonEmpty<T>> allowedValues;

    for (const T enumerator : magic_enum::enum_values<T>()) {
      if (allowedValues)
        allowedValues->push(enumerator);
      else
        allowedValues.emplace(enumerator);
    }

    return Value<String>(
      std::move(description),
      metaVar.value_or(language.metaVar),
      std::move(allowedValues),
      [](const StringView text) { return value::ParseEnum<T>(text); },
      [](const T& shown) { return String(magic_enum::enum_name(shown)); },
      language
    );
  }
} // namespace argonaut::core
