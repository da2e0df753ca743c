/**
 * @file Flag.hpp
 * @brief Matchers for boolean flags such as `--verbose`, `--no-verbose` and `-v`.
 */

#pragma once

#include <format> // std::format

#include "Argonaut/Core/Arguments.hpp"

namespace argonaut::core {
  /**
   * @brief Creates a flag whose state is converted to a T.
   *
   * `--{long}` and `-{short}` set the flag, `--{invertPrefix}{invertInfix}{long}`
   * clears it. The last occurrence wins. Without any occurrence the default is
   * used; without a default the result is a MissingFlag error.
   *
   * @param description Names, help and default.
   * @param convert Maps the flag state to a T.
   * @param show Renders the default for help text.
   * @param invertPrefix Negating prefix, e.g. "no".
   * @param invertInfix Separator after the negating prefix, e.g. "-".
   */
  template <typename E = String, typename T, typename Convert, typename Show>
  fn Flag(Description<T> description, Convert convert, Show&& show, const StringView invertPrefix, const StringView invertInfix) -> Arguments<T, E> {
    const unicode::Case caseSensitivity = description.names.longPrefix.caseSensitivity();

    Pair<Comparison, Comparison> invert { Comparison(invertPrefix, caseSensitivity), Comparison(invertInfix, caseSensitivity) };

    ArgumentNames names = description.names;

    auto [display, defaultValue] = std::move(description).toDisplay(std::forward<Show>(show));

    MissingFlag missing {
      .names        = DisplayNames::FromNames(display.names),
      .invertPrefix = invert.first.str(),
      .invertInfix  = invert.second.str(),
    };

    ShortFormTable shortForms;
    RegisterShortForms(shortForms, display.names);

    Vec<Configuration> configurations;
    configurations.push_back(FlagConfiguration { .description = std::move(display), .invert = invert });

    typename Arguments<T, E>::ParseFn parse =
      [names = std::move(names), invert = std::move(invert), defaultValue = std::move(defaultValue), missing = std::move(missing), convert = std::move(convert)](
        Tokens tokens
      ) -> Pair<Outcome<T, E>, Tokens> {
      Option<T> result;
      Tokens    remaining;
      remaining.reserve(tokens.size());

      for (Option<String>& token : tokens) {
        if (token)
          if (const Option<bool> state = MatchFlagToken(names, invert, *token)) {
            result = convert(*state);
            remaining.emplace_back(None);
            continue;
          }

        remaining.push_back(std::move(token));
      }

      if (result)
        return { Outcome<T, E>::Value(std::move(*result)), std::move(remaining) };

      if (defaultValue)
        return { Outcome<T, E>::Value(*defaultValue), std::move(remaining) };

      return { Outcome<T, E>::Errors(NonEmpty<ParseError<E>>(ParseError<E>(missing))), std::move(remaining) };
    };

    return Arguments<T, E>(std::move(configurations), std::move(shortForms), std::move(parse));
  }

  /**
   * @brief Creates a flag of type T using the invert prefix and infix of a Language.
   */
  template <typename E = String, typename T, typename Convert, typename Show>
  fn Flag(Description<T> description, Convert convert, Show&& show, const Language& language = Language::English()) -> Arguments<T, E> {
    return Flag<E>(std::move(description), std::move(convert), std::forward<Show>(show), language.invertPrefix, language.invertInfix);
  }

  /**
   * @brief Creates a plain boolean flag.
   */
  template <typename E = String>
  fn FlagBool(Description<bool> description, const StringView invertPrefix, const StringView invertInfix) -> Arguments<bool, E> {
    return Flag<E>(
      std::move(description),
      [](const bool state) { return state; },
      [](const bool state) { return String(state ? "true" : "false"); },
      invertPrefix,
      invertInfix
    );
  }

  template <typename E = String>
  fn FlagBool(Description<bool> description, const Language& language = Language::English()) -> Arguments<bool, E> {
    return FlagBool<E>(std::move(description), language.invertPrefix, language.invertInfix);
  }
} // namespace argonaut::core
