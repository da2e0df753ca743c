/**
 * @file Combine.hpp
 * @brief Combinators building one matcher out of several.
 */

#pragma once

#include <iterator>    // std::make_move_iterator
#include <tuple>       // std::tuple, std::apply, std::get
#include <type_traits> // std::invoke_result_t
#include <utility>     // std::index_sequence_for

#include "Argonaut/Core/Arguments.hpp"

namespace argonaut::core {
  /**
   * @brief A matcher that claims no tokens and always yields func().
   */
  template <typename E, typename Func>
  fn Constant(Func func) -> Arguments<std::invoke_result_t<Func&>, E> {
    using T = std::invoke_result_t<Func&>;

    typename Arguments<T, E>::ParseFn parse = [func = std::move(func)](Tokens tokens) -> Pair<Outcome<T, E>, Tokens> {
      return { Outcome<T, E>::Value(func()), std::move(tokens) };
    };

    return Arguments<T, E>({}, {}, std::move(parse));
  }

  /**
   * @brief Transforms the value of a matcher, keeping its configurations and short forms.
   */
  template <typename Func, typename A, typename E>
  fn Convert(Func func, Arguments<A, E> arguments) -> Arguments<std::invoke_result_t<Func&, A>, E> {
    using T = std::invoke_result_t<Func&, A>;

    auto [configurations, shortForms, inner] = std::move(arguments).intoParts();

    typename Arguments<T, E>::ParseFn parse = [func = std::move(func), inner = std::move(inner)](Tokens tokens) -> Pair<Outcome<T, E>, Tokens> {
      auto [outcome, rest] = inner(std::move(tokens));
      return { std::move(outcome).map(func), std::move(rest) };
    };

    return Arguments<T, E>(std::move(configurations), std::move(shortForms), std::move(parse));
  }

  /**
   * @brief Combines several matchers into one producing func(values...).
   *
   * The matchers run left to right, each on the tokens the previous ones left
   * unclaimed. If any of them reports errors, all errors are returned in
   * order. Otherwise, if any of them ended early, all messages are returned
   * in order. Only if every matcher produced a value is func called.
   *
   * Configurations and short forms are concatenated in the same order.
   *
   * @code
   * auto args = Combine(
   *   [](bool verbose, i32 count) { return Options { verbose, count }; },
   *   FlagBool(*verbose),
   *   FromString<i32>(*count)
   * );
   * @endcode
   */
  template <typename Func, typename E, typename... Ts>
    requires(sizeof...(Ts) >= 1)
  fn Combine(Func func, Arguments<Ts, E>... arguments) -> Arguments<std::invoke_result_t<Func&, Ts...>, E> {
    using T = std::invoke_result_t<Func&, Ts...>;

    std::tuple<typename Arguments<Ts, E>::Parts...> parts { std::move(arguments).intoParts()... };

    Vec<Configuration> configurations;
    ShortFormTable     shortForms;

    std::apply(
      [&](auto&... part) {
        (configurations.insert(configurations.end(), std::make_move_iterator(part.configurations.begin()), std::make_move_iterator(part.configurations.end())), ...);
        (MergeShortForms(shortForms, part.shortForms), ...);
      },
      parts
    );

    std::tuple<typename Arguments<Ts, E>::ParseFn...> parsers =
      std::apply([](auto&... part) { return std::tuple<typename Arguments<Ts, E>::ParseFn...> { std::move(part.parse)... }; }, parts);

    typename Arguments<T, E>::ParseFn parse = [func = std::move(func), parsers = std::move(parsers)](Tokens tokens) -> Pair<Outcome<T, E>, Tokens> {
      std::tuple<Option<Ts>...> values;
      Vec<ParseError<E>>        errors;
      Vec<String>               messages;

      const auto runOne = [&](const auto& parser, auto& slot) -> Unit {
        auto [outcome, rest] = parser(std::move(tokens));
        tokens               = std::move(rest);

        if (outcome.isValue())
          slot = std::move(outcome).value();
        else if (outcome.isEarlyExit()) {
          Vec<String> collected = std::move(outcome).messages().toVec();
          messages.insert(messages.end(), std::make_move_iterator(collected.begin()), std::make_move_iterator(collected.end()));
        } else {
          Vec<ParseError<E>> collected = std::move(outcome).errors().toVec();
          errors.insert(errors.end(), std::make_move_iterator(collected.begin()), std::make_move_iterator(collected.end()));
        }
      };

      [&]<std::size_t... Index>(std::index_sequence<Index...>) {
        (runOne(std::get<Index>(parsers), std::get<Index>(values)), ...);
      }(std::index_sequence_for<Ts...> {});

      if (!errors.empty() || !messages.empty())
        debug_log("Combined {} matchers: {} error(s), {} message(s)", sizeof...(Ts), errors.size(), messages.size());

      if (Option<NonEmpty<ParseError<E>>> collected = NonEmpty<ParseError<E>>::FromVec(std::move(errors)))
        return { Outcome<T, E>::Errors(std::move(*collected)), std::move(tokens) };

      if (Option<NonEmpty<String>> collected = NonEmpty<String>::FromVec(std::move(messages)))
        return { Outcome<T, E>::EarlyExit(std::move(*collected)), std::move(tokens) };

      return {
        Outcome<T, E>::Value(std::apply([&](auto&... slot) { return func(std::move(*slot)...); }, values)),
        std::move(tokens),
      };
    };

    return Arguments<T, E>(std::move(configurations), std::move(shortForms), std::move(parse));
  }
} // namespace argonaut::core
