/**
 * @file Outcome.hpp
 * @brief Result of parsing a token list: a value, early-exit messages, or errors.
 */

#pragma once

#include <format>  // std::format
#include <utility> // std::in_place_index
#include <variant> // std::variant

#include "Argonaut/Core/Description.hpp"
#include "Argonaut/Core/Language.hpp"
#include "Argonaut/Utils/Types.hpp"

namespace argonaut::core {
  namespace {
    using utils::types::NonEmpty;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::Vec;
  } // namespace

  /**
   * @struct DisplayNames
   * @brief Displayable identity of an argument, kept in errors so a message
   *        can be rendered without the original Description.
   */
  struct DisplayNames {
    String           longPrefix;  ///< e.g. "--"
    NonEmpty<String> longNames;   ///< Normalized long names.
    String           shortPrefix; ///< e.g. "-"
    Vec<String>      shortNames;  ///< Normalized short names, may be empty.

    static fn FromNames(const ArgumentNames& names) -> DisplayNames;
  };

  /// A required flag was not given.
  struct MissingFlag {
    DisplayNames names;
    String       invertPrefix;
    String       invertInfix;
  };

  /// A required value was not given, or its name was the last token.
  struct MissingValue {
    DisplayNames names;
    String       valueInfix;
    String       metaVar;
  };

  /// A value token was not valid UTF-8.
  struct InvalidString {
    String raw; ///< The token bytes as given.
  };

  /**
   * @struct ParseFailure
   * @brief The name of a value argument matched but converting its value failed.
   * @tparam E Error type of the conversion function.
   */
  template <typename E>
  struct ParseFailure {
    DisplayNames                   names;
    String                         valueInfix;
    String                         metaVar;
    std::variant<InvalidString, E> reason;
  };

  /// One problem with the parsed command line.
  template <typename E>
  using ParseError = std::variant<MissingFlag, MissingValue, ParseFailure<E>>;

  /**
   * @brief Renders names as "name" or "(first|second)".
   */
  fn JoinNames(const Vec<String>& names) -> String;

  fn MissingFlagMessage(const MissingFlag& error, const Language& language) -> String;

  /**
   * @brief Renders the "label: --name(=| )META | -n[=| ]META" line shared by value errors.
   */
  fn ValueErrorHeadline(StringView label, const DisplayNames& names, StringView valueInfix, StringView metaVar) -> String;

  /**
   * @brief Creates a human-readable message for a parse error.
   *
   * The inner error of a ParseFailure is rendered with std::format and
   * appended on its own line.
   */
  template <typename E>
  fn ErrorMessage(const ParseError<E>& error, const Language& language) -> String {
    if (const auto* missingFlag = std::get_if<MissingFlag>(&error))
      return MissingFlagMessage(*missingFlag, language);

    if (const auto* missingValue = std::get_if<MissingValue>(&error))
      return ValueErrorHeadline(language.missingValue, missingValue->names, missingValue->valueInfix, missingValue->metaVar);

    const auto& failure = std::get<ParseFailure<E>>(error);

    String message = ValueErrorHeadline(language.parseError, failure.names, failure.valueInfix, failure.metaVar);
    message.push_back('\n');

    if (const auto* invalid = std::get_if<InvalidString>(&failure.reason))
      message += std::format("{}: {}", language.invalidString, invalid->raw);
    else
      message += std::format("{}", std::get<E>(failure.reason));

    return message;
  }

  /**
   * @brief Converts the inner error type of a parse error.
   */
  template <typename E, typename Func>
  fn MapError(ParseError<E> error, Func&& func) -> ParseError<std::invoke_result_t<Func&, E>> {
    using Out = std::invoke_result_t<Func&, E>;

    if (auto* missingFlag = std::get_if<MissingFlag>(&error))
      return std::move(*missingFlag);

    if (auto* missingValue = std::get_if<MissingValue>(&error))
      return std::move(*missingValue);

    auto& failure = std::get<ParseFailure<E>>(error);

    std::variant<InvalidString, Out> reason =
      std::holds_alternative<InvalidString>(failure.reason)
      ? std::variant<InvalidString, Out>(std::in_place_index<0>, std::get<InvalidString>(std::move(failure.reason)))
      : std::variant<InvalidString, Out>(std::in_place_index<1>, func(std::get<E>(std::move(failure.reason))));

    return ParseFailure<Out> {
      .names      = std::move(failure.names),
      .valueInfix = std::move(failure.valueInfix),
      .metaVar    = std::move(failure.metaVar),
      .reason     = std::move(reason),
    };
  }

  /**
   * @class Outcome
   * @brief Exactly one of: a parsed value, early-exit messages, or parse errors.
   *
   * The message and error lists are never empty.
   *
   * @tparam T Type of the parsed value.
   * @tparam E Error type of value conversions.
   */
  template <typename T, typename E>
  class Outcome {
   public:
    static fn Value(T value) -> Outcome {
      return Outcome(std::in_place_index<0>, std::move(value));
    }

    static fn EarlyExit(NonEmpty<String> messages) -> Outcome {
      return Outcome(std::in_place_index<1>, std::move(messages));
    }

    static fn Errors(NonEmpty<ParseError<E>> errors) -> Outcome {
      return Outcome(std::in_place_index<2>, std::move(errors));
    }

    [[nodiscard]] fn isValue() const -> bool {
      return m_state.index() == 0;
    }

    [[nodiscard]] fn isEarlyExit() const -> bool {
      return m_state.index() == 1;
    }

    [[nodiscard]] fn isErrors() const -> bool {
      return m_state.index() == 2;
    }

    [[nodiscard]] fn value() const& -> const T& {
      return std::get<0>(m_state);
    }

    [[nodiscard]] fn value() && -> T {
      return std::get<0>(std::move(m_state));
    }

    [[nodiscard]] fn messages() const& -> const NonEmpty<String>& {
      return std::get<1>(m_state);
    }

    [[nodiscard]] fn messages() && -> NonEmpty<String> {
      return std::get<1>(std::move(m_state));
    }

    [[nodiscard]] fn errors() const& -> const NonEmpty<ParseError<E>>& {
      return std::get<2>(m_state);
    }

    [[nodiscard]] fn errors() && -> NonEmpty<ParseError<E>> {
      return std::get<2>(std::move(m_state));
    }

    /**
     * @brief Transforms a parsed value, passing messages and errors through.
     */
    template <typename Func>
    fn map(Func&& func) && -> Outcome<std::invoke_result_t<Func&, T>, E> {
      using Out = Outcome<std::invoke_result_t<Func&, T>, E>;

      switch (m_state.index()) {
        case 0:  return Out::Value(func(std::get<0>(std::move(m_state))));
        case 1:  return Out::EarlyExit(std::get<1>(std::move(m_state)));
        default: return Out::Errors(std::get<2>(std::move(m_state)));
      }
    }

   private:
    template <std::size_t Index, typename Arg>
    Outcome(std::in_place_index_t<Index> index, Arg&& arg)
      : m_state(index, std::forward<Arg>(arg)) {}

    std::variant<T, NonEmpty<String>, NonEmpty<ParseError<E>>> m_state;
  };
} // namespace argonaut::core
