/**
 * @file Arguments.hpp
 * @brief Composable command-line argument matchers and the top-level driver.
 *
 * An Arguments<T, E> knows how to turn a token list into a T. Single-argument
 * matchers are created with Flag, Value and friends, combined with Combine,
 * and wrapped with early-exit flags such as help and version. Combining
 * consumes its inputs; a finished matcher is immutable and can be used from
 * several threads at once.
 */

#pragma once

#include <cstdlib>  // std::exit
#include <expected> // std::expected, std::unexpected
#include <format>   // std::format

#include "Argonaut/Core/Description.hpp"
#include "Argonaut/Core/HelpText.hpp"
#include "Argonaut/Core/Language.hpp"
#include "Argonaut/Core/Matching.hpp"
#include "Argonaut/Core/Outcome.hpp"
#include "Argonaut/Utils/Error.hpp"
#include "Argonaut/Utils/Logging.hpp"
#include "Argonaut/Utils/Types.hpp"

namespace argonaut::core {
  namespace {
    using unicode::Comparison;

    using utils::types::Empty;
    using utils::types::Function;
    using utils::types::i32;
    using utils::types::NonEmpty;
    using utils::types::None;
    using utils::types::Option;
    using utils::types::Pair;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::Unit;
    using utils::types::Vec;
  } // namespace

  /**
   * @brief Tokens handed from matcher to matcher.
   *
   * A claimed token is replaced by None so positions stay aligned, the
   * remaining strings are the ones no matcher has recognized yet.
   */
  using Tokens = Vec<Option<String>>;

  /**
   * @struct ShortForms
   * @brief Short names registered under one short prefix, used to split bundles like `-abc`.
   */
  struct ShortForms {
    Comparison      prefix;
    Vec<Comparison> names;
  };

  using ShortFormTable = Vec<ShortForms>;

  /// Adds the short names of an argument to the table, grouped by prefix.
  fn RegisterShortForms(ShortFormTable& table, const ArgumentNames& names) -> Unit;

  /// Appends every entry of @p from to @p into, merging equal prefixes.
  fn MergeShortForms(ShortFormTable& into, const ShortFormTable& from) -> Unit;

  /**
   * @brief Splits bundled short flags into separate tokens.
   *
   * `-vh` becomes `-v`, `-h` if both graphemes are registered short forms of
   * the same prefix. If any grapheme is unknown the token is kept unchanged.
   */
  fn ExpandShortFlagBundles(const Vec<String>& args, const ShortFormTable& table) -> Vec<String>;

  /// The process arguments without the program name.
  fn ArgsFromMain(i32 argc, const char* const* argv) -> Vec<String>;

  /// "{label}: [\"a\", \"b\"]" for the tokens nothing claimed.
  fn UnusedArgumentsMessage(const Vec<String>& leftover, const Language& language) -> String;

  /**
   * @class Arguments
   * @brief A matcher that parses a token list into a T, reporting errors of type E.
   *
   * @tparam T Result type.
   * @tparam E Error type of value conversions.
   */
  template <typename T, typename E>
  class Arguments {
   public:
    using ValueType = T;
    using ErrorType = E;
    using ParseFn   = Function<Pair<Outcome<T, E>, Tokens>(Tokens)>;

    /**
     * @struct Parts
     * @brief Everything an Arguments owns, handed over when it is consumed.
     */
    struct Parts {
      Vec<Configuration> configurations;
      ShortFormTable     shortForms;
      ParseFn            parse;
    };

    Arguments(Vec<Configuration> configurations, ShortFormTable shortForms, ParseFn parse)
      : m_configurations(std::move(configurations)), m_shortForms(std::move(shortForms)), m_parse(std::move(parse)) {}

    /**
     * @brief All configured arguments, in registration order.
     *
     * Useful for rendering a custom help text.
     */
    [[nodiscard]] fn configurations() const -> const Vec<Configuration>& {
      return m_configurations;
    }

    [[nodiscard]] fn shortForms() const -> const ShortFormTable& {
      return m_shortForms;
    }

    /**
     * @brief Runs the matcher on already prepared tokens.
     *
     * No bundle expansion happens here; this is what combinators call.
     */
    [[nodiscard]] fn run(Tokens tokens) const -> Pair<Outcome<T, E>, Tokens> {
      return m_parse(std::move(tokens));
    }

    [[nodiscard]] fn intoParts() && -> Parts {
      return { std::move(m_configurations), std::move(m_shortForms), std::move(m_parse) };
    }

    /**
     * @brief Parses process arguments.
     *
     * Bundled short flags are expanded first, then the matcher runs once.
     *
     * @param args Arguments without the program name.
     * @return The outcome and every token no matcher claimed, in order.
     */
    [[nodiscard]] fn parse(const Vec<String>& args) const -> Pair<Outcome<T, E>, Vec<String>> {
      const Vec<String> expanded = ExpandShortFlagBundles(args, m_shortForms);

      Tokens tokens;
      tokens.reserve(expanded.size());
      for (const String& arg : expanded)
        tokens.emplace_back(arg);

      auto [outcome, rest] = m_parse(std::move(tokens));

      Vec<String> leftover;
      for (Option<String>& token : rest)
        if (token)
          leftover.push_back(std::move(*token));

      return { std::move(outcome), std::move(leftover) };
    }

    /**
     * @brief Parses process arguments, handling early exits directly.
     *
     * Early-exit messages are printed to standard output and the process
     * exits with code 0.
     */
    [[nodiscard]] fn parseWithEarlyExit(const Vec<String>& args) const -> Pair<std::expected<T, NonEmpty<ParseError<E>>>, Vec<String>> {
      auto [outcome, leftover] = parse(args);

      if (outcome.isEarlyExit())
        ExitWithMessages(outcome.messages());

      if (outcome.isErrors())
        return { std::unexpected(std::move(outcome).errors()), std::move(leftover) };

      return { std::move(outcome).value(), std::move(leftover) };
    }

    /**
     * @brief Parses process arguments, exiting on anything but a complete success.
     *
     * Early exits print their messages to standard output and exit with 0.
     * Errors and unclaimed tokens are printed to standard error and the
     * process exits with @p errorCode.
     */
    [[nodiscard]] fn parseComplete(const Vec<String>& args, const i32 errorCode = 1, const Language& language = Language::English()) const -> T {
      auto [outcome, leftover] = parse(args);

      if (outcome.isValue() && leftover.empty())
        return std::move(outcome).value();

      if (outcome.isEarlyExit())
        ExitWithMessages(outcome.messages());

      if (outcome.isErrors())
        for (const ParseError<E>& error : outcome.errors())
          utils::logging::ePrintln(ErrorMessage<E>(error, language));

      if (!leftover.empty())
        utils::logging::ePrintln(UnusedArgumentsMessage(leftover, language));

      std::exit(errorCode);
    }

    /**
     * @brief Wraps this matcher with a flag that ends parsing with a message.
     *
     * Every occurrence of the flag is claimed and contributes @p message. The
     * wrapped matcher always runs on the remaining tokens; if it ends early
     * too, these messages follow its own, otherwise any collected message
     * replaces its outcome.
     */
    [[nodiscard]] fn earlyExit(Description<Empty> description, String message) && -> Arguments {
      ArgumentNames names = description.names;

      auto [display, unused] = std::move(description).toDisplay([](const Empty&) { return String(); });

      RegisterShortForms(m_shortForms, display.names);
      m_configurations.push_back(FlagConfiguration { .description = std::move(display), .invert = None });

      ParseFn parseFn = [inner = std::move(m_parse), names = std::move(names), message = std::move(message)](Tokens tokens) -> Pair<Outcome<T, E>, Tokens> {
        Vec<String> messages;
        Tokens      remaining;
        remaining.reserve(tokens.size());

        for (Option<String>& token : tokens) {
          if (token && MatchFlagToken(names, None, *token)) {
            messages.push_back(message);
            remaining.emplace_back(None);
            continue;
          }

          remaining.push_back(std::move(token));
        }

        auto [outcome, leftover] = inner(std::move(remaining));

        if (outcome.isEarlyExit()) {
          NonEmpty<String> all = std::move(outcome).messages();
          all.extend(std::move(messages));
          return { Outcome<T, E>::EarlyExit(std::move(all)), std::move(leftover) };
        }

        if (Option<NonEmpty<String>> collected = NonEmpty<String>::FromVec(std::move(messages)))
          return { Outcome<T, E>::EarlyExit(std::move(*collected)), std::move(leftover) };

        return { std::move(outcome), std::move(leftover) };
      };

      return Arguments(std::move(m_configurations), std::move(m_shortForms), std::move(parseFn));
    }

    /**
     * @brief Adds a version flag printing "{programName} {version}".
     * @return InvalidArgument if the language's version names are unusable.
     */
    [[nodiscard]] fn version(const StringView programName, const StringView version, const Language& language = Language::English()) && -> Result<Arguments> {
      return std::move(*this).versionWithNames({ language.versionLong }, { language.versionShort }, programName, version, language);
    }

    [[nodiscard]] fn versionWithNames(
      const Vec<String>& longNames,
      const Vec<String>& shortNames,
      const StringView   programName,
      const StringView   version,
      const Language&    language = Language::English()
    ) && -> Result<Arguments> {
      Result<Description<Empty>> description = Description<Empty>::Create(longNames, shortNames, language.versionDescription, None, language);

      if (!description)
        return utils::types::Err(std::move(description).error());

      return std::move(*this).earlyExit(*std::move(description), std::format("{} {}", programName, version));
    }

    /**
     * @brief Adds a help flag printing the help text of all arguments, itself included.
     * @return InvalidArgument if the language's help names are unusable.
     */
    [[nodiscard]] fn help(
      const StringView         programName,
      const Option<StringView> description = None,
      const Option<StringView> version     = None,
      const Language&          language    = Language::English()
    ) && -> Result<Arguments> {
      return std::move(*this).helpWithNames({ language.helpLong }, { language.helpShort }, programName, description, version, language);
    }

    [[nodiscard]] fn helpWithNames(
      const Vec<String>&       longNames,
      const Vec<String>&       shortNames,
      const StringView         programName,
      const Option<StringView> description,
      const Option<StringView> version,
      const Language&          language = Language::English()
    ) && -> Result<Arguments> {
      Result<Description<Empty>> helpDescription = Description<Empty>::Create(longNames, shortNames, language.helpDescription, None, language);

      if (!helpDescription)
        return utils::types::Err(std::move(helpDescription).error());

      // The help flag is part of its own text.
      Vec<Configuration> configurations = m_configurations;
      configurations.push_back(FlagConfiguration {
        .description = Description<Empty>(*helpDescription).toDisplay([](const Empty&) { return String(); }).first,
        .invert      = None,
      });

      String text = HelpText(configurations, programName, description, version, language);

      return std::move(*this).earlyExit(*std::move(helpDescription), std::move(text));
    }

    /**
     * @brief Adds a version flag and a help flag.
     *
     * The version flag is registered first so it appears in the help text.
     */
    [[nodiscard]] fn helpAndVersion(
      const StringView         programName,
      const Option<StringView> description,
      const StringView         version,
      const Language&          language = Language::English()
    ) && -> Result<Arguments> {
      return std::move(*this).version(programName, version, language).and_then([&](Arguments withVersion) {
        return std::move(withVersion).help(programName, description, version, language);
      });
    }

    /**
     * @brief Help text for the arguments configured so far.
     */
    [[nodiscard]] fn helpText(
      const StringView         programName,
      const Option<StringView> description = None,
      const Option<StringView> version     = None,
      const Language&          language    = Language::English()
    ) const -> String {
      return HelpText(m_configurations, programName, description, version, language);
    }

   private:
    Vec<Configuration> m_configurations; ///< Display data, in registration order.
    ShortFormTable     m_shortForms;     ///< Short names usable in bundles.
    ParseFn            m_parse;          ///< The matcher itself.

    [[noreturn]] static fn ExitWithMessages(const NonEmpty<String>& messages) -> Unit {
      for (const String& message : messages)
        utils::logging::Println(message);

      std::exit(0);
    }
  };
} // namespace argonaut::core
