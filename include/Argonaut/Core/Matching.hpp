/**
 * @file Matching.hpp
 * @brief Recognition of a single token against the names of one argument.
 *
 * These functions only classify a token; what a match means (a flag value,
 * a message, a value to convert) is decided by the matcher using them.
 */

#pragma once

#include "Argonaut/Core/Description.hpp"
#include "Argonaut/Core/Unicode.hpp"
#include "Argonaut/Utils/Types.hpp"

namespace argonaut::core {
  namespace {
    using unicode::Comparison;

    using utils::types::Option;
    using utils::types::Pair;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::u8;
  } // namespace

  /**
   * @brief Matches a flag token.
   *
   * Accepts `{long-prefix}{long}` (true), `{long-prefix}{invert-prefix}{invert-infix}{long}`
   * (false, only if @p invert is set) and `{short-prefix}{short}` (true). A token
   * that starts with the long prefix is never tried as a short name.
   *
   * @return The flag state, or None if the token does not name this flag.
   */
  fn MatchFlagToken(const ArgumentNames& names, const Option<Pair<Comparison, Comparison>>& invert, StringView token) -> Option<bool>;

  /**
   * @struct ValueTokenMatch
   * @brief Classification of a token for a value argument.
   */
  struct ValueTokenMatch {
    enum class Kind : u8 {
      NoMatch,      ///< The token does not name this argument.
      AwaitsValue,  ///< The name matched, the value is the next token.
      InlineValue,  ///< The name matched and the value is part of the token.
    };

    Kind           kind = Kind::NoMatch;
    Option<String> value; ///< Set for InlineValue.
  };

  /**
   * @brief Matches a value token.
   *
   * Accepts `{long-prefix}{long}{infix}VALUE`, `{long-prefix}{long}`,
   * `{short-prefix}{short}{infix}VALUE`, `{short-prefix}{short}VALUE` and
   * `{short-prefix}{short}`. The long form splits at the first occurrence of
   * the infix.
   */
  fn MatchValueToken(const ArgumentNames& names, const Comparison& valueInfix, StringView token) -> ValueTokenMatch;
} // namespace argonaut::core
