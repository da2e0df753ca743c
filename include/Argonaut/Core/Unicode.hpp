/**
 * @file Unicode.hpp
 * @brief Unicode-aware normalization, comparison and grapheme helpers.
 *
 * Every name an argument is registered under, and every token that is
 * compared against one, goes through this header. Strings are treated as
 * UTF-8; NFC normalization, case folding and grapheme segmentation are
 * delegated to ICU.
 */

#pragma once

#include <variant> // std::variant

#include "Argonaut/Utils/Definitions.hpp"
#include "Argonaut/Utils/Types.hpp"

namespace argonaut::core::unicode {
  namespace {
    using utils::types::Option;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::u8;
    using utils::types::usize;
    using utils::types::Vec;
  } // namespace

  /**
   * @enum Case
   * @brief Case policy of a comparison.
   */
  enum class Case : u8 {
    Sensitive,   ///< Code points must be identical after normalization.
    Insensitive, ///< Full Unicode case folding is applied before comparing.
  };

  /**
   * @class Normalized
   * @brief NFC form of a string, borrowed when the input already is NFC.
   *
   * ASCII input and input that passes the NFC quick check without containing
   * CJK ideographs is kept as a view of the original; everything else is
   * converted and owned. A borrowed Normalized must not outlive its input.
   */
  class Normalized {
   public:
    [[nodiscard]] fn view() const -> StringView;

    [[nodiscard]] fn isBorrowed() const -> bool {
      return std::holds_alternative<StringView>(m_value);
    }

    [[nodiscard]] fn toString() const -> String {
      return String(view());
    }

   private:
    friend fn Normalize(StringView text) -> Normalized;

    explicit Normalized(StringView borrowed)
      : m_value(borrowed) {}

    explicit Normalized(String owned)
      : m_value(std::move(owned)) {}

    std::variant<StringView, String> m_value;
  };

  /**
   * @brief Normalizes a UTF-8 string to NFC.
   *
   * CJK compatibility ideographs are folded to their unified form as part of
   * the canonical decomposition. Invalid UTF-8 is returned unchanged.
   */
  fn Normalize(StringView text) -> Normalized;

  /**
   * @brief Checks whether the given bytes are well-formed UTF-8.
   */
  [[nodiscard]] fn IsValidUtf8(StringView text) -> bool;

  /**
   * @brief Splits a UTF-8 string into extended grapheme clusters.
   * @return Views into @p text, one per grapheme, in order.
   */
  [[nodiscard]] fn Graphemes(StringView text) -> Vec<StringView>;

  /// Number of extended grapheme clusters in @p text.
  [[nodiscard]] fn GraphemeCount(StringView text) -> usize;

  /// Unicode case-insensitive equality (full case folding).
  [[nodiscard]] fn EqualsIgnoreCase(StringView lhs, StringView rhs) -> bool;

  /**
   * @class Comparison
   * @brief A normalized name together with the case policy used to match it.
   *
   * Used for argument names as well as for the prefixes and infixes
   * (e.g. "--", "no", "=") that surround them in a token.
   */
  class Comparison {
   public:
    explicit Comparison(StringView text, Case caseSensitivity = Case::Sensitive);

    /**
     * @brief Checks whether @p text equals this name under its case policy.
     *
     * @p text is normalized first. Invalid UTF-8 never matches.
     */
    [[nodiscard]] fn matches(StringView text) const -> bool;

    /**
     * @brief Removes the longest grapheme-aligned prefix of @p text that matches this name.
     *
     * @p text is normalized before stripping, so the remainder is in NFC.
     * Grapheme clusters are never split.
     *
     * @return The remainder after the prefix, or None if no prefix matches.
     */
    [[nodiscard]] fn stripPrefixOf(StringView text) const -> Option<String>;

    [[nodiscard]] fn str() const -> const String& {
      return m_normalized;
    }

    [[nodiscard]] fn caseSensitivity() const -> Case {
      return m_case;
    }

    fn operator==(const Comparison& other) const -> bool;

   private:
    String m_normalized; ///< NFC form of the name.
    Case   m_case;       ///< How tokens are compared against the name.
  };

  /// Checks whether any of @p names matches @p text.
  template <typename Names>
  [[nodiscard]] fn ContainsMatch(const Names& names, const StringView text) -> bool {
    for (const Comparison& name : names)
      if (name.matches(text))
        return true;

    return false;
  }
} // namespace argonaut::core::unicode
