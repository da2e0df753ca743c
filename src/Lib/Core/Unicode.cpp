#include "Argonaut/Core/Unicode.hpp"

#include <algorithm>         // std::ranges::{all_of, equal, binary_search}
#include <cctype>            // std::tolower
#include <cstdint>           // uint8_t
#include <unicode/brkiter.h> // icu::BreakIterator
#include <unicode/locid.h>   // icu::Locale
#include <unicode/normalizer2.h>
#include <unicode/uchar.h>  // u_hasBinaryProperty
#include <unicode/unistr.h> // icu::UnicodeString
#include <unicode/utext.h>  // utext_openUTF8, icu::LocalUTextPointer
#include <unicode/utf8.h>   // U8_NEXT

#include "Argonaut/Utils/Logging.hpp"

namespace argonaut::core::unicode {
  namespace {
    using utils::types::i32;
    using utils::types::None;
    using utils::types::UniquePointer;

    fn IsAscii(const StringView text) -> bool {
      return std::ranges::all_of(text, [](const char chr) { return static_cast<unsigned char>(chr) < 0x80; });
    }

    fn IsCjkish(const UChar32 codePoint) -> bool {
      // Compatibility ideographs are listed explicitly, they are the ones NFC rewrites.
      return u_hasBinaryProperty(codePoint, UCHAR_IDEOGRAPHIC) ||
        (codePoint >= 0xF900 && codePoint <= 0xFAFF) ||
        (codePoint >= 0x2F800 && codePoint <= 0x2FA1F);
    }

    fn ContainsCjkish(const StringView text) -> bool {
      const auto* bytes  = reinterpret_cast<const uint8_t*>(text.data());
      const auto  length = static_cast<i32>(text.size());

      for (i32 offset = 0; offset < length;) {
        UChar32 codePoint = 0;
        U8_NEXT(bytes, offset, length, codePoint);
        if (codePoint >= 0 && IsCjkish(codePoint))
          return true;
      }

      return false;
    }

    fn GetNfc() -> const icu::Normalizer2* {
      UErrorCode status = U_ZERO_ERROR;

      const icu::Normalizer2* nfc = icu::Normalizer2::getNFCInstance(status);

      if (U_FAILURE(status)) {
        error_log("Failed to load the ICU NFC normalizer: {}", u_errorName(status));
        return nullptr;
      }

      return nfc;
    }

    /**
     * @brief Byte offsets of all grapheme boundaries, including 0 and the end.
     *
     * One break iterator is kept per thread, cloning it is much cheaper than
     * loading the rules again for every token.
     */
    fn GraphemeBoundaries(const StringView text) -> Vec<usize> {
      thread_local UniquePointer<icu::BreakIterator> Iterator = [] {
        UErrorCode status = U_ZERO_ERROR;

        UniquePointer<icu::BreakIterator> iterator(icu::BreakIterator::createCharacterInstance(icu::Locale::getRoot(), status));

        if (U_FAILURE(status)) {
          error_log("Failed to create the ICU grapheme iterator: {}", u_errorName(status));
          return UniquePointer<icu::BreakIterator>();
        }

        return iterator;
      }();

      Vec<usize> boundaries;

      if (text.empty()) {
        boundaries.push_back(0);
        return boundaries;
      }

      UErrorCode status = U_ZERO_ERROR;

      icu::LocalUTextPointer utext(utext_openUTF8(nullptr, text.data(), static_cast<int64_t>(text.size()), &status));

      if (Iterator == nullptr || U_FAILURE(status)) {
        // Without segmentation every code point counts as its own grapheme.
        const auto* bytes  = reinterpret_cast<const uint8_t*>(text.data());
        const auto  length = static_cast<i32>(text.size());

        for (i32 offset = 0; offset < length;) {
          boundaries.push_back(static_cast<usize>(offset));
          UChar32 codePoint = 0;
          U8_NEXT(bytes, offset, length, codePoint);
        }

        boundaries.push_back(text.size());
        return boundaries;
      }

      Iterator->setText(utext.getAlias(), status);

      for (i32 boundary = Iterator->first(); boundary != icu::BreakIterator::DONE; boundary = Iterator->next())
        boundaries.push_back(static_cast<usize>(boundary));

      return boundaries;
    }
  } // namespace

  fn Normalized::view() const -> StringView {
    if (const auto* borrowed = std::get_if<StringView>(&m_value))
      return *borrowed;

    return std::get<String>(m_value);
  }

  fn Normalize(const StringView text) -> Normalized {
    if (IsAscii(text) || !IsValidUtf8(text))
      return Normalized(text);

    const icu::Normalizer2* nfc = GetNfc();

    if (nfc == nullptr)
      return Normalized(text);

    UErrorCode status = U_ZERO_ERROR;

    const icu::UnicodeString unicode = icu::UnicodeString::fromUTF8(icu::StringPiece(text.data(), static_cast<i32>(text.size())));

    if (nfc->quickCheck(unicode, status) == UNORM_YES && U_SUCCESS(status) && !ContainsCjkish(text))
      return Normalized(text);

    status = U_ZERO_ERROR;

    const icu::UnicodeString normalized = nfc->normalize(unicode, status);

    if (U_FAILURE(status)) {
      debug_log("NFC normalization failed ({}), comparing \"{}\" as-is", u_errorName(status), text);
      return Normalized(text);
    }

    String result;
    normalized.toUTF8String(result);

    return Normalized(std::move(result));
  }

  fn IsValidUtf8(const StringView text) -> bool {
    const auto* bytes  = reinterpret_cast<const uint8_t*>(text.data());
    const auto  length = static_cast<i32>(text.size());

    for (i32 offset = 0; offset < length;) {
      UChar32 codePoint = 0;
      U8_NEXT(bytes, offset, length, codePoint);
      if (codePoint < 0)
        return false;
    }

    return true;
  }

  fn Graphemes(const StringView text) -> Vec<StringView> {
    const Vec<usize> boundaries = GraphemeBoundaries(text);

    Vec<StringView> graphemes;
    graphemes.reserve(boundaries.size());

    for (usize i = 1; i < boundaries.size(); ++i)
      graphemes.push_back(text.substr(boundaries[i - 1], boundaries[i] - boundaries[i - 1]));

    return graphemes;
  }

  fn GraphemeCount(const StringView text) -> usize {
    return GraphemeBoundaries(text).size() - 1;
  }

  fn EqualsIgnoreCase(const StringView lhs, const StringView rhs) -> bool {
    if (IsAscii(lhs) && IsAscii(rhs))
      return std::ranges::equal(lhs, rhs, [](const char left, const char right) {
        return std::tolower(static_cast<unsigned char>(left)) == std::tolower(static_cast<unsigned char>(right));
      });

    const icu::UnicodeString left  = icu::UnicodeString::fromUTF8(icu::StringPiece(lhs.data(), static_cast<i32>(lhs.size())));
    const icu::UnicodeString right = icu::UnicodeString::fromUTF8(icu::StringPiece(rhs.data(), static_cast<i32>(rhs.size())));

    return left.caseCompare(right, U_FOLD_CASE_DEFAULT) == 0;
  }

  Comparison::Comparison(const StringView text, const Case caseSensitivity)
    : m_normalized(Normalize(text).toString()), m_case(caseSensitivity) {}

  fn Comparison::matches(const StringView text) const -> bool {
    if (!IsValidUtf8(text))
      return false;

    const Normalized normalized = Normalize(text);

    if (m_case == Case::Sensitive)
      return normalized.view() == m_normalized;

    return EqualsIgnoreCase(normalized.view(), m_normalized);
  }

  fn Comparison::stripPrefixOf(const StringView text) const -> Option<String> {
    if (!IsValidUtf8(text))
      return None;

    const Normalized normalized = Normalize(text);
    const StringView view       = normalized.view();

    if (m_case == Case::Sensitive) {
      if (!view.starts_with(m_normalized))
        return None;

      const Vec<usize> boundaries = GraphemeBoundaries(view);

      if (!std::ranges::binary_search(boundaries, m_normalized.size()))
        return None;

      return String(view.substr(m_normalized.size()));
    }

    // Case folding can change the length, so every boundary is a candidate.
    Option<usize> longest;

    for (const usize boundary : GraphemeBoundaries(view))
      if (EqualsIgnoreCase(view.substr(0, boundary), m_normalized))
        longest = boundary;

    if (!longest)
      return None;

    return String(view.substr(*longest));
  }

  fn Comparison::operator==(const Comparison& other) const -> bool {
    if (m_case != other.m_case)
      return false;

    if (m_case == Case::Sensitive)
      return m_normalized == other.m_normalized;

    return EqualsIgnoreCase(m_normalized, other.m_normalized);
  }
} // namespace argonaut::core::unicode
