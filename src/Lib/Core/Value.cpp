#include "Argonaut/Core/Value.hpp"

#include <algorithm> // std::ranges::equal
#include <cctype>    // std::tolower

namespace argonaut::core::value {
  namespace {
    using utils::types::Array;
    using utils::types::Pair;

    constexpr Array<Pair<StringView, bool>, 8> BOOL_WORDS = { {
      { "true", true },
      { "false", false },
      { "yes", true },
      { "no", false },
      { "on", true },
      { "off", false },
      { "1", true },
      { "0", false },
    } };

    fn EqualsAsciiIgnoreCase(const StringView lhs, const StringView rhs) -> bool {
      return std::ranges::equal(lhs, rhs, [](const char left, const char right) {
        return std::tolower(static_cast<unsigned char>(left)) == std::tolower(static_cast<unsigned char>(right));
      });
    }
  } // namespace

  fn ParseBool(const StringView text) -> std::expected<bool, String> {
    for (const auto& [word, state] : BOOL_WORDS)
      if (EqualsAsciiIgnoreCase(text, word))
        return state;

    return std::unexpected(std::format("'{}' is not a boolean (true/false, yes/no, on/off, 1/0)", text));
  }
} // namespace argonaut::core::value
