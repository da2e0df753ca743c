#include "Argonaut/Core/Matching.hpp"

namespace argonaut::core {
  namespace {
    using unicode::ContainsMatch;
    using unicode::Graphemes;

    using utils::types::None;
    using utils::types::usize;
    using utils::types::Vec;

    using enum ValueTokenMatch::Kind;

    /// Splits a short-form remainder into the first grapheme and the rest.
    fn SplitFirstGrapheme(const StringView text) -> Option<Pair<StringView, StringView>> {
      const Vec<StringView> graphemes = Graphemes(text);

      if (graphemes.empty())
        return None;

      return Pair<StringView, StringView> { graphemes.front(), text.substr(graphemes.front().size()) };
    }
  } // namespace

  fn MatchFlagToken(const ArgumentNames& names, const Option<Pair<Comparison, Comparison>>& invert, const StringView token) -> Option<bool> {
    if (const Option<String> longRest = names.longPrefix.stripPrefixOf(token)) {
      if (ContainsMatch(names.longNames, *longRest))
        return true;

      if (invert)
        if (const Option<String> inverted = invert->first.stripPrefixOf(*longRest))
          if (const Option<String> name = invert->second.stripPrefixOf(*inverted))
            if (ContainsMatch(names.longNames, *name))
              return false;

      return None;
    }

    if (names.shortNames.empty())
      return None;

    if (const Option<String> shortRest = names.shortPrefix.stripPrefixOf(token)) {
      const Vec<StringView> graphemes = Graphemes(*shortRest);

      if (graphemes.size() == 1 && ContainsMatch(names.shortNames, graphemes.front()))
        return true;
    }

    return None;
  }

  fn MatchValueToken(const ArgumentNames& names, const Comparison& valueInfix, const StringView token) -> ValueTokenMatch {
    if (const Option<String> longRest = names.longPrefix.stripPrefixOf(token)) {
      const StringView rest = *longRest;

      // Only the first occurrence of the infix separates name and value.
      usize offset = 0;
      for (const StringView grapheme : Graphemes(rest)) {
        if (Option<String> value = valueInfix.stripPrefixOf(rest.substr(offset))) {
          if (ContainsMatch(names.longNames, rest.substr(0, offset)))
            return { .kind = InlineValue, .value = std::move(value) };

          return {};
        }

        offset += grapheme.size();
      }

      if (ContainsMatch(names.longNames, rest))
        return { .kind = AwaitsValue, .value = None };

      return {};
    }

    if (names.shortNames.empty())
      return {};

    const Option<String> shortRest = names.shortPrefix.stripPrefixOf(token);

    if (!shortRest)
      return {};

    const Option<Pair<StringView, StringView>> split = SplitFirstGrapheme(*shortRest);

    if (!split || !ContainsMatch(names.shortNames, split->first))
      return {};

    const StringView rest = split->second;

    if (Option<String> value = valueInfix.stripPrefixOf(rest))
      return { .kind = InlineValue, .value = std::move(value) };

    if (!rest.empty())
      return { .kind = InlineValue, .value = String(rest) };

    return { .kind = AwaitsValue, .value = None };
  }
} // namespace argonaut::core
