#include "Argonaut/Core/Outcome.hpp"

namespace argonaut::core {
  namespace {
    using unicode::Comparison;
    using utils::types::usize;

    fn Strings(const Vec<Comparison>& names) -> Vec<String> {
      Vec<String> strings;
      strings.reserve(names.size());

      for (const Comparison& name : names)
        strings.push_back(name.str());

      return strings;
    }
  } // namespace

  fn DisplayNames::FromNames(const ArgumentNames& names) -> DisplayNames {
    return {
      .longPrefix  = names.longPrefix.str(),
      .longNames   = names.longNames.map([](const Comparison& name) { return name.str(); }),
      .shortPrefix = names.shortPrefix.str(),
      .shortNames  = Strings(names.shortNames),
    };
  }

  fn JoinNames(const Vec<String>& names) -> String {
    if (names.size() == 1)
      return names.front();

    String joined = "(";

    for (usize i = 0; i < names.size(); ++i) {
      if (i > 0)
        joined.push_back('|');

      joined += names[i];
    }

    joined.push_back(')');
    return joined;
  }

  fn MissingFlagMessage(const MissingFlag& error, const Language& language) -> String {
    const DisplayNames& names = error.names;

    String message = std::format(
      "{}: {}[{}{}]{}", language.missingFlag, names.longPrefix, error.invertPrefix, error.invertInfix, JoinNames(names.longNames.toVec())
    );

    if (!names.shortNames.empty())
      message += std::format(" | {}{}", names.shortPrefix, JoinNames(names.shortNames));

    return message;
  }

  fn ValueErrorHeadline(const StringView label, const DisplayNames& names, const StringView valueInfix, const StringView metaVar) -> String {
    String message = std::format("{}: {}{}({}| ){}", label, names.longPrefix, JoinNames(names.longNames.toVec()), valueInfix, metaVar);

    if (!names.shortNames.empty())
      message += std::format(" | {}{}[{}| ]{}", names.shortPrefix, JoinNames(names.shortNames), valueInfix, metaVar);

    return message;
  }
} // namespace argonaut::core
