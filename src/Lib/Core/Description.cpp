#include "Argonaut/Core/Description.hpp"

namespace argonaut::core {
  namespace {
    using utils::error::ArgoErrorCode;
    using utils::types::usize;
  } // namespace

  fn CreateArgumentNames(
    const StringView   longPrefix,
    const Vec<String>& longNames,
    const StringView   shortPrefix,
    const Vec<String>& shortNames,
    const Case         caseSensitivity
  ) -> Result<ArgumentNames> {
    if (longNames.empty())
      ERR(ArgoErrorCode::InvalidArgument, "An argument needs at least one long name");

    for (const StringView prefix : { longPrefix, shortPrefix })
      if (!unicode::IsValidUtf8(prefix))
        ERR(ArgoErrorCode::InvalidUnicode, "Argument prefixes must be valid UTF-8");

    Vec<Comparison> longComparisons;
    longComparisons.reserve(longNames.size());

    for (const String& name : longNames) {
      if (name.empty())
        ERR(ArgoErrorCode::InvalidArgument, "Long names must not be empty");

      if (!unicode::IsValidUtf8(name))
        ERR_FMT(ArgoErrorCode::InvalidUnicode, "Long name '{}' is not valid UTF-8", name);

      longComparisons.emplace_back(name, caseSensitivity);
    }

    Vec<Comparison> shortComparisons;
    shortComparisons.reserve(shortNames.size());

    for (const String& name : shortNames) {
      if (!unicode::IsValidUtf8(name))
        ERR_FMT(ArgoErrorCode::InvalidUnicode, "Short name '{}' is not valid UTF-8", name);

      // Counted on the normalized form, a decomposed accent is still one grapheme.
      const usize graphemes = unicode::GraphemeCount(unicode::Normalize(name).view());

      if (graphemes != 1)
        ERR_FMT(ArgoErrorCode::InvalidArgument, "Short name '{}' must be exactly one grapheme, got {}", name, graphemes);

      shortComparisons.emplace_back(name, caseSensitivity);
    }

    return ArgumentNames {
      .longPrefix  = Comparison(longPrefix, caseSensitivity),
      .longNames   = *NonEmpty<Comparison>::FromVec(std::move(longComparisons)),
      .shortPrefix = Comparison(shortPrefix, caseSensitivity),
      .shortNames  = std::move(shortComparisons),
    };
  }
} // namespace argonaut::core
