#include "Argonaut/Core/Language.hpp"

#include <system_error>           // std::error_code
#include <toml++/impl/parser.hpp> // toml::{parse_file, parse_error}

#include "Argonaut/Utils/Logging.hpp"

namespace argonaut::core {
  namespace {
    using utils::error::ArgoErrorCode;
    using utils::types::Pair;
    using utils::types::PCStr;
    using utils::types::Vec;

    fn MakeEnglish() -> Language {
      return {
        .longPrefix         = "--",
        .shortPrefix        = "-",
        .invertPrefix       = "no",
        .invertInfix        = "-",
        .valueInfix         = "=",
        .metaVar            = "VALUE",
        .options            = "OPTIONS",
        .defaultValue       = "Default",
        .allowedValues      = "Possible values",
        .missingFlag        = "Missing Flag",
        .missingValue       = "Missing Value",
        .parseError         = "Parse Error",
        .invalidString      = "Invalid String",
        .unusedArguments    = "Unused argument(s)",
        .helpDescription    = "Show this text.",
        .helpLong           = "help",
        .helpShort          = "h",
        .versionDescription = "Show the current version.",
        .versionLong        = "version",
        .versionShort       = "v",
        .caseSensitivity    = unicode::Case::Insensitive,
      };
    }

    fn MakeGerman() -> Language {
      return {
        .longPrefix         = "--",
        .shortPrefix        = "-",
        .invertPrefix       = "kein",
        .invertInfix        = "-",
        .valueInfix         = "=",
        .metaVar            = "WERT",
        .options            = "OPTIONEN",
        .defaultValue       = "Standard",
        .allowedValues      = "Erlaubte Werte",
        .missingFlag        = "Fehlende Flag",
        .missingValue       = "Fehlender Wert",
        .parseError         = "Parse-Fehler",
        .invalidString      = "Invalider String",
        .unusedArguments    = "Nicht alle Argumente verwendet",
        .helpDescription    = "Zeige diesen Text an.",
        .helpLong           = "hilfe",
        .helpShort          = "h",
        .versionDescription = "Zeige die aktuelle Version an.",
        .versionLong        = "version",
        .versionShort       = "v",
        .caseSensitivity    = unicode::Case::Insensitive,
      };
    }
  } // namespace

  fn Language::English() -> const Language& {
    static const Language ENGLISH = MakeEnglish();
    return ENGLISH;
  }

  fn Language::German() -> const Language& {
    static const Language GERMAN = MakeGerman();
    return GERMAN;
  }

  fn Language::fromToml(const toml::table& tbl, const Language& base) -> Language {
    Language language = base;

    const Vec<Pair<PCStr, String Language::*>> fields = {
      {         "long_prefix",         &Language::longPrefix },
      {        "short_prefix",        &Language::shortPrefix },
      {       "invert_prefix",       &Language::invertPrefix },
      {        "invert_infix",        &Language::invertInfix },
      {         "value_infix",         &Language::valueInfix },
      {            "meta_var",            &Language::metaVar },
      {             "options",            &Language::options },
      {       "default_value",       &Language::defaultValue },
      {      "allowed_values",      &Language::allowedValues },
      {        "missing_flag",        &Language::missingFlag },
      {       "missing_value",       &Language::missingValue },
      {         "parse_error",         &Language::parseError },
      {      "invalid_string",      &Language::invalidString },
      {    "unused_arguments",    &Language::unusedArguments },
      {    "help_description",    &Language::helpDescription },
      {           "help_long",           &Language::helpLong },
      {          "help_short",          &Language::helpShort },
      { "version_description", &Language::versionDescription },
      {        "version_long",        &Language::versionLong },
      {       "version_short",       &Language::versionShort },
    };

    for (const auto& [key, field] : fields)
      if (const toml::node_view<const toml::node> node = tbl[key]) {
        if (auto value = node.value<String>())
          language.*field = *value;
        else
          warn_log("Ignoring non-string language key '{}'", key);
      }

    if (const toml::node_view<const toml::node> caseNode = tbl["case_sensitive"]) {
      if (auto caseSensitive = caseNode.value<bool>())
        language.caseSensitivity = *caseSensitive ? unicode::Case::Sensitive : unicode::Case::Insensitive;
      else
        warn_log("Ignoring non-boolean language key 'case_sensitive'");
    }

    return language;
  }

  fn LoadLanguage(const std::filesystem::path& path, const Language& base) -> Result<Language> {
    std::error_code errc;

    if (!std::filesystem::exists(path, errc)) {
      if (errc)
        ERR_FROM(errc);

      ERR_FMT(ArgoErrorCode::NotFound, "Language file not found at {}", path.string());
    }

    try {
      const toml::table parsed = toml::parse_file(path.string());

      debug_log("Language loaded from {}", path.string());

      if (const toml::table* section = parsed["language"].as_table())
        return Language::fromToml(*section, base);

      return Language::fromToml(parsed, base);
    } catch (const toml::parse_error& err) {
      ERR_FMT(ArgoErrorCode::ConfigurationError, "Failed to parse language file {}: {}", path.string(), err.description());
    }
  }
} // namespace argonaut::core
