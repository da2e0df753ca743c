#include "Argonaut/Core/Arguments.hpp"

namespace argonaut::core {
  namespace {
    using unicode::ContainsMatch;
    using unicode::Graphemes;

    using utils::types::usize;

    fn FindPrefix(ShortFormTable& table, const Comparison& prefix) -> ShortForms& {
      for (ShortForms& entry : table)
        if (entry.prefix == prefix)
          return entry;

      return table.emplace_back(ShortForms { .prefix = prefix, .names = {} });
    }

    /**
     * @brief Expands one token, or returns None if it is not a bundle of known short forms.
     */
    fn ExpandBundle(const String& arg, const ShortFormTable& table) -> Option<Vec<String>> {
      for (const ShortForms& entry : table) {
        const Option<String> rest = entry.prefix.stripPrefixOf(arg);

        if (!rest || rest->empty())
          continue;

        Vec<String> expanded;

        for (const StringView grapheme : Graphemes(*rest)) {
          if (!ContainsMatch(entry.names, grapheme))
            return None;

          expanded.push_back(entry.prefix.str() + String(grapheme));
        }

        return expanded;
      }

      return None;
    }
  } // namespace

  fn RegisterShortForms(ShortFormTable& table, const ArgumentNames& names) -> Unit {
    if (names.shortNames.empty())
      return;

    ShortForms& entry = FindPrefix(table, names.shortPrefix);
    entry.names.insert(entry.names.end(), names.shortNames.begin(), names.shortNames.end());
  }

  fn MergeShortForms(ShortFormTable& into, const ShortFormTable& from) -> Unit {
    for (const ShortForms& source : from) {
      ShortForms& entry = FindPrefix(into, source.prefix);
      entry.names.insert(entry.names.end(), source.names.begin(), source.names.end());
    }
  }

  fn ExpandShortFlagBundles(const Vec<String>& args, const ShortFormTable& table) -> Vec<String> {
    Vec<String> result;
    result.reserve(args.size());

    for (const String& arg : args) {
      if (Option<Vec<String>> expanded = ExpandBundle(arg, table)) {
        if (expanded->size() > 1)
          debug_log("Expanded short flag bundle '{}' into {} flags", arg, expanded->size());

        for (String& flag : *expanded)
          result.push_back(std::move(flag));

        continue;
      }

      result.push_back(arg);
    }

    return result;
  }

  fn ArgsFromMain(const i32 argc, const char* const* argv) -> Vec<String> {
    Vec<String> args;

    if (argc <= 1 || argv == nullptr)
      return args;

    args.reserve(static_cast<usize>(argc) - 1);

    for (i32 i = 1; i < argc; ++i)
      args.emplace_back(argv[i]);

    return args;
  }

  fn UnusedArgumentsMessage(const Vec<String>& leftover, const Language& language) -> String {
    String list;

    for (usize i = 0; i < leftover.size(); ++i) {
      if (i > 0)
        list += ", ";

      list += std::format("\"{}\"", leftover[i]);
    }

    return std::format("{}: [{}]", language.unusedArguments, list);
  }
} // namespace argonaut::core
