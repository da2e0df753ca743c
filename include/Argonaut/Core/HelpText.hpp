/**
 * @file HelpText.hpp
 * @brief Renders the option overview shown by the help flag.
 */

#pragma once

#include "Argonaut/Core/Description.hpp"
#include "Argonaut/Core/Language.hpp"
#include "Argonaut/Utils/Types.hpp"

namespace argonaut::core {
  namespace {
    using utils::types::Option;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::Vec;
  } // namespace

  /**
   * @brief File name of the running executable.
   * @param fallback Returned if the executable cannot be determined.
   */
  fn CurrentExecutableName(StringView fallback) -> String;

  /**
   * @brief Creates the help text for a list of configured arguments.
   *
   * Layout:
   * @code
   * {program} {version}
   * {description}
   *
   * {executable} [OPTIONS]
   *
   * OPTIONS:
   *   --[no-]flag          | -f             Help text. [Default: false]
   *   --value(=| )VALUE    | -v[=| ]VALUE   Help text. [Possible values: a, b | Default: a]
   * @endcode
   * Columns are aligned by grapheme count.
   *
   * @param configurations The arguments to describe, in order.
   * @param programName Name shown in the first line.
   * @param description Optional line below the name.
   * @param version Optional version appended to the name.
   * @param language Labels used in the text.
   * @param executable Name used in the usage line; the running executable if absent.
   */
  fn HelpText(
    const Vec<Configuration>& configurations,
    StringView                programName,
    Option<StringView>        description,
    Option<StringView>        version,
    const Language&           language,
    Option<StringView>        executable = utils::types::None
  ) -> String;
} // namespace argonaut::core
