#include <cstdlib> // std::getenv, EXIT_SUCCESS, EXIT_FAILURE

#include <Argonaut/Argonaut.hpp>

using namespace argonaut::utils::types;
using namespace argonaut::utils::logging;
using namespace argonaut::core;

namespace {
  enum class Format : u8 {
    Plain,
    Json,
    Table,
  };

  struct DemoOptions {
    bool     verbose;
    LogLevel logLevel;
    Format   format;
    i32      count;
    String   name;
  };

  /**
   * @brief The built-in English table, or one loaded from $ARGONAUT_LANGUAGE.
   */
  fn SelectLanguage() -> Language {
    const PCStr path = std::getenv("ARGONAUT_LANGUAGE");

    if (path == nullptr || *path == '\0')
      return Language::English();

    if (Result<Language> language = LoadLanguage(path)) {
      debug_log("Loaded language table from '{}'", path);
      return *std::move(language);
    } else
      error_at(language.error());

    return Language::English();
  }

  fn BuildArguments(const Language& language) -> Result<Arguments<DemoOptions, String>> {
    Result<Description<bool>> verbose =
      Description<bool>::Create({ "verbose" }, { "d" }, "Enable verbose logging. Overrides --log-level.", false, language);

    Result<Description<LogLevel>> logLevel =
      Description<LogLevel>::Create({ "log-level" }, { "l" }, "Set the minimum log level.", LogLevel::Info, language);

    Result<Description<Format>> format =
      Description<Format>::Create({ "format" }, { "f" }, "Output format.", Format::Plain, language);

    Result<Description<i32>> count =
      Description<i32>::Create({ "count", "repeat" }, { "c" }, "How often to greet.", 1, language);

    Result<Description<String>> name =
      Description<String>::Create({ "name" }, { "n" }, "Who to greet.", None, language);

    if (!verbose)
      return Err(verbose.error());

    if (!logLevel)
      return Err(logLevel.error());

    if (!format)
      return Err(format.error());

    if (!count)
      return Err(count.error());

    if (!name)
      return Err(name.error());

    Arguments<DemoOptions, String> arguments = Combine(
      [](const bool isVerbose, const LogLevel level, const Format output, const i32 repeat, String target) {
        return DemoOptions {
          .verbose  = isVerbose,
          .logLevel = level,
          .format   = output,
          .count    = repeat,
          .name     = std::move(target),
        };
      },
      FlagBool(*std::move(verbose), language),
      Enum(*std::move(logLevel), "LEVEL", language),
      Enum(*std::move(format), "FORMAT", language),
      FromString(*std::move(count), "N", None, language),
      FromString(*std::move(name), "NAME", None, language)
    );

    return std::move(arguments).helpAndVersion("Argonaut Demo", "Greets someone, configured from the command line.", ARGO_VERSION, language);
  }

  fn Greet(const DemoOptions& options) -> Unit {
    for (i32 i = 0; i < options.count; ++i)
      switch (options.format) {
        case Format::Plain: Println("Hello, {}!", options.name); break;
        case Format::Json:  Println(R"({{"greeting": "Hello", "name": "{}", "index": {}}})", options.name, i); break;
        case Format::Table: Println("| {:>3} | {:<20} |", i + 1, options.name); break;
      }
  }
} // namespace

fn main(const i32 argc, char* argv[]) -> i32 try {
  const Language language = SelectLanguage();

  Result<Arguments<DemoOptions, String>> arguments = BuildArguments(language);

  if (!arguments) {
    error_at(arguments.error());
    return EXIT_FAILURE;
  }

  const DemoOptions options = arguments->parseComplete(ArgsFromMain(argc, argv), EXIT_FAILURE, language);

  SetRuntimeLogLevel(options.verbose ? LogLevel::Debug : options.logLevel);

  debug_log("Parsed options: name='{}', count={}, format={}", options.name, options.count, magic_enum::enum_name(options.format));

  Greet(options);

  return EXIT_SUCCESS;
} catch (const Exception& e) {
  error_at(e);
  return EXIT_FAILURE;
}
