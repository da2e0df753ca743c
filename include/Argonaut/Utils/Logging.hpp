#pragma once

#include <chrono>                 // std::chrono::system_clock
#include <ctime>                  // localtime_r/s, strftime, time_t, tm
#include <filesystem>             // std::filesystem::path
#include <format>                 // std::format
#include <ftxui/screen/color.hpp> // ftxui::Color
#include <utility>                // std::forward

#ifdef __cpp_lib_print
  #include <cstdio> // stderr
  #include <print>  // std::print
#else
  #include <iostream> // std::{cout, cerr}
#endif

#ifndef NDEBUG
  #include <source_location> // std::source_location
#endif

#include "Error.hpp"
#include "Types.hpp"

namespace argonaut::utils::logging {
  namespace {
    using types::Array;
    using types::LockGuard;
    using types::Mutex;
    using types::PCStr;
    using types::String;
    using types::StringView;
    using types::u8;
    using types::Unit;
    using types::usize;
  } // namespace

  inline fn GetLogMutex() -> Mutex& {
    static Mutex LogMutexInstance;
    return LogMutexInstance;
  }

  /// Escape sequences, labels and colors used for log and error output.
  struct LogStyle {
    static constexpr PCStr RESET_CODE   = "\033[0m";
    static constexpr PCStr BOLD_START   = "\033[1m";
    static constexpr PCStr BOLD_END     = "\033[22m";
    static constexpr PCStr ITALIC_START = "\033[3m";
    static constexpr PCStr ITALIC_END   = "\033[23m";

    static constexpr StringView DEBUG_STR = "DEBUG";
    static constexpr StringView INFO_STR  = "INFO ";
    static constexpr StringView WARN_STR  = "WARN ";
    static constexpr StringView ERROR_STR = "ERROR";

    static constexpr ftxui::Color::Palette16 DEBUG_COLOR    = ftxui::Color::Palette16::Cyan;
    static constexpr ftxui::Color::Palette16 INFO_COLOR     = ftxui::Color::Palette16::Green;
    static constexpr ftxui::Color::Palette16 WARN_COLOR     = ftxui::Color::Palette16::Yellow;
    static constexpr ftxui::Color::Palette16 ERROR_COLOR    = ftxui::Color::Palette16::Red;
    static constexpr ftxui::Color::Palette16 LOCATION_COLOR = ftxui::Color::Palette16::GrayLight;

    static constexpr PCStr TIMESTAMP_FORMAT = "%X";
    static constexpr PCStr LOG_FORMAT       = "{} {} {}";

#ifndef NDEBUG
    static constexpr PCStr FILE_LINE_FORMAT  = "{}:{}";
    static constexpr PCStr DEBUG_LINE_PREFIX = "           ╰─ ";
#endif
  };

  /**
   * @enum LogLevel
   * @brief Represents different log levels.
   */
  enum class LogLevel : u8 {
    Debug,
    Info,
    Warn,
    Error,
  };

  inline fn GetRuntimeLogLevel() -> LogLevel& {
    static LogLevel RuntimeLogLevel = LogLevel::Info;
    return RuntimeLogLevel;
  }

  inline fn SetRuntimeLogLevel(const LogLevel level) -> Unit {
    GetRuntimeLogLevel() = level;
  }

  /// 256-color foreground escape for one of the 16 base palette entries.
  inline fn PaletteCode(const ftxui::Color::Palette16 color) -> String {
    return std::format("\033[38;5;{}m", static_cast<usize>(color));
  }

  /**
   * @brief Wraps text in the escape codes of a palette color.
   * @param text The text to colorize
   * @param color The FTXUI palette entry
   */
  inline fn Colorize(const StringView text, const ftxui::Color::Palette16 color) -> String {
    return std::format("{}{}{}", PaletteCode(color), text, LogStyle::RESET_CODE);
  }

  inline fn Bold(const StringView text) -> String {
    return std::format("{}{}{}", LogStyle::BOLD_START, text, LogStyle::BOLD_END);
  }

  inline fn Italic(const StringView text) -> String {
    return std::format("{}{}{}", LogStyle::ITALIC_START, text, LogStyle::ITALIC_END);
  }

  /**
   * @brief Returns FTXUI color representation for a log level
   * @param level The log level
   * @return FTXUI color code
   */
  constexpr fn GetLevelColor(const LogLevel level) -> ftxui::Color::Palette16 {
    using namespace matchit;
    using enum LogLevel;

    return match(level)(
      is | Debug = LogStyle::DEBUG_COLOR,
      is | Info  = LogStyle::INFO_COLOR,
      is | Warn  = LogStyle::WARN_COLOR,
      is | Error = LogStyle::ERROR_COLOR
    );
  }

  constexpr fn GetLevelString(const LogLevel level) -> StringView {
    using namespace matchit;
    using enum LogLevel;

    return match(level)(
      is | Debug = LogStyle::DEBUG_STR,
      is | Info  = LogStyle::INFO_STR,
      is | Warn  = LogStyle::WARN_STR,
      is | Error = LogStyle::ERROR_STR
    );
  }

  /**
   * @brief Returns the pre-formatted and styled log level strings.
   */
  inline fn GetLevelInfo() -> const Array<String, 4>& {
    using enum LogLevel;

    static const Array<String, 4> LEVEL_INFO_INSTANCE = {
      Bold(Colorize(GetLevelString(Debug), GetLevelColor(Debug))),
      Bold(Colorize(GetLevelString(Info), GetLevelColor(Info))),
      Bold(Colorize(GetLevelString(Warn), GetLevelColor(Warn))),
      Bold(Colorize(GetLevelString(Error), GetLevelColor(Error))),
    };
    return LEVEL_INFO_INSTANCE;
  }

  /// Writes a formatted line to standard output.
  template <typename... Args>
  inline fn Println(std::format_string<Args...> fmt, Args&&... args) -> Unit {
#ifdef __cpp_lib_print
    std::println(fmt, std::forward<Args>(args)...);
#else
    std::cout << std::format(fmt, std::forward<Args>(args)...) << '\n';
#endif
  }

  inline fn Println(const StringView text) -> Unit {
#ifdef __cpp_lib_print
    std::println("{}", text);
#else
    std::cout << text << '\n';
#endif
  }

  /// Writes a line to standard error; parse errors and log lines go here.
  inline fn ePrintln(const StringView text) -> Unit {
#ifdef __cpp_lib_print
    std::println(stderr, "{}", text);
#else
    std::cerr << text << '\n';
#endif
  }

  /**
   * @brief Logs a message with the specified log level, source location, and format string.
   *
   * Log lines go to standard error so they never mix with help or version
   * output on standard output.
   *
   * @tparam Args Parameter pack for format arguments.
   * @param level The log level (DEBUG, INFO, WARN, ERROR).
   * @param loc The source location of the log message (only in Debug builds).
   * @param fmt The format string.
   * @param args The arguments for the format string.
   */
  template <typename... Args>
  fn LogImpl(
    const LogLevel level,
#ifndef NDEBUG
    const std::source_location& loc,
#endif
    std::format_string<Args...> fmt,
    Args&&... args
  ) -> Unit {
    using namespace std::chrono;
    using std::filesystem::path;

    if (level < GetRuntimeLogLevel())
      return;

    const LockGuard lock(GetLogMutex());

    const std::time_t nowTt = system_clock::to_time_t(system_clock::now());
    std::tm           localTm {};

    String timestamp = "??:??:??";

#ifdef _WIN32
    if (localtime_s(&localTm, &nowTt) == 0) {
#else
    if (localtime_r(&nowTt, &localTm) != nullptr) {
#endif
      Array<char, 64> timeBuffer {};

      if (std::strftime(timeBuffer.data(), timeBuffer.size(), LogStyle::TIMESTAMP_FORMAT, &localTm) > 0)
        timestamp = timeBuffer.data();
    }

    String line = std::format(
      LogStyle::LOG_FORMAT,
      Colorize("[" + timestamp + "]", LogStyle::LOCATION_COLOR),
      GetLevelInfo().at(static_cast<usize>(level)),
      std::format(fmt, std::forward<Args>(args)...)
    );

#ifndef NDEBUG
    const String fileLine = std::format(LogStyle::FILE_LINE_FORMAT, path(loc.file_name()).filename().string(), loc.line());
    line += std::format("\n{}", Italic(Colorize(std::format("{}{}", LogStyle::DEBUG_LINE_PREFIX, fileLine), LogStyle::LOCATION_COLOR)));
#endif

    ePrintln(line);
  }

  /**
   * @brief Logs an ArgoError at its own source location, or any exception's what().
   */
  template <typename ErrorType>
  fn LogError(const LogLevel level, const ErrorType& errorObj) -> Unit {
    using DecayedErrorType = std::decay_t<ErrorType>;

#ifndef NDEBUG
    std::source_location logLocation;
#endif

    String errorMessagePart;

    if constexpr (std::is_same_v<DecayedErrorType, error::ArgoError>) {
#ifndef NDEBUG
      logLocation = errorObj.location;
#endif
      errorMessagePart = std::format("{} ({})", errorObj.message, errorObj.code);
    } else {
#ifndef NDEBUG
      logLocation = std::source_location::current();
#endif
      if constexpr (std::is_base_of_v<std::exception, DecayedErrorType>)
        errorMessagePart = errorObj.what();
      else
        errorMessagePart = "Unknown error type logged";
    }

#ifndef NDEBUG
    LogImpl(level, logLocation, "{}", errorMessagePart);
#else
    LogImpl(level, "{}", errorMessagePart);
#endif
  }

#define error_at(error_obj) ::argonaut::utils::logging::LogError(::argonaut::utils::logging::LogLevel::Error, error_obj)

#ifdef NDEBUG
  #define debug_log(fmt, ...) ::argonaut::utils::logging::LogImpl(::argonaut::utils::logging::LogLevel::Debug, fmt __VA_OPT__(, ) __VA_ARGS__)
  #define info_log(fmt, ...)  ::argonaut::utils::logging::LogImpl(::argonaut::utils::logging::LogLevel::Info, fmt __VA_OPT__(, ) __VA_ARGS__)
  #define warn_log(fmt, ...)  ::argonaut::utils::logging::LogImpl(::argonaut::utils::logging::LogLevel::Warn, fmt __VA_OPT__(, ) __VA_ARGS__)
  #define error_log(fmt, ...) ::argonaut::utils::logging::LogImpl(::argonaut::utils::logging::LogLevel::Error, fmt __VA_OPT__(, ) __VA_ARGS__)
#else
  #define debug_log(fmt, ...) \
    ::argonaut::utils::logging::LogImpl(::argonaut::utils::logging::LogLevel::Debug, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
  #define info_log(fmt, ...) \
    ::argonaut::utils::logging::LogImpl(::argonaut::utils::logging::LogLevel::Info, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
  #define warn_log(fmt, ...) \
    ::argonaut::utils::logging::LogImpl(::argonaut::utils::logging::LogLevel::Warn, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
  #define error_log(fmt, ...) \
    ::argonaut::utils::logging::LogImpl(::argonaut::utils::logging::LogLevel::Error, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
#endif
} // namespace argonaut::utils::logging
