#pragma once

#include <expected>        // std::{unexpected, expected}
#include <format>          // std::formatter
#include <matchit.hpp>     // matchit::{match, is, or_, _}
#include <source_location> // std::source_location
#include <system_error>    // std::error_code

#include "Definitions.hpp"
#include "Types.hpp"

namespace argonaut::utils {
  namespace error {
    namespace {
      using types::Exception;
      using types::String;
      using types::u8;
    } // namespace

    /**
     * @enum ArgoErrorCode
     * @brief Error codes for library setup and configuration problems.
     *
     * Problems with the parsed command line itself are never reported through
     * these codes, they are collected in an Outcome instead.
     */
    enum class ArgoErrorCode : u8 {
      ConfigurationError, ///< A language table or other configuration file is malformed.
      InternalError,      ///< An error occurred within the library's own logic.
      InvalidArgument,    ///< An invalid argument was passed to a function (e.g. an empty long name).
      InvalidUnicode,     ///< A name or string is not valid UTF-8 or could not be normalized.
      IoError,            ///< General I/O error (filesystem, pipes, etc.).
      NotFound,           ///< A required resource (file) was not found.
      Other,              ///< A generic or unclassified error originating from an external library.
      ParseError,         ///< Failed to parse textual data.
      PermissionDenied,   ///< Insufficient permissions to perform the operation.
    };

    /**
     * @struct ArgoError
     * @brief Holds structured information about a setup-time error.
     *
     * Used as the error type in Result for description and language construction.
     */
    struct ArgoError {
      String               message;  ///< A descriptive error message.
      std::source_location location; ///< The source location where the error occurred (file, line, function).
      ArgoErrorCode        code;     ///< The general category of the error.

      ArgoError(const ArgoErrorCode errc, String msg, const std::source_location& loc = std::source_location::current())
        : message(std::move(msg)), location(loc), code(errc) {}

      explicit ArgoError(const Exception& exc, const std::source_location& loc = std::source_location::current())
        : message(exc.what()), location(loc), code(ArgoErrorCode::InternalError) {}

      explicit ArgoError(const std::error_code& errc, const std::source_location& loc = std::source_location::current())
        : message(errc.message()), location(loc) {
        using matchit::match, matchit::is, matchit::or_, matchit::_;
        using enum ArgoErrorCode;
        using enum std::errc;

        code = match(errc)(
          is | or_(file_too_large, io_error)                                                = IoError,
          is | invalid_argument                                                             = InvalidArgument,
          is | or_(no_such_file_or_directory, not_a_directory, is_a_directory, file_exists) = NotFound,
          is | permission_denied                                                            = PermissionDenied,
          is | illegal_byte_sequence                                                        = InvalidUnicode,
          is | _                                                                            = Other
        );
      }
    };
  } // namespace error

  namespace types {
    /**
     * @typedef Result
     * @brief Alias for std::expected<Tp, Er>. Represents a value that can either be
     * a success value of type Tp or an error value of type Er.
     * @tparam Tp The type of the success value.
     * @tparam Er The type of the error value.
     */
    template <typename Tp = void, typename Er = error::ArgoError>
    using Result = std::expected<Tp, Er>;

    /**
     * @typedef Err
     * @brief Alias for std::unexpected<Er>. Used to construct a Result in an error state.
     * @tparam Er The type of the error value.
     */
    template <typename Er = error::ArgoError>
    using Err = std::unexpected<Er>;
  } // namespace types
} // namespace argonaut::utils

#define ERR(errc, msg)          return ::argonaut::utils::types::Err(::argonaut::utils::error::ArgoError(errc, msg))
#define ERR_FROM(err)           return ::argonaut::utils::types::Err(::argonaut::utils::error::ArgoError(err))
#define ERR_FMT(errc, fmt, ...) return ::argonaut::utils::types::Err(::argonaut::utils::error::ArgoError(errc, std::format(fmt, __VA_ARGS__)))

namespace std {
  template <>
  struct formatter<::argonaut::utils::error::ArgoErrorCode> : formatter<::argonaut::utils::types::StringView> {
    template <typename FormatContext>
    fn format(argonaut::utils::error::ArgoErrorCode code, FormatContext& ctx) const {
      using enum argonaut::utils::error::ArgoErrorCode;
      using matchit::match, matchit::is, matchit::_;

      argonaut::utils::types::StringView name = match(code)(
        is | ConfigurationError = "ConfigurationError",
        is | InternalError      = "InternalError",
        is | InvalidArgument    = "InvalidArgument",
        is | InvalidUnicode     = "InvalidUnicode",
        is | IoError            = "IoError",
        is | NotFound           = "NotFound",
        is | Other              = "Other",
        is | ParseError         = "ParseError",
        is | PermissionDenied   = "PermissionDenied",
        is | _                  = "Unknown"
      );

      return formatter<argonaut::utils::types::StringView>::format(name, ctx);
    }
  };
} // namespace std
