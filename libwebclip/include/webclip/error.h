/**
 * @file error.h
 * @brief Error codes and result types for WebClip
 *
 * WebClip uses a Result type pattern for error handling. No exception
 * crosses the public API; every failure surfaces as an Error carried by
 * the returned Result.
 */

#ifndef WEBCLIP_ERROR_H
#define WEBCLIP_ERROR_H

#include "platform.h"
#include <optional>
#include <string>
#include <variant>

namespace webclip {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode : int {
  // Success (0)
  Success = 0,

  // General errors (1-99)
  Unknown = 1,
  InvalidArgument = 2,
  InvalidState = 3,
  NotInitialized = 4,
  AlreadyInitialized = 5,
  NotSupported = 6,
  Cancelled = 8,

  // Gating errors (100-199)
  NoUserGesture = 100,

  // Validation errors (200-299)
  InvalidContentType = 200,
  UnsupportedFormat = 201,
  FormatLimitExceeded = 202,
  PayloadTooLarge = 203,
  FormatNotFound = 204,

  // Native clipboard errors (300-399)
  NativeClipboardFailure = 300,
  PermissionDenied = 301,

  // Configuration errors (400-499)
  ConfigParseError = 400,
  ConfigReadError = 401,
  ConfigWriteError = 402
};

// ============================================================================
// Error Information
// ============================================================================

/**
 * @brief Detailed error information
 */
struct Error {
  ErrorCode code = ErrorCode::Success;
  std::string message;
  std::string details;  // Additional context
  std::string location; // Function/file where error occurred

  Error() = default;

  explicit Error(ErrorCode c, std::string msg = "", std::string det = "")
      : code(c), message(std::move(msg)), details(std::move(det)) {}

  /// Check if this represents an error
  bool is_error() const { return code != ErrorCode::Success; }

  /// Check if this represents success
  bool is_ok() const { return code == ErrorCode::Success; }

  /// Get human-readable error string
  std::string to_string() const;

  /// Create success result
  static Error ok() { return Error(ErrorCode::Success); }
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type that holds either a value or an error
 *
 * Usage:
 *   Result<UnsanitizeList> result = validate_unsanitize_list(raw);
 *   if (result) {
 *       auto &list = result.value();
 *   } else {
 *       Error err = result.error();
 *   }
 */
template <typename T> class Result {
public:
  /// Construct with success value
  Result(T value) : data_(std::move(value)) {}

  /// Construct with error
  Result(Error error) : data_(std::move(error)) {}

  /// Construct with error code
  Result(ErrorCode code, std::string message = "")
      : data_(Error(code, std::move(message))) {}

  /// Check if result is success
  bool is_ok() const { return std::holds_alternative<T>(data_); }

  /// Check if result is error
  bool is_error() const { return std::holds_alternative<Error>(data_); }

  /// Boolean conversion (true = success)
  explicit operator bool() const { return is_ok(); }

  /// Get the value (undefined behavior if error)
  T &value() & { return std::get<T>(data_); }
  const T &value() const & { return std::get<T>(data_); }
  T &&value() && { return std::get<T>(std::move(data_)); }

  /// Get the error (undefined behavior if success)
  Error &error() & { return std::get<Error>(data_); }
  const Error &error() const & { return std::get<Error>(data_); }

  /// Get value or default
  T value_or(T default_value) const {
    return is_ok() ? std::get<T>(data_) : std::move(default_value);
  }

  /// Get optional value
  std::optional<T> to_optional() const {
    return is_ok() ? std::optional<T>(std::get<T>(data_)) : std::nullopt;
  }

private:
  std::variant<T, Error> data_;
};

/**
 * @brief Specialization for void result (success or error, no value)
 */
template <> class Result<void> {
public:
  /// Construct success
  Result() : error_(std::nullopt) {}

  /// Construct with error
  Result(Error error) : error_(std::move(error)) {}

  /// Construct with error code
  Result(ErrorCode code, std::string message = "")
      : error_(Error(code, std::move(message))) {}

  /// Check if result is success
  bool is_ok() const { return !error_.has_value(); }

  /// Check if result is error
  bool is_error() const { return error_.has_value(); }

  /// Boolean conversion (true = success)
  explicit operator bool() const { return is_ok(); }

  /// Get the error
  Error &error() { return error_.value(); }
  const Error &error() const { return error_.value(); }

  /// Create success result
  static Result ok() { return Result(); }

private:
  std::optional<Error> error_;
};

// ============================================================================
// Convenience Macros
// ============================================================================

/// Return early if result is error
#define WEBCLIP_TRY(result)                                                    \
  do {                                                                         \
    auto &&_result = (result);                                                 \
    if (_result.is_error()) {                                                  \
      return _result.error();                                                  \
    }                                                                          \
  } while (0)

/// Return early with error if condition is false
#define WEBCLIP_REQUIRE(condition, error_code, message)                        \
  do {                                                                         \
    if (!(condition)) {                                                        \
      return ::webclip::Error(error_code, message);                            \
    }                                                                          \
  } while (0)

// ============================================================================
// Error Code Helpers
// ============================================================================

/// Get human-readable name for error code
WEBCLIP_API const char *error_code_name(ErrorCode code);

/// Get description for error code
WEBCLIP_API const char *error_code_description(ErrorCode code);

/// Check if error code is recoverable by retrying the same call later
WEBCLIP_API bool is_recoverable(ErrorCode code);

} // namespace webclip

#endif // WEBCLIP_ERROR_H
