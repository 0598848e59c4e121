/**
 * @file error.h
 * @brief Error codes and result types for libpasteboard
 *
 * libpasteboard uses a Result type pattern for error handling. Only read
 * paths can fail; write operations on a pasteboard are fire-and-forget.
 */

#ifndef PASTEBOARD_ERROR_H
#define PASTEBOARD_ERROR_H

#include "platform.h"
#include <optional>
#include <string>
#include <variant>

namespace pasteboard {

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
  NotSupported = 6,
  Timeout = 7,

  // Platform errors (500-599)
  PlatformError = 500,
  PermissionDenied = 501,
  ServiceUnavailable = 502,

  // Pasteboard server errors (600-699)
  ServerError = 600,
  MalformedReply = 602,
  ServerNoData = 666
};

/// Error domain attached to errors raised by the pasteboard server layer
constexpr const char *SERVER_ERROR_DOMAIN = "org.pasteboard.server";

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
  std::string domain;   // Subsystem that raised the error

  Error() = default;

  explicit Error(ErrorCode c, std::string msg = "", std::string det = "")
      : code(c), message(std::move(msg)), details(std::move(det)) {}

  /// Check if this represents an error
  bool is_error() const { return code != ErrorCode::Success; }

  /// Check if this represents success
  bool is_ok() const { return code == ErrorCode::Success; }

  /// Numeric value of the code, as reported to foreign callers
  int numeric_code() const { return static_cast<int>(code); }

  /// Get human-readable error string
  std::string to_string() const;

  /// Create success result
  static Error ok() { return Error(ErrorCode::Success); }

  /// The error returned when the server answers a read with no data
  static Error server_no_data();
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type that holds either a value or an error
 *
 * Usage:
 *   Result<std::vector<Url>> result = board.get_file_urls();
 *   if (result) {
 *       auto &urls = result.value();
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
#define PASTEBOARD_TRY(result)                                                 \
  do {                                                                         \
    auto &&_result = (result);                                                 \
    if (_result.is_error()) {                                                  \
      return _result.error();                                                  \
    }                                                                          \
  } while (0)

/// Return early with error if condition is false
#define PASTEBOARD_REQUIRE(condition, error_code, message)                     \
  do {                                                                         \
    if (!(condition)) {                                                        \
      return ::pasteboard::Error(error_code, message);                         \
    }                                                                          \
  } while (0)

// ============================================================================
// Error Code Helpers
// ============================================================================

/// Get human-readable name for error code
PASTEBOARD_API const char *error_code_name(ErrorCode code);

/// Get description for error code
PASTEBOARD_API const char *error_code_description(ErrorCode code);

/// Check if error code is recoverable (worth retrying)
PASTEBOARD_API bool is_recoverable(ErrorCode code);

} // namespace pasteboard

#endif // PASTEBOARD_ERROR_H
