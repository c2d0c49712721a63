/**
 * @file error.h
 * @brief Error codes and result types for ClipWatch
 *
 * ClipWatch uses a Result type pattern for error handling. Failures of the
 * selection protocol are values, not exceptions: a failed cycle is logged
 * and the watcher waits for the next ownership change.
 */

#ifndef CLIPWATCH_ERROR_H
#define CLIPWATCH_ERROR_H

#include "platform.h"
#include <optional>
#include <string>
#include <variant>

namespace clipwatch {

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

  // Display connection errors (100-199), fatal at startup
  ConnectionError = 100,
  ExtensionUnavailable = 101,
  AtomInternFailed = 102,
  ConnectionLost = 103,
  Terminated = 104,

  // Selection protocol errors (200-299), abandon the current cycle
  NoTargetsAvailable = 200,
  ConversionRefused = 201,
  UnsupportedIncrementalTransfer = 202,
  DecodeError = 203,

  // Sink errors (300-399), logged, watch loop continues
  SinkError = 300,
  FileReadError = 301,
  FileWriteError = 302
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
  std::string details; // Additional context

  Error() = default;

  explicit Error(ErrorCode c, std::string msg = "", std::string det = "")
      : code(c), message(std::move(msg)), details(std::move(det)) {}

  /// Check if this represents an error
  bool is_error() const { return code != ErrorCode::Success; }

  /// Check if this represents success
  bool is_ok() const { return code == ErrorCode::Success; }

  /// Get human-readable error string
  std::string to_string() const;
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type that holds either a value or an error
 *
 * Usage:
 *   Result<TargetSet> result = negotiator.negotiate(clipboard);
 *   if (result) {
 *       const TargetSet &targets = result.value();
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

  bool is_ok() const { return !error_.has_value(); }
  bool is_error() const { return error_.has_value(); }
  explicit operator bool() const { return is_ok(); }

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
#define CLIPWATCH_TRY(result)                                                  \
  do {                                                                         \
    auto &&_result = (result);                                                 \
    if (_result.is_error()) {                                                  \
      return _result.error();                                                  \
    }                                                                          \
  } while (0)

// ============================================================================
// Error Code Helpers
// ============================================================================

/// Get human-readable name for error code
CLIPWATCH_API const char *error_code_name(ErrorCode code);

/**
 * @brief Check if error code is recoverable
 *
 * Recoverable errors end the current notification cycle only. The others
 * end the watcher (startup failures, lost connection, termination).
 */
CLIPWATCH_API bool is_recoverable(ErrorCode code);

} // namespace clipwatch

#endif // CLIPWATCH_ERROR_H
