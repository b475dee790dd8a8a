#pragma once

#include <exception>
#include <map>
#include <stdexcept>
#include <string>

namespace sflight::core {

/// Error categories — enables programmatic branching on error type
/// without string parsing.
enum class ErrorCategory {
  Cancelled,    // Superseded by a newer submission
  Disposed,     // Interaction with a torn-down state machine
  InvalidRetry, // retry() before any run()
  Network,      // Transport could not reach the peer
  Timeout,      // Transport deadline exceeded
  Http,         // Peer answered with a 4xx/5xx status
  Unknown
};

const char *to_string(ErrorCategory category);

/// Structured error value shared by Result<T, Error> returns and the
/// exceptions below.
struct Error {
  ErrorCategory category = ErrorCategory::Unknown;
  int code = 0;        // Numeric code for log aggregation
  std::string message; // Human-readable detail
  std::map<std::string, std::string> details; // e.g. {"http_status", "503"}

  Error() = default;

  Error(ErrorCategory cat, int c, std::string msg,
        std::map<std::string, std::string> dets = {})
      : category(cat), code(c), message(std::move(msg)),
        details(std::move(dets)) {}

  static Error Cancelled(std::string msg = "Operation cancelled") {
    return {ErrorCategory::Cancelled, 1, std::move(msg)};
  }
  static Error Disposed(std::string msg = "State machine disposed") {
    return {ErrorCategory::Disposed, 2, std::move(msg)};
  }
  static Error InvalidRetry(
      std::string msg = "Unable to retry a mutation that has not been run yet") {
    return {ErrorCategory::InvalidRetry, 3, std::move(msg)};
  }
};

/// Exception form of Error. Thrown out of task bodies and stored in futures.
class FlightException : public std::runtime_error {
public:
  explicit FlightException(Error error);

  [[nodiscard]] const Error &error() const noexcept { return error_; }
  [[nodiscard]] ErrorCategory category() const noexcept {
    return error_.category;
  }

private:
  Error error_;
};

/// Thrown by CancellationToken::guard()/wait() once the token was superseded.
class CancelledException : public FlightException {
public:
  explicit CancelledException(std::string msg = "Operation cancelled")
      : FlightException(Error::Cancelled(std::move(msg))) {}
};

class DisposedException : public FlightException {
public:
  explicit DisposedException(std::string msg = "State machine disposed")
      : FlightException(Error::Disposed(std::move(msg))) {}
};

class InvalidRetryException : public FlightException {
public:
  InvalidRetryException() : FlightException(Error::InvalidRetry()) {}
};

/// Build the exception matching error.category (Cancelled, Disposed and
/// InvalidRetry get their dedicated types).
std::exception_ptr to_exception_ptr(const Error &error);

/// Best-effort description of a stored exception: what() for std::exception,
/// "unknown exception" otherwise. Null yields an empty string.
std::string describe(const std::exception_ptr &error);

} // namespace sflight::core
