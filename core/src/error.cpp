#include "core/error.h"

namespace sflight::core {

const char *to_string(ErrorCategory category) {
  switch (category) {
  case ErrorCategory::Cancelled:
    return "Cancelled";
  case ErrorCategory::Disposed:
    return "Disposed";
  case ErrorCategory::InvalidRetry:
    return "InvalidRetry";
  case ErrorCategory::Network:
    return "Network";
  case ErrorCategory::Timeout:
    return "Timeout";
  case ErrorCategory::Http:
    return "Http";
  case ErrorCategory::Unknown:
    return "Unknown";
  }
  return "Unknown";
}

FlightException::FlightException(Error error)
    : std::runtime_error(std::string(to_string(error.category)) + ": " +
                         error.message),
      error_(std::move(error)) {}

std::exception_ptr to_exception_ptr(const Error &error) {
  switch (error.category) {
  case ErrorCategory::Cancelled:
    return std::make_exception_ptr(CancelledException(error.message));
  case ErrorCategory::Disposed:
    return std::make_exception_ptr(DisposedException(error.message));
  case ErrorCategory::InvalidRetry:
    return std::make_exception_ptr(InvalidRetryException());
  default:
    return std::make_exception_ptr(FlightException(error));
  }
}

std::string describe(const std::exception_ptr &error) {
  if (!error) {
    return {};
  }
  try {
    std::rethrow_exception(error);
  } catch (const std::exception &e) {
    return e.what();
  } catch (...) {
    return "unknown exception";
  }
}

} // namespace sflight::core
