#include "infra/http_client.h"

namespace sflight::infra {

core::Error make_http_error(HttpErrorCode code, const std::string &message,
                            int http_status) {
  core::ErrorCategory category = core::ErrorCategory::Unknown;
  switch (code) {
  case HttpErrorCode::NETWORK_ERROR:
    category = core::ErrorCategory::Network;
    break;
  case HttpErrorCode::TIMEOUT:
    category = core::ErrorCategory::Timeout;
    break;
  case HttpErrorCode::CANCELED:
    category = core::ErrorCategory::Cancelled;
    break;
  case HttpErrorCode::SERVER_ERROR:
  case HttpErrorCode::CLIENT_ERROR:
    category = core::ErrorCategory::Http;
    break;
  case HttpErrorCode::UNKNOWN:
    category = core::ErrorCategory::Unknown;
    break;
  }

  std::map<std::string, std::string> details = {
      {"http_error_code", std::to_string(static_cast<int>(code))}};
  if (http_status > 0) {
    details["http_status"] = std::to_string(http_status);
  }

  return core::Error(category, static_cast<int>(code), message,
                     std::move(details));
}

HttpResponse fetch(IHttpClient &client, const HttpRequest &request,
                   core::CancellationToken &token) {
  auto result = token.wait([&] { return client.execute(request, &token); });
  if (result.is_err()) {
    const auto &error = result.error();
    if (error.category == core::ErrorCategory::Cancelled) {
      throw core::CancelledException(error.message);
    }
    throw core::FlightException(error);
  }
  return std::move(result).value();
}

} // namespace sflight::infra
