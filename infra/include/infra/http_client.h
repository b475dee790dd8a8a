#pragma once

#include "core/cancellation_token.h"
#include "core/error.h"
#include "core/result.h"

#include <chrono>
#include <map>
#include <string>

namespace sflight::infra {

enum class HttpMethod { GET, POST };

struct HttpRequest {
  HttpMethod method = HttpMethod::GET;
  std::string url;
  std::map<std::string, std::string> headers;
  std::string body;
  std::string trace_id; // Correlates transport logs with the run
  std::chrono::milliseconds timeout{30000};
};

struct HttpResponse {
  int status_code = 0;
  std::string body;
  std::chrono::milliseconds elapsed_ms{0};
};

/// Transport failure classes, stored as Error::code.
enum class HttpErrorCode {
  NETWORK_ERROR = 1001, // DNS failure, connection refused, reset
  TIMEOUT = 1002,
  CANCELED = 1003,     // Aborted because the run's token was cancelled
  SERVER_ERROR = 1004, // 5xx
  CLIENT_ERROR = 1005, // 4xx
  UNKNOWN = 1999
};

/// Map a transport failure onto core::Error. The http_error_code detail keeps
/// the raw code, http_status the status line when there was one.
core::Error make_http_error(HttpErrorCode code, const std::string &message,
                            int http_status = 0);

class IHttpClient {
public:
  virtual ~IHttpClient() = default;

  /// Perform request synchronously. When token is given, a cancellation
  /// aborts the transfer and yields a CANCELED error.
  virtual core::Result<HttpResponse, core::Error>
  execute(const HttpRequest &request,
          const core::CancellationToken *token = nullptr) = 0;

  core::Result<HttpResponse, core::Error>
  get(const HttpRequest &request,
      const core::CancellationToken *token = nullptr) {
    HttpRequest req = request;
    req.method = HttpMethod::GET;
    return execute(req, token);
  }

  core::Result<HttpResponse, core::Error>
  post(const HttpRequest &request,
       const core::CancellationToken *token = nullptr) {
    HttpRequest req = request;
    req.method = HttpMethod::POST;
    return execute(req, token);
  }
};

/// Throwing adapter for use inside Query/Mutation functions:
/// checkpoints around the transfer, throws CancelledException for a
/// cancelled transfer and FlightException for every other failure.
HttpResponse fetch(IHttpClient &client, const HttpRequest &request,
                   core::CancellationToken &token);

} // namespace sflight::infra
