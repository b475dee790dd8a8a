#pragma once

#include "infra/http_client.h"

#include <cstdint>
#include <mutex>

// Hides libcurl from includers.
typedef void CURL;

namespace sflight::infra {

/// libcurl (easy interface) HTTP client.
/// Supports GET/POST, a per-request timeout and cancellation through the
/// run's token. One easy handle, requests are serialized on it.
class CurlHttpClient : public IHttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  core::Result<HttpResponse, core::Error>
  execute(const HttpRequest &request,
          const core::CancellationToken *token = nullptr) override;

private:
  CURL *curl_;
  std::mutex curl_mutex_;

  static HttpErrorCode classify_curl_error(int curl_code);

  static size_t write_callback(char *ptr, size_t size, size_t nmemb,
                               void *userdata);
  static int progress_callback(void *clientp, std::int64_t dltotal,
                               std::int64_t dlnow, std::int64_t ultotal,
                               std::int64_t ulnow);
};

} // namespace sflight::infra
