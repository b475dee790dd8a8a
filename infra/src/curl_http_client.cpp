#include "infra/curl_http_client.h"

#include <curl/curl.h>

#include <chrono>
#include <stdexcept>

namespace sflight::infra {

namespace {
// libcurl global state, initialized once per process.
struct CurlGlobalInit {
  CurlGlobalInit() { curl_global_init(CURL_GLOBAL_ALL); }
  ~CurlGlobalInit() { curl_global_cleanup(); }
};
CurlGlobalInit g_curl_init;
} // namespace

CurlHttpClient::CurlHttpClient() {
  curl_ = curl_easy_init();
  if (!curl_) {
    throw std::runtime_error("Failed to initialize CURL");
  }
}

CurlHttpClient::~CurlHttpClient() {
  if (curl_) {
    curl_easy_cleanup(curl_);
  }
}

size_t CurlHttpClient::write_callback(char *ptr, size_t size, size_t nmemb,
                                      void *userdata) {
  auto *buffer = static_cast<std::string *>(userdata);
  const size_t total_size = size * nmemb;
  buffer->append(ptr, total_size);
  return total_size;
}

// Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int CurlHttpClient::progress_callback(void *clientp, std::int64_t,
                                      std::int64_t, std::int64_t,
                                      std::int64_t) {
  const auto *token = static_cast<const core::CancellationToken *>(clientp);
  return token && token->is_cancelled() ? 1 : 0;
}

HttpErrorCode CurlHttpClient::classify_curl_error(int curl_code) {
  switch (curl_code) {
  case CURLE_COULDNT_RESOLVE_HOST:
  case CURLE_COULDNT_CONNECT:
  case CURLE_SEND_ERROR:
  case CURLE_RECV_ERROR:
    return HttpErrorCode::NETWORK_ERROR;
  case CURLE_OPERATION_TIMEDOUT:
    return HttpErrorCode::TIMEOUT;
  case CURLE_ABORTED_BY_CALLBACK:
    return HttpErrorCode::CANCELED;
  default:
    return HttpErrorCode::UNKNOWN;
  }
}

core::Result<HttpResponse, core::Error>
CurlHttpClient::execute(const HttpRequest &request,
                        const core::CancellationToken *token) {
  using Result = core::Result<HttpResponse, core::Error>;

  if (token && token->is_cancelled()) {
    return Result::Err(make_http_error(HttpErrorCode::CANCELED,
                                       "Request cancelled before start"));
  }

  std::lock_guard<std::mutex> lock(curl_mutex_);
  curl_easy_reset(curl_);

  curl_easy_setopt(curl_, CURLOPT_URL, request.url.c_str());

  const long timeout_ms = static_cast<long>(request.timeout.count());
  curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, timeout_ms);
  curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms / 2);
  curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

  if (request.method == HttpMethod::POST) {
    curl_easy_setopt(curl_, CURLOPT_POST, 1L);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(request.body.size()));
  } else {
    curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
  }

  struct curl_slist *headers = nullptr;
  for (const auto &[key, value] : request.headers) {
    const std::string header = key + ": " + value;
    headers = curl_slist_append(headers, header.c_str());
  }
  if (headers) {
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);
  }

  std::string response_buffer;
  curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION,
                   &CurlHttpClient::write_callback);
  curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_buffer);

  if (token) {
    curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION,
                     &CurlHttpClient::progress_callback);
    curl_easy_setopt(curl_, CURLOPT_XFERINFODATA,
                     const_cast<core::CancellationToken *>(token));
    curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
  }

  const auto start_time = std::chrono::steady_clock::now();
  const CURLcode res = curl_easy_perform(curl_);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start_time);

  if (headers) {
    curl_slist_free_all(headers);
  }

  if (res != CURLE_OK) {
    return Result::Err(make_http_error(
        classify_curl_error(res), std::string("CURL error: ") +
                                      curl_easy_strerror(res) + " (code: " +
                                      std::to_string(res) + ")"));
  }

  long http_code = 0;
  curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);

  if (http_code >= 500) {
    return Result::Err(make_http_error(
        HttpErrorCode::SERVER_ERROR,
        "HTTP " + std::to_string(http_code) + " response",
        static_cast<int>(http_code)));
  }
  if (http_code >= 400) {
    return Result::Err(make_http_error(
        HttpErrorCode::CLIENT_ERROR,
        "HTTP " + std::to_string(http_code) + " response",
        static_cast<int>(http_code)));
  }

  HttpResponse response;
  response.status_code = static_cast<int>(http_code);
  response.body = std::move(response_buffer);
  response.elapsed_ms = elapsed;
  return Result::Ok(std::move(response));
}

} // namespace sflight::infra
