#include <inspecta/model/curl_http_transport.hpp>
#include <curl/curl.h>
#include <algorithm>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace inspecta::model {

namespace {

struct CurlEasyDeleter {
  void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
};

struct CurlSlistDeleter {
  void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};

using CurlEasy = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlHeaders = std::unique_ptr<curl_slist, CurlSlistDeleter>;

constexpr long kMaxConnectTimeoutMs = 10000;
constexpr long kMaxRedirects = 5;

std::once_flag g_curl_init_once;
CURLcode g_curl_init_result = CURLE_OK;

std::size_t write_cb(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  out->append(ptr, size * nmemb);
  return size * nmemb;
}

std::expected<HttpResponse, core::TransportError> perform(const HttpRequest& request,
                                                          bool is_post) {
  CurlEasy curl(curl_easy_init());
  if (!curl) {
    return std::unexpected(core::TransportError::Network);
  }

  CurlHeaders headers;
  for (const auto& [name, value] : request.headers) {
    const std::string line = name + ": " + value;
    curl_slist* appended = curl_slist_append(headers.get(), line.c_str());
    if (!appended) {
      return std::unexpected(core::TransportError::Network);
    }
    headers.release();
    headers.reset(appended);
  }

  const long timeout_ms = static_cast<long>(request.timeout.count());
  HttpResponse response;

  curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, std::min(timeout_ms, kMaxConnectTimeoutMs));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, kMaxRedirects);

  if (is_post) {
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE,
                     static_cast<curl_off_t>(request.body.size()));
  } else {
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
  }

  const CURLcode res = curl_easy_perform(curl.get());
  if (res == CURLE_OPERATION_TIMEDOUT) {
    return std::unexpected(core::TransportError::Timeout);
  }
  if (res != CURLE_OK) {
    return std::unexpected(core::TransportError::Network);
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
  char* content_type = nullptr;
  if (curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK &&
      content_type) {
    response.content_type = content_type;
  }
  return response;
}

}  // namespace

CurlHttpTransport::CurlHttpTransport() {
  std::call_once(g_curl_init_once, [] { g_curl_init_result = curl_global_init(CURL_GLOBAL_DEFAULT); });
  if (g_curl_init_result != CURLE_OK) {
    throw std::runtime_error(std::string("CurlHttpTransport: curl_global_init failed: ") +
                             curl_easy_strerror(g_curl_init_result));
  }
}

std::expected<HttpResponse, core::TransportError> CurlHttpTransport::post(
    const HttpRequest& request) {
  return perform(request, true);
}

std::expected<HttpResponse, core::TransportError> CurlHttpTransport::get(
    const HttpRequest& request) {
  return perform(request, false);
}

}  // namespace inspecta::model
