#pragma once

#include <inspecta/core/error.hpp>
#include <chrono>
#include <expected>
#include <string>
#include <utility>
#include <vector>

namespace inspecta::model {

struct HttpRequest {
  std::string url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
  std::chrono::milliseconds timeout{30000};
};

struct HttpResponse {
  long status{0};
  std::string body;
  std::string content_type;
};

/// Blocking HTTP transport. Only transport-level failures (connection, timeout)
/// are errors; any HTTP status, including 4xx/5xx, is a response.
/// Implementations must be safe to call from several threads at once.
class IHttpTransport {
 public:
  virtual ~IHttpTransport() = default;

  [[nodiscard]] virtual std::expected<HttpResponse, core::TransportError>
  post(const HttpRequest& request) = 0;

  [[nodiscard]] virtual std::expected<HttpResponse, core::TransportError>
  get(const HttpRequest& request) = 0;
};

}  // namespace inspecta::model
