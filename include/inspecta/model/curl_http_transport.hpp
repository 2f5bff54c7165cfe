#pragma once

#include <inspecta/model/http_transport.hpp>

namespace inspecta::model {

/// libcurl transport. Each call owns its own easy handle and header list, so
/// one instance can serve concurrent callers.
class CurlHttpTransport : public IHttpTransport {
 public:
  /// Throws std::runtime_error if libcurl global initialisation fails.
  CurlHttpTransport();

  [[nodiscard]] std::expected<HttpResponse, core::TransportError>
  post(const HttpRequest& request) override;

  [[nodiscard]] std::expected<HttpResponse, core::TransportError>
  get(const HttpRequest& request) override;
};

}  // namespace inspecta::model
