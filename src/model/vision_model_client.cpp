#include <inspecta/model/vision_model_client.hpp>

namespace inspecta::model {

std::optional<core::TransportError> classify_http_status(long status) noexcept {
  if (status >= 200 && status < 300) return std::nullopt;
  switch (status) {
    case 401:
    case 403:
      return core::TransportError::Auth;
    case 429:
      return core::TransportError::Throttle;
    case 408:
    case 504:
      return core::TransportError::Timeout;
    default:
      return core::TransportError::Network;
  }
}

}  // namespace inspecta::model
