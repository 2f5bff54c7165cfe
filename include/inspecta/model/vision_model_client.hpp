#pragma once

#include <inspecta/core/error.hpp>
#include <inspecta/model/response_envelope.hpp>
#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace inspecta::model {

/// What a backend answered: the extracted text plus the raw body for audit.
struct ModelResponse {
  std::string text;
  std::string raw_body;
  EnvelopeShape shape{EnvelopeShape::ContentBlocks};
  /// True if the rich request failed and the minimal retry produced this response.
  bool used_minimal_request{false};
};

/// Remote multimodal backend: image + instruction -> free text. Transport only;
/// interpreting the text is not the client's job.
/// Implementations must tolerate concurrent submit() calls.
class IVisionModelClient {
 public:
  virtual ~IVisionModelClient() = default;

  /// At most one internal retry; a returned error is final for this call.
  [[nodiscard]] virtual std::expected<ModelResponse, core::TransportError>
  submit(std::span<const std::byte> image, std::string_view instruction,
         std::string_view media_type) = 0;

  /// Identifier recorded on every ModelVerdict this client produces.
  [[nodiscard]] virtual const std::string& backend_id() const noexcept = 0;
};

/// Maps an HTTP status to a transport error. nullopt for 2xx.
/// 401/403 Auth, 429 Throttle, 408/504 Timeout, anything else Network.
[[nodiscard]] std::optional<core::TransportError> classify_http_status(long status) noexcept;

}  // namespace inspecta::model
