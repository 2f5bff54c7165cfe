#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace inspecta::model {

/// Request/response dialect of a backend. Chosen explicitly in configuration.
enum class BackendFamily : std::uint8_t {
  Conversational,  ///< messages API with tagged content blocks
  VisionFocused,   ///< messages-v1 API with nested output
};

[[nodiscard]] std::string_view to_string(BackendFamily family) noexcept;

/// Accepts "conversational" and "vision".
bool parse_backend_family(std::string_view text, BackendFamily& out) noexcept;

struct BackendConfig {
  std::string id;
  BackendFamily family{BackendFamily::Conversational};
  std::string endpoint;
  std::string model;
  /// Name of the environment variable holding the API key; empty means no key.
  std::string api_key_env;
  std::string api_version{"bedrock-2023-05-31"};
  std::string system_prompt{
      "You inspect product photos for marketplace policy compliance. "
      "Answer in the requested format."};
  int max_tokens{1000};
  double temperature{0.0};
  int timeout_ms{30000};
};

}  // namespace inspecta::model
