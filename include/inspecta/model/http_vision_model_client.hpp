#pragma once

#include <inspecta/model/backend_config.hpp>
#include <inspecta/model/http_transport.hpp>
#include <inspecta/model/vision_model_client.hpp>
#include <memory>
#include <string>

namespace inspecta::model {

/// Shared HTTP flow: send the rich request (system prompt + tool declaration);
/// if that fails for any reason, send the minimal direct request once.
/// Subclasses only build request bodies and headers.
class HttpVisionModelClient : public IVisionModelClient {
 public:
  /// Throws std::invalid_argument if transport is null or endpoint/id is empty.
  HttpVisionModelClient(BackendConfig config, std::shared_ptr<IHttpTransport> transport,
                        std::string api_key);

  [[nodiscard]] std::expected<ModelResponse, core::TransportError>
  submit(std::span<const std::byte> image, std::string_view instruction,
         std::string_view media_type) override;

  [[nodiscard]] const std::string& backend_id() const noexcept override { return config_.id; }
  [[nodiscard]] const BackendConfig& config() const noexcept { return config_; }

  /// JSON body for one attempt; exposed for tests.
  [[nodiscard]] virtual std::string build_body(std::string_view image_base64,
                                               std::string_view instruction,
                                               std::string_view media_type,
                                               bool rich) const = 0;

 protected:
  [[nodiscard]] virtual HttpRequest make_request(std::string body) const = 0;

  [[nodiscard]] const std::string& api_key() const noexcept { return api_key_; }

 private:
  [[nodiscard]] std::expected<ModelResponse, core::TransportError> attempt(std::string body);

  BackendConfig config_;
  std::shared_ptr<IHttpTransport> transport_;
  std::string api_key_;
};

/// General-purpose multimodal messages API (content-block responses).
class ConversationalModelClient : public HttpVisionModelClient {
 public:
  using HttpVisionModelClient::HttpVisionModelClient;

  [[nodiscard]] std::string build_body(std::string_view image_base64, std::string_view instruction,
                                       std::string_view media_type, bool rich) const override;

 protected:
  [[nodiscard]] HttpRequest make_request(std::string body) const override;
};

/// Lightweight vision messages-v1 API (nested output responses).
class VisionFocusedModelClient : public HttpVisionModelClient {
 public:
  using HttpVisionModelClient::HttpVisionModelClient;

  [[nodiscard]] std::string build_body(std::string_view image_base64, std::string_view instruction,
                                       std::string_view media_type, bool rich) const override;

 protected:
  [[nodiscard]] HttpRequest make_request(std::string body) const override;
};

/// Builds the client for config.family. The API key is read from the
/// environment variable named by config.api_key_env; throws std::runtime_error
/// if that variable is named but unset.
[[nodiscard]] std::unique_ptr<IVisionModelClient> make_vision_model_client(
    const BackendConfig& config, std::shared_ptr<IHttpTransport> transport);

/// Same, with an explicit key (no environment lookup).
[[nodiscard]] std::unique_ptr<IVisionModelClient> make_vision_model_client(
    const BackendConfig& config, std::shared_ptr<IHttpTransport> transport, std::string api_key);

}  // namespace inspecta::model
