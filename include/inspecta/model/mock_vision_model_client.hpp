#pragma once

#include <inspecta/model/vision_model_client.hpp>
#include <atomic>
#include <functional>
#include <mutex>
#include <string>

namespace inspecta::model {

/// Scripted client for tests and the CLI demo mode. Returns the configured
/// text, the configured failure, or whatever the handler returns (handler wins).
class MockVisionModelClient : public IVisionModelClient {
 public:
  using Handler = std::function<std::expected<ModelResponse, core::TransportError>(
      std::span<const std::byte> image, std::string_view instruction)>;

  explicit MockVisionModelClient(std::string backend_id = "mock");

  void set_response(std::string text);
  void set_failure(core::TransportError error);
  void set_handler(Handler handler);

  [[nodiscard]] std::expected<ModelResponse, core::TransportError>
  submit(std::span<const std::byte> image, std::string_view instruction,
         std::string_view media_type) override;

  [[nodiscard]] const std::string& backend_id() const noexcept override { return id_; }

  [[nodiscard]] int call_count() const noexcept { return calls_.load(); }
  [[nodiscard]] std::string last_instruction() const;

 private:
  std::string id_;
  mutable std::mutex mutex_;
  std::string text_{"result: true\nreason: mock backend"};
  std::optional<core::TransportError> failure_;
  Handler handler_;
  std::string last_instruction_;
  std::atomic<int> calls_{0};
};

}  // namespace inspecta::model
