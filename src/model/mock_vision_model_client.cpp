#include <inspecta/model/mock_vision_model_client.hpp>
#include <nlohmann/json.hpp>
#include <utility>

namespace inspecta::model {

MockVisionModelClient::MockVisionModelClient(std::string backend_id) : id_(std::move(backend_id)) {}

void MockVisionModelClient::set_response(std::string text) {
  std::lock_guard lock(mutex_);
  text_ = std::move(text);
  failure_.reset();
}

void MockVisionModelClient::set_failure(core::TransportError error) {
  std::lock_guard lock(mutex_);
  failure_ = error;
}

void MockVisionModelClient::set_handler(Handler handler) {
  std::lock_guard lock(mutex_);
  handler_ = std::move(handler);
}

std::string MockVisionModelClient::last_instruction() const {
  std::lock_guard lock(mutex_);
  return last_instruction_;
}

std::expected<ModelResponse, core::TransportError> MockVisionModelClient::submit(
    std::span<const std::byte> image, std::string_view instruction,
    std::string_view /*media_type*/) {
  ++calls_;
  Handler handler;
  {
    std::lock_guard lock(mutex_);
    last_instruction_ = std::string(instruction);
    if (!handler_) {
      if (failure_) return std::unexpected(*failure_);
      ModelResponse r;
      r.text = text_;
      nlohmann::json body = {
          {"content", nlohmann::json::array({{{"type", "text"}, {"text", text_}}})}};
      r.raw_body = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
      return r;
    }
    handler = handler_;
  }
  return handler(image, instruction);
}

}  // namespace inspecta::model
