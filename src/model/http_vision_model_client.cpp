#include <inspecta/model/http_vision_model_client.hpp>
#include <inspecta/model/base64.hpp>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace inspecta::model {

namespace {

using nlohmann::json;

constexpr const char* kToolName = "image_reader";
constexpr const char* kToolDescription =
    "Returns the product image attached to this request for inspection.";

json tool_input_schema() {
  return {{"type", "object"},
          {"properties", {{"image_id", {{"type", "string"}}}}},
          {"required", json::array()}};
}

/// "image/png" -> "png"; "image/jpeg" -> "jpeg".
std::string image_format_of(std::string_view media_type) {
  const auto slash = media_type.find('/');
  if (slash == std::string_view::npos) return std::string(media_type);
  return std::string(media_type.substr(slash + 1));
}

}  // namespace

HttpVisionModelClient::HttpVisionModelClient(BackendConfig config,
                                             std::shared_ptr<IHttpTransport> transport,
                                             std::string api_key)
    : config_(std::move(config)), transport_(std::move(transport)), api_key_(std::move(api_key)) {
  if (!transport_) {
    throw std::invalid_argument("HttpVisionModelClient: transport is null");
  }
  if (config_.id.empty() || config_.endpoint.empty()) {
    throw std::invalid_argument("HttpVisionModelClient: backend id and endpoint are required");
  }
}

std::expected<ModelResponse, core::TransportError> HttpVisionModelClient::attempt(
    std::string body) {
  auto response = transport_->post(make_request(std::move(body)));
  if (!response) {
    return std::unexpected(response.error());
  }
  if (auto err = classify_http_status(response->status)) {
    return std::unexpected(*err);
  }
  auto text = extract_envelope_text(response->body);
  if (!text) {
    return std::unexpected(text.error());
  }
  ModelResponse out;
  out.text = std::move(text->text);
  out.shape = text->shape;
  out.raw_body = std::move(response->body);
  return out;
}

std::expected<ModelResponse, core::TransportError> HttpVisionModelClient::submit(
    std::span<const std::byte> image, std::string_view instruction, std::string_view media_type) {
  std::string encoded;
  try {
    encoded = base64_encode(image);
  } catch (const std::runtime_error&) {
    // Request could not be built; nothing was sent.
    return std::unexpected(core::TransportError::Network);
  }

  auto rich = attempt(build_body(encoded, instruction, media_type, true));
  if (rich) {
    return rich;
  }
  auto minimal = attempt(build_body(encoded, instruction, media_type, false));
  if (!minimal) {
    return std::unexpected(minimal.error());
  }
  minimal->used_minimal_request = true;
  return minimal;
}

std::string ConversationalModelClient::build_body(std::string_view image_base64,
                                                  std::string_view instruction,
                                                  std::string_view media_type, bool rich) const {
  json image_block = {{"type", "image"},
                      {"source",
                       {{"type", "base64"},
                        {"media_type", std::string(media_type)},
                        {"data", std::string(image_base64)}}}};
  json text_block = {{"type", "text"}, {"text", std::string(instruction)}};

  json body;
  if (!config().api_version.empty()) body["anthropic_version"] = config().api_version;
  if (!config().model.empty()) body["model"] = config().model;
  body["max_tokens"] = config().max_tokens;
  body["temperature"] = config().temperature;
  body["messages"] = json::array(
      {{{"role", "user"}, {"content", json::array({image_block, text_block})}}});
  if (rich) {
    body["system"] = config().system_prompt;
    body["tools"] = json::array({{{"name", kToolName},
                                  {"description", kToolDescription},
                                  {"input_schema", tool_input_schema()}}});
  }
  return body.dump();
}

HttpRequest ConversationalModelClient::make_request(std::string body) const {
  HttpRequest req;
  req.url = config().endpoint;
  req.body = std::move(body);
  req.timeout = std::chrono::milliseconds(config().timeout_ms);
  req.headers.emplace_back("Content-Type", "application/json");
  req.headers.emplace_back("Accept", "application/json");
  if (!api_key().empty()) req.headers.emplace_back("x-api-key", api_key());
  return req;
}

std::string VisionFocusedModelClient::build_body(std::string_view image_base64,
                                                 std::string_view instruction,
                                                 std::string_view media_type, bool rich) const {
  json image_block = {{"image",
                       {{"format", image_format_of(media_type)},
                        {"source", {{"bytes", std::string(image_base64)}}}}}};
  json text_block = {{"text", std::string(instruction)}};

  json body;
  body["schemaVersion"] = "messages-v1";
  body["messages"] = json::array(
      {{{"role", "user"}, {"content", json::array({image_block, text_block})}}});
  body["inferenceConfig"] = {{"max_new_tokens", config().max_tokens},
                             {"temperature", config().temperature}};
  if (rich) {
    body["system"] = json::array({{{"text", config().system_prompt}}});
    body["toolConfig"] = {
        {"tools", json::array({{{"toolSpec",
                                 {{"name", kToolName},
                                  {"description", kToolDescription},
                                  {"inputSchema", {{"json", tool_input_schema()}}}}}}})}};
  }
  return body.dump();
}

HttpRequest VisionFocusedModelClient::make_request(std::string body) const {
  HttpRequest req;
  req.url = config().endpoint;
  req.body = std::move(body);
  req.timeout = std::chrono::milliseconds(config().timeout_ms);
  req.headers.emplace_back("Content-Type", "application/json");
  req.headers.emplace_back("Accept", "application/json");
  if (!api_key().empty()) req.headers.emplace_back("Authorization", "Bearer " + api_key());
  return req;
}

std::unique_ptr<IVisionModelClient> make_vision_model_client(
    const BackendConfig& config, std::shared_ptr<IHttpTransport> transport, std::string api_key) {
  switch (config.family) {
    case BackendFamily::Conversational:
      return std::make_unique<ConversationalModelClient>(config, std::move(transport),
                                                         std::move(api_key));
    case BackendFamily::VisionFocused:
      return std::make_unique<VisionFocusedModelClient>(config, std::move(transport),
                                                        std::move(api_key));
  }
  throw std::invalid_argument("make_vision_model_client: unknown backend family");
}

std::unique_ptr<IVisionModelClient> make_vision_model_client(
    const BackendConfig& config, std::shared_ptr<IHttpTransport> transport) {
  std::string key;
  if (!config.api_key_env.empty()) {
    const char* value = std::getenv(config.api_key_env.c_str());
    if (!value || !*value) {
      throw std::runtime_error("backend '" + config.id + "': environment variable " +
                               config.api_key_env + " is not set");
    }
    key = value;
  }
  return make_vision_model_client(config, std::move(transport), std::move(key));
}

}  // namespace inspecta::model
