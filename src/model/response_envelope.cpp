#include <inspecta/model/response_envelope.hpp>
#include <nlohmann/json.hpp>
#include <optional>

namespace inspecta::model {

namespace {

using nlohmann::json;

/// First element of a content array that carries a string "text".
/// Elements with a "type" other than "text" (tool_use, image, ...) are skipped.
std::optional<std::string> first_text_block(const json& content) {
  if (!content.is_array()) return std::nullopt;
  for (const auto& block : content) {
    if (!block.is_object()) continue;
    const auto type = block.find("type");
    if (type != block.end() && (!type->is_string() || type->get<std::string>() != "text")) {
      continue;
    }
    const auto text = block.find("text");
    if (text != block.end() && text->is_string()) return text->get<std::string>();
  }
  return std::nullopt;
}

}  // namespace

std::string_view to_string(EnvelopeShape shape) noexcept {
  switch (shape) {
    case EnvelopeShape::ContentBlocks:
      return "content_blocks";
    case EnvelopeShape::NestedOutput:
      return "nested_output";
  }
  return "content_blocks";
}

std::expected<EnvelopeText, core::TransportError> extract_envelope_text(std::string_view body) {
  const json doc = json::parse(body.begin(), body.end(), nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    return std::unexpected(core::TransportError::MalformedResponse);
  }

  if (const auto content = doc.find("content"); content != doc.end()) {
    if (auto text = first_text_block(*content)) {
      return EnvelopeText{std::move(*text), EnvelopeShape::ContentBlocks};
    }
  }

  const auto output = doc.find("output");
  if (output != doc.end() && output->is_object()) {
    const auto message = output->find("message");
    if (message != output->end() && message->is_object()) {
      const auto content = message->find("content");
      if (content != message->end()) {
        if (auto text = first_text_block(*content)) {
          return EnvelopeText{std::move(*text), EnvelopeShape::NestedOutput};
        }
      }
    }
  }
  return std::unexpected(core::TransportError::MalformedResponse);
}

}  // namespace inspecta::model
