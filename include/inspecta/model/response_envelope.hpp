#pragma once

#include <inspecta/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace inspecta::model {

/// Response body layouts understood by the clients.
enum class EnvelopeShape : std::uint8_t {
  ContentBlocks,  ///< {"content":[{"type":"text","text":...}]}
  NestedOutput,   ///< {"output":{"message":{"content":[{"text":...}]}}}
};

[[nodiscard]] std::string_view to_string(EnvelopeShape shape) noexcept;

struct EnvelopeText {
  std::string text;
  EnvelopeShape shape{EnvelopeShape::ContentBlocks};
};

/// Pulls the first text block out of either envelope shape, whichever backend
/// produced it. MalformedResponse if the body is not JSON or holds no text block.
[[nodiscard]] std::expected<EnvelopeText, core::TransportError>
extract_envelope_text(std::string_view body);

}  // namespace inspecta::model
