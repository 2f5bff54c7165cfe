#pragma once

#include <inspecta/core/frame.hpp>
#include <inspecta/core/image_sample.hpp>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace inspecta::vision {

/// Decode encoded image bytes (JPEG, PNG, ...) into a BGR8 frame. nullopt on failure.
std::optional<inspecta::core::Frame> decode_image(std::span<const std::byte> bytes);

/// Encode a frame as PNG. nullopt if the frame is not a valid raster.
std::optional<std::vector<std::byte>> encode_png(const inspecta::core::Frame& frame);

/// Identify the container format from its leading magic bytes.
[[nodiscard]] inspecta::core::ImageFormat sniff_format(std::span<const std::byte> bytes) noexcept;

}  // namespace inspecta::vision
