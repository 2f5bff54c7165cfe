#pragma once

#include <inspecta/core/frame.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace inspecta::core {

/// Container format of the original encoded bytes.
enum class ImageFormat : std::uint8_t {
  Unknown,
  Jpeg,
  Png,
  Gif,
  Bmp,
  Webp,
};

/// MIME type for the format ("image/jpeg", ...); "application/octet-stream" if unknown.
[[nodiscard]] std::string_view media_type(ImageFormat format) noexcept;

/// One image under inspection: decoded raster (may be empty), original encoded
/// bytes (may be empty for synthetic samples) and where it came from.
/// Created per inspection and discarded after the pipeline resolves.
struct ImageSample {
  Frame raster;
  std::vector<std::byte> encoded;
  ImageFormat format{ImageFormat::Unknown};
  std::string source;  // URL or file path; free-form label
};

}  // namespace inspecta::core
