#include <inspecta/core/image_sample.hpp>

namespace inspecta::core {

std::string_view media_type(ImageFormat format) noexcept {
  switch (format) {
    case ImageFormat::Jpeg:
      return "image/jpeg";
    case ImageFormat::Png:
      return "image/png";
    case ImageFormat::Gif:
      return "image/gif";
    case ImageFormat::Bmp:
      return "image/bmp";
    case ImageFormat::Webp:
      return "image/webp";
    case ImageFormat::Unknown:
    default:
      return "application/octet-stream";
  }
}

}  // namespace inspecta::core
