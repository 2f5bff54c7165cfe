#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace inspecta::core {

/// Channel order of a decoded product photo. Every format is 8 bits per channel.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  RGB8,
  BGR8,
  RGBA8,
  BGRA8,
};

/// A product photo after decoding, as the border detector reads it. Rows are
/// stored top to bottom with no padding between them. A Frame holds its own
/// copy of the pixels, so concurrent readers need no locking.
class Frame {
 public:
  Frame() = default;

  Frame(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::vector<std::byte> buffer)
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }

  [[nodiscard]] std::span<std::byte> data() noexcept {
    return std::span<std::byte>(buffer_.data(), buffer_.size());
  }
  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// Non-zero size, a known format and enough bytes to cover every pixel.
  [[nodiscard]] bool valid() const noexcept;

  [[nodiscard]] static std::size_t bytes_per_pixel(PixelFormat format) noexcept;

  /// Byte count a photo of this size needs; 0 for PixelFormat::Unknown.
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format);

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
};

}  // namespace inspecta::core
