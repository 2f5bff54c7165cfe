#include <inspecta/vision/image_codec.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <cstdint>
#include <cstring>
#include <initializer_list>

namespace inspecta::vision {

namespace ic = inspecta::core;

namespace {

bool starts_with(std::span<const std::byte> bytes, std::initializer_list<std::uint8_t> magic,
                 std::size_t offset = 0) {
  if (bytes.size() < offset + magic.size()) return false;
  std::size_t i = offset;
  for (const auto m : magic) {
    if (std::to_integer<std::uint8_t>(bytes[i++]) != m) return false;
  }
  return true;
}

}  // namespace

std::optional<ic::Frame> decode_image(std::span<const std::byte> bytes) {
  if (bytes.empty()) return std::nullopt;

  // imdecode only reads the buffer.
  const cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1,
                    const_cast<std::byte*>(bytes.data()));
  cv::Mat decoded;
  try {
    decoded = cv::imdecode(raw, cv::IMREAD_COLOR);
  } catch (const cv::Exception&) {
    return std::nullopt;
  }
  if (decoded.empty()) return std::nullopt;
  return detail::mat_to_frame(decoded, ic::PixelFormat::BGR8);
}

std::optional<std::vector<std::byte>> encode_png(const ic::Frame& frame) {
  auto bgr = detail::frame_to_bgr(frame);
  if (!bgr) return std::nullopt;

  std::vector<std::uint8_t> buf;
  try {
    if (!cv::imencode(".png", *bgr, buf)) return std::nullopt;
  } catch (const cv::Exception&) {
    return std::nullopt;
  }
  std::vector<std::byte> out(buf.size());
  std::memcpy(out.data(), buf.data(), buf.size());
  return out;
}

ic::ImageFormat sniff_format(std::span<const std::byte> bytes) noexcept {
  if (starts_with(bytes, {0xFF, 0xD8, 0xFF})) return ic::ImageFormat::Jpeg;
  if (starts_with(bytes, {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A})) return ic::ImageFormat::Png;
  if (starts_with(bytes, {'G', 'I', 'F', '8'})) return ic::ImageFormat::Gif;
  if (starts_with(bytes, {'B', 'M'})) return ic::ImageFormat::Bmp;
  if (starts_with(bytes, {'R', 'I', 'F', 'F'}) && starts_with(bytes, {'W', 'E', 'B', 'P'}, 8)) {
    return ic::ImageFormat::Webp;
  }
  return ic::ImageFormat::Unknown;
}

}  // namespace inspecta::vision
