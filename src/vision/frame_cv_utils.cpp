#include "frame_cv_utils.hpp"
#include <inspecta/core/frame.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace inspecta::vision::detail {

namespace ic = inspecta::core;

std::optional<cv::Mat> frame_to_mat(const ic::Frame& frame) {
  if (!frame.valid()) return std::nullopt;

  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  const std::size_t step =
      static_cast<std::size_t>(frame.width()) * ic::Frame::bytes_per_pixel(frame.format());
  auto* data = const_cast<std::byte*>(frame.data().data());

  switch (frame.format()) {
    case ic::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, data, step);
    case ic::PixelFormat::RGB8:
    case ic::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data, step);
    case ic::PixelFormat::RGBA8:
    case ic::PixelFormat::BGRA8:
      return cv::Mat(h, w, CV_8UC4, data, step);
    case ic::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

std::optional<cv::Mat> frame_to_bgr(const ic::Frame& frame) {
  auto view = frame_to_mat(frame);
  if (!view) return std::nullopt;

  cv::Mat bgr;
  switch (frame.format()) {
    case ic::PixelFormat::BGR8:
      bgr = view->clone();
      break;
    case ic::PixelFormat::RGB8:
      cv::cvtColor(*view, bgr, cv::COLOR_RGB2BGR);
      break;
    case ic::PixelFormat::RGBA8:
      cv::cvtColor(*view, bgr, cv::COLOR_RGBA2BGR);
      break;
    case ic::PixelFormat::BGRA8:
      cv::cvtColor(*view, bgr, cv::COLOR_BGRA2BGR);
      break;
    case ic::PixelFormat::Grayscale8:
      cv::cvtColor(*view, bgr, cv::COLOR_GRAY2BGR);
      break;
    case ic::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
  return bgr;
}

ic::Frame mat_to_frame(const cv::Mat& mat, ic::PixelFormat format) {
  if (mat.empty()) return ic::Frame();

  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(packed.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(packed.rows);
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  return ic::Frame(w, h, format, std::move(buffer));
}

}  // namespace inspecta::vision::detail
