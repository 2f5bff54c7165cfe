#pragma once

#include <inspecta/core/frame.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace inspecta::vision::detail {

/// Non-owning cv::Mat view over the frame buffer. Returns nullopt if the frame
/// is empty, undersized or of unknown layout.
std::optional<cv::Mat> frame_to_mat(const inspecta::core::Frame& frame);

/// Copy of the frame as 3-channel BGR, whatever its source layout.
std::optional<cv::Mat> frame_to_bgr(const inspecta::core::Frame& frame);

/// Convert cv::Mat to Frame (copy).
inspecta::core::Frame mat_to_frame(const cv::Mat& mat,
                                   inspecta::core::PixelFormat format);

}  // namespace inspecta::vision::detail
