#include <inspecta/vision/border_detector.hpp>
#include <inspecta/vision/image_codec.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <string>

namespace inspecta::vision {

namespace ic = inspecta::core;

namespace {

constexpr std::array<HueRange, 9> kHueRanges = {{
    {"blue", 90, 30, 30, 130, 255, 255},
    {"deep_blue", 100, 50, 50, 140, 255, 255},
    {"cyan", 75, 30, 30, 105, 255, 255},
    {"red", 0, 50, 50, 10, 255, 255},
    {"red_wrap", 170, 50, 50, 180, 255, 255},
    {"green", 35, 50, 50, 85, 255, 255},
    {"yellow", 15, 50, 50, 45, 255, 255},
    {"magenta", 125, 50, 50, 175, 255, 255},
    {"orange", 5, 50, 50, 25, 255, 255},
}};

constexpr float kWeightTolerance = 1e-4f;

std::string percent(float fraction) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f%%", static_cast<double>(fraction) * 100.0);
  return buf;
}

ic::HeuristicSignal decode_failed_signal() {
  ic::HeuristicSignal s;
  s.has_border = false;
  s.confidence = 0.f;
  s.explanation = "decode-failed";
  s.decode_failed = true;
  return s;
}

/// Perimeter ring of the given thickness with the centred exclusion rectangle cleared.
cv::Mat build_band_mask(int width, int height, const BorderDetectorConfig& cfg) {
  const int shorter = std::min(width, height);
  const int thickness = std::max(static_cast<int>(cfg.min_band_pixels),
                                 static_cast<int>(std::lround(shorter * cfg.band_thickness_ratio)));

  cv::Mat mask = cv::Mat::zeros(height, width, CV_8UC1);
  const int t_h = std::min(thickness, height);
  const int t_w = std::min(thickness, width);
  mask(cv::Rect(0, 0, width, t_h)).setTo(255);
  mask(cv::Rect(0, height - t_h, width, t_h)).setTo(255);
  mask(cv::Rect(0, 0, t_w, height)).setTo(255);
  mask(cv::Rect(width - t_w, 0, t_w, height)).setTo(255);

  const int center_w = static_cast<int>(width * cfg.center_exclusion_ratio);
  const int center_h = static_cast<int>(height * cfg.center_exclusion_ratio);
  if (center_w > 0 && center_h > 0) {
    const int cx = (width - center_w) / 2;
    const int cy = (height - center_h) / 2;
    mask(cv::Rect(cx, cy, center_w, center_h)).setTo(0);
  }
  return mask;
}

ic::HeuristicSignal analyse(const cv::Mat& bgr, const BorderDetectorConfig& cfg) {
  ic::HeuristicSignal signal;

  const cv::Mat band = build_band_mask(bgr.cols, bgr.rows, cfg);
  const int band_pixels = cv::countNonZero(band);
  if (band_pixels == 0) {
    signal.explanation = "no analysable band";
    return signal;
  }
  const float total = static_cast<float>(band_pixels);

  cv::Mat hsv;
  cv::cvtColor(bgr, hsv, cv::COLOR_BGR2HSV);

  float color_sum = 0.f;
  cv::Mat in_range;
  cv::Mat in_band;
  for (const auto& r : kHueRanges) {
    cv::inRange(hsv, cv::Scalar(r.h_min, r.s_min, r.v_min),
                cv::Scalar(r.h_max, r.s_max, r.v_max), in_range);
    cv::bitwise_and(in_range, band, in_band);
    const float fraction = static_cast<float>(cv::countNonZero(in_band)) / total;
    if (fraction > cfg.hue_low_fraction && fraction < cfg.hue_high_fraction) {
      signal.matched_hues.push_back({std::string(r.name), fraction});
      color_sum += fraction;
    }
  }

  cv::Mat gray;
  cv::Mat edges;
  cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
  cv::Canny(gray, edges, cfg.canny_low, cfg.canny_high);
  cv::bitwise_and(edges, band, in_band);
  signal.edge_ratio = static_cast<float>(cv::countNonZero(in_band)) / total;

  const float raw = cfg.color_weight * color_sum + cfg.edge_weight * signal.edge_ratio;
  signal.confidence = std::clamp(raw, 0.f, 1.f);
  signal.has_border = signal.confidence > cfg.decision_threshold;

  std::string text;
  if (signal.matched_hues.empty()) {
    text = "no border hue";
  } else {
    text = "border hues: ";
    for (std::size_t i = 0; i < signal.matched_hues.size(); ++i) {
      if (i > 0) text += ", ";
      text += signal.matched_hues[i].name + "(" + percent(signal.matched_hues[i].fraction) + ")";
    }
  }
  text += "; edge ratio " + percent(signal.edge_ratio);
  text += "; confidence " + percent(signal.confidence);
  signal.explanation = std::move(text);
  return signal;
}

void validate(const BorderDetectorConfig& cfg) {
  auto in_unit = [](float v) { return v > 0.f && v <= 1.f; };
  if (!in_unit(cfg.center_exclusion_ratio) || !in_unit(cfg.band_thickness_ratio)) {
    throw std::invalid_argument("BorderDetector: band and exclusion ratios must be in (0, 1]");
  }
  if (cfg.hue_low_fraction < 0.f || cfg.hue_high_fraction > 1.f ||
      cfg.hue_low_fraction >= cfg.hue_high_fraction) {
    throw std::invalid_argument("BorderDetector: hue fraction bounds must satisfy 0 <= low < high <= 1");
  }
  if (cfg.color_weight < 0.f || cfg.edge_weight < 0.f ||
      std::fabs(cfg.color_weight + cfg.edge_weight - 1.f) > kWeightTolerance) {
    throw std::invalid_argument("BorderDetector: color_weight + edge_weight must equal 1");
  }
  if (cfg.edge_weight < cfg.color_weight) {
    throw std::invalid_argument("BorderDetector: edge_weight must be >= color_weight");
  }
  if (cfg.decision_threshold < 0.f || cfg.decision_threshold >= 1.f) {
    throw std::invalid_argument("BorderDetector: decision_threshold must be in [0, 1)");
  }
}

}  // namespace

std::span<const HueRange> border_hue_ranges() noexcept {
  return kHueRanges;
}

BorderDetector::BorderDetector(BorderDetectorConfig config) : config_(config) {
  validate(config_);
}

ic::HeuristicSignal BorderDetector::detect(const ic::Frame& frame) const {
  auto bgr = detail::frame_to_bgr(frame);
  if (!bgr || bgr->empty()) {
    return decode_failed_signal();
  }
  try {
    return analyse(*bgr, config_);
  } catch (const cv::Exception&) {
    return decode_failed_signal();
  }
}

ic::HeuristicSignal BorderDetector::detect(const ic::ImageSample& sample) const {
  if (sample.raster.valid()) {
    return detect(sample.raster);
  }
  auto decoded = decode_image(sample.encoded);
  if (!decoded) {
    return decode_failed_signal();
  }
  return detect(*decoded);
}

}  // namespace inspecta::vision
