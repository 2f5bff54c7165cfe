#pragma once

#include <inspecta/core/frame.hpp>
#include <inspecta/core/heuristic_signal.hpp>
#include <inspecta/core/image_sample.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace inspecta::vision {

/// Tuning for the perimeter-band border heuristic.
///
/// The band is every pixel within `band_thickness_ratio * min(width, height)`
/// (at least `min_band_pixels`) of an edge, minus a centred rectangle covering
/// `center_exclusion_ratio` of each dimension, so full-bleed product content is
/// not analysed.
struct BorderDetectorConfig {
  float center_exclusion_ratio{0.90f};
  float band_thickness_ratio{0.05f};
  std::uint32_t min_band_pixels{3};

  /// A hue counts as a border colour only if low < fraction < high.
  float hue_low_fraction{0.20f};
  float hue_high_fraction{0.95f};

  /// color_weight + edge_weight == 1 and edge_weight >= color_weight.
  float color_weight{0.4f};
  float edge_weight{0.6f};

  float decision_threshold{0.15f};

  double canny_low{50.0};
  double canny_high{150.0};
};

/// One entry of the fixed hue table (OpenCV 8-bit HSV: H in [0,180]).
struct HueRange {
  std::string_view name;
  std::uint8_t h_min, s_min, v_min;
  std::uint8_t h_max, s_max, v_max;
};

/// The enumerated chromatic ranges tested against the band. Grayscale never
/// matches because every range has a saturation floor.
[[nodiscard]] std::span<const HueRange> border_hue_ranges() noexcept;

/// Deterministic detector for decorative frames around a product photo.
/// Stateless after construction; detect() is safe to call concurrently.
class BorderDetector {
 public:
  /// Throws std::invalid_argument if ratios are outside (0, 1], the weights do
  /// not sum to 1, or edge_weight < color_weight.
  explicit BorderDetector(BorderDetectorConfig config = {});

  /// Uses the sample's raster, decoding the encoded bytes when the raster is
  /// empty. Undecodable input yields has_border=false, confidence=0,
  /// explanation "decode-failed".
  [[nodiscard]] inspecta::core::HeuristicSignal detect(
      const inspecta::core::ImageSample& sample) const;

  [[nodiscard]] inspecta::core::HeuristicSignal detect(
      const inspecta::core::Frame& frame) const;

  [[nodiscard]] const BorderDetectorConfig& config() const noexcept { return config_; }

 private:
  BorderDetectorConfig config_;
};

}  // namespace inspecta::vision
