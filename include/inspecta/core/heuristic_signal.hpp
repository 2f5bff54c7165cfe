#pragma once

#include <string>
#include <utility>
#include <vector>

namespace inspecta::core {

/// Fraction of band pixels that fell inside one named hue range.
struct HueMatch {
  std::string name;
  float fraction{0.f};
};

/// Output of the border heuristic. has_border == (confidence > decision threshold).
struct HeuristicSignal {
  bool has_border{false};
  float confidence{0.f};  // always in [0, 1]
  std::string explanation;

  std::vector<HueMatch> matched_hues;
  float edge_ratio{0.f};
  bool decode_failed{false};
};

}  // namespace inspecta::core
