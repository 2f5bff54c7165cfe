#include <inspecta/vision/load_image.hpp>
#include <inspecta/vision/image_codec.hpp>
#include <algorithm>
#include <cstddef>
#include <fstream>
#include <iterator>
#include <vector>

namespace inspecta::vision {

std::optional<inspecta::core::ImageSample> load_image_sample(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) return std::nullopt;

  const std::vector<char> raw((std::istreambuf_iterator<char>(f)),
                              std::istreambuf_iterator<char>());
  if (raw.empty()) return std::nullopt;

  inspecta::core::ImageSample sample;
  sample.encoded.resize(raw.size());
  std::transform(raw.begin(), raw.end(), sample.encoded.begin(),
                 [](char c) { return static_cast<std::byte>(c); });

  auto frame = decode_image(sample.encoded);
  if (!frame) return std::nullopt;

  sample.raster = std::move(*frame);
  sample.format = sniff_format(sample.encoded);
  sample.source = path;
  return sample;
}

}  // namespace inspecta::vision
