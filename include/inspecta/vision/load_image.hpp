#pragma once

#include <inspecta/core/image_sample.hpp>
#include <optional>
#include <string>

namespace inspecta::vision {

/// Read an image file into an ImageSample: keeps the encoded bytes, sniffs the
/// format and decodes the raster (BGR8). Returns nullopt if the file cannot be
/// read or does not decode.
std::optional<inspecta::core::ImageSample> load_image_sample(const std::string& path);

}  // namespace inspecta::vision
