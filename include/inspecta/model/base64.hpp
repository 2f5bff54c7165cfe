#pragma once

#include <cstddef>
#include <span>
#include <string>

namespace inspecta::model {

/// Standard base64 without line breaks. Throws std::runtime_error if OpenSSL
/// cannot allocate its BIO chain.
[[nodiscard]] std::string base64_encode(std::span<const std::byte> data);

}  // namespace inspecta::model
