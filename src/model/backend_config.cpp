#include <inspecta/model/backend_config.hpp>

namespace inspecta::model {

std::string_view to_string(BackendFamily family) noexcept {
  switch (family) {
    case BackendFamily::Conversational:
      return "conversational";
    case BackendFamily::VisionFocused:
      return "vision";
  }
  return "conversational";
}

bool parse_backend_family(std::string_view text, BackendFamily& out) noexcept {
  if (text == "conversational") {
    out = BackendFamily::Conversational;
    return true;
  }
  if (text == "vision") {
    out = BackendFamily::VisionFocused;
    return true;
  }
  return false;
}

}  // namespace inspecta::model
