#pragma once

#include <string>

namespace inspecta::core {

/// Structured result of interpreting one backend's free-text answer.
/// rationale never contains the words "true" / "false".
struct ModelVerdict {
  bool result{false};
  std::string rationale;
  std::string raw_text;
  std::string backend_id;
  std::string prompt_id;
};

}  // namespace inspecta::core
