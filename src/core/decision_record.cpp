#include <inspecta/core/decision_record.hpp>
#include <stdexcept>
#include <utility>

namespace inspecta::core {

std::string_view to_string(PipelineMode mode) noexcept {
  switch (mode) {
    case PipelineMode::Hybrid:
      return "hybrid";
    case PipelineMode::Staged:
      return "staged";
  }
  return "hybrid";
}

bool parse_pipeline_mode(std::string_view text, PipelineMode& out) noexcept {
  if (text == "hybrid") {
    out = PipelineMode::Hybrid;
    return true;
  }
  if (text == "staged") {
    out = PipelineMode::Staged;
    return true;
  }
  return false;
}

DecisionRecord::DecisionRecord(Fields fields) : f_(std::move(fields)) {
  if (f_.stage_trail.empty() || f_.stage_trail.front() != stage::kHeuristic) {
    throw std::invalid_argument("DecisionRecord: stage trail must start with \"heuristic\"");
  }
  if (f_.verdicts.size() > 2) {
    throw std::invalid_argument("DecisionRecord: at most two model verdicts");
  }
}

}  // namespace inspecta::core
