#pragma once

#include <inspecta/core/error.hpp>
#include <inspecta/core/heuristic_signal.hpp>
#include <inspecta/core/model_verdict.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace inspecta::core {

/// Stage names recorded in DecisionRecord::stage_trail.
namespace stage {
inline constexpr std::string_view kHeuristic = "heuristic";
inline constexpr std::string_view kPrimary = "primary";
inline constexpr std::string_view kSecondary = "secondary";
inline constexpr std::string_view kError = "error";
}  // namespace stage

/// Hybrid: heuristic, primary model, optional escalation to secondary.
/// Staged: heuristic gate then exactly one model call, never escalates.
enum class PipelineMode : std::uint8_t {
  Hybrid,
  Staged,
};

[[nodiscard]] std::string_view to_string(PipelineMode mode) noexcept;
bool parse_pipeline_mode(std::string_view text, PipelineMode& out) noexcept;

/// Final per-image outcome. Immutable: built once when the orchestrator resolves,
/// then only copied (e.g. by a result store).
class DecisionRecord {
 public:
  struct Fields {
    bool final_result{false};
    std::string final_rationale;
    std::vector<std::string> stage_trail;
    std::vector<ModelVerdict> verdicts;
    double elapsed_ms{0.0};
    std::optional<FailureKind> failure_kind;
    HeuristicSignal heuristic;
    PipelineMode mode{PipelineMode::Hybrid};
    std::string source;
    std::chrono::system_clock::time_point resolved_at{};
  };

  /// Throws std::invalid_argument unless stage_trail starts with "heuristic"
  /// and there are at most two verdicts.
  explicit DecisionRecord(Fields fields);

  [[nodiscard]] bool final_result() const noexcept { return f_.final_result; }
  [[nodiscard]] const std::string& final_rationale() const noexcept { return f_.final_rationale; }
  [[nodiscard]] const std::vector<std::string>& stage_trail() const noexcept { return f_.stage_trail; }
  [[nodiscard]] const std::vector<ModelVerdict>& verdicts() const noexcept { return f_.verdicts; }
  [[nodiscard]] double elapsed_ms() const noexcept { return f_.elapsed_ms; }
  [[nodiscard]] const std::optional<FailureKind>& failure_kind() const noexcept { return f_.failure_kind; }
  [[nodiscard]] const HeuristicSignal& heuristic() const noexcept { return f_.heuristic; }
  [[nodiscard]] PipelineMode mode() const noexcept { return f_.mode; }
  [[nodiscard]] const std::string& source() const noexcept { return f_.source; }
  [[nodiscard]] std::chrono::system_clock::time_point resolved_at() const noexcept {
    return f_.resolved_at;
  }

  [[nodiscard]] bool failed() const noexcept { return f_.failure_kind.has_value(); }
  [[nodiscard]] const Fields& fields() const noexcept { return f_; }

 private:
  Fields f_;
};

}  // namespace inspecta::core
