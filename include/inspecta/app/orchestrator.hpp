#pragma once

#include <inspecta/app/image_source.hpp>
#include <inspecta/app/prompt_table.hpp>
#include <inspecta/core/decision_record.hpp>
#include <inspecta/core/image_sample.hpp>
#include <inspecta/interpret/response_interpreter.hpp>
#include <inspecta/model/vision_model_client.hpp>
#include <inspecta/vision/border_detector.hpp>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace inspecta::app {

/// Per-stage timing: (stage name from core::stage, duration_ms). Optional; pass to inspect().
using StageTimingCallback = std::function<void(std::string_view stage, double duration_ms)>;

[[nodiscard]] std::vector<std::string> default_border_terms();
[[nodiscard]] std::vector<std::string> default_certainty_phrases();

/// Which prompt each stage uses and when a primary verdict is final.
struct OrchestratorConfig {
  core::PipelineMode mode{core::PipelineMode::Hybrid};
  std::string primary_prompt{"v1.3"};
  std::string secondary_prompt{"v1.1"};
  std::string staged_prompt{"v3.2"};
  /// A rejecting primary verdict is trusted if its rationale names one of these.
  std::vector<std::string> border_terms{default_border_terms()};
  /// An accepting primary verdict is trusted if its rationale contains one of these.
  std::vector<std::string> certainty_phrases{default_certainty_phrases()};
};

/// Sequences heuristic and model stages for one image and resolves a DecisionRecord.
///
/// Hybrid: heuristic border -> reject without a model call. Otherwise the primary
/// backend answers; its verdict is final only under the trust rules, else the
/// secondary backend re-checks with the stricter prompt and wins on disagreement.
/// Staged: heuristic border -> reject; otherwise exactly one primary call with the
/// staged prompt.
///
/// inspect() never throws for input or transport failures; they become failed
/// records. Safe to call concurrently if the clients and image source are.
class InspectionOrchestrator {
 public:
  /// Throws std::invalid_argument if a client the mode needs is null or a prompt
  /// version the mode needs is missing from prompts.
  InspectionOrchestrator(OrchestratorConfig config, PromptTable prompts,
                         vision::BorderDetector detector,
                         interpret::ResponseInterpreter interpreter,
                         std::shared_ptr<model::IVisionModelClient> primary,
                         std::shared_ptr<model::IVisionModelClient> secondary = nullptr,
                         std::shared_ptr<IImageSource> image_source = nullptr);

  [[nodiscard]] core::DecisionRecord inspect(const core::ImageSample& sample,
                                             StageTimingCallback* timing_cb = nullptr) const;

  /// Fetches through the image source, then inspect(). Fetch failures produce a
  /// failed record with trail ["heuristic", "error"].
  [[nodiscard]] core::DecisionRecord inspect_url(std::string_view url,
                                                 StageTimingCallback* timing_cb = nullptr) const;

  /// Trust rule for a primary verdict (no escalation).
  [[nodiscard]] bool should_trust(const core::ModelVerdict& primary) const;

  [[nodiscard]] const OrchestratorConfig& config() const noexcept { return config_; }
  [[nodiscard]] const PromptTable& prompts() const noexcept { return prompts_; }

 private:
  OrchestratorConfig config_;
  PromptTable prompts_;
  vision::BorderDetector detector_;
  interpret::ResponseInterpreter interpreter_;
  std::shared_ptr<model::IVisionModelClient> primary_;
  std::shared_ptr<model::IVisionModelClient> secondary_;
  std::shared_ptr<IImageSource> image_source_;
};

}  // namespace inspecta::app
