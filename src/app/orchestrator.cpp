#include <inspecta/app/orchestrator.hpp>
#include <inspecta/vision/image_codec.hpp>
#include <chrono>
#include <exception>
#include <expected>
#include <optional>
#include <span>
#include <stdexcept>
#include <utility>

namespace inspecta::app {

namespace {

namespace ic = inspecta::core;
using Clock = std::chrono::steady_clock;

double ms_since(Clock::time_point start) {
  return 1e-3 * static_cast<double>(
      std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start).count());
}

void report(StageTimingCallback* timing_cb, std::string_view stage, Clock::time_point start) {
  if (timing_cb && *timing_cb) (*timing_cb)(stage, ms_since(start));
}

std::string_view verdict_word(bool result) {
  return result ? "pass" : "reject";
}

ic::DecisionRecord resolve(ic::DecisionRecord::Fields& f, Clock::time_point start) {
  f.elapsed_ms = ms_since(start);
  f.resolved_at = std::chrono::system_clock::now();
  return ic::DecisionRecord(std::move(f));
}

ic::DecisionRecord resolve_failed(ic::DecisionRecord::Fields& f, ic::FailureKind kind,
                                  std::string_view failed_stage, Clock::time_point start) {
  f.stage_trail.emplace_back(ic::stage::kError);
  f.failure_kind = kind;
  f.final_result = false;
  f.final_rationale = "inspection failed at " + std::string(failed_stage) +
                      " stage: " + std::string(ic::to_string(kind));
  return resolve(f, start);
}

std::expected<ic::ModelVerdict, ic::TransportError> run_model_stage(
    model::IVisionModelClient& client, const PromptVersion& prompt,
    const interpret::ResponseInterpreter& interpreter, std::span<const std::byte> image,
    std::string_view media_type) {
  std::expected<model::ModelResponse, ic::TransportError> response;
  try {
    response = client.submit(image, prompt.text, media_type);
  } catch (const std::exception&) {
    // A client that throws instead of reporting is treated as a failed call.
    return std::unexpected(ic::TransportError::Network);
  }
  if (!response) {
    return std::unexpected(response.error());
  }
  return interpreter.interpret(response->text, client.backend_id(), prompt.version);
}

}  // namespace

std::vector<std::string> default_border_terms() {
  return {"테두리", "윤곽선", "경계선", "네모", "라인",
          "border", "frame", "outline", "boundary", "edge", "line"};
}

std::vector<std::string> default_certainty_phrases() {
  return {"테두리가 전혀 없", "border가 전혀 없", "완전히 깨끗한", "전혀 문제없"};
}

InspectionOrchestrator::InspectionOrchestrator(
    OrchestratorConfig config, PromptTable prompts, vision::BorderDetector detector,
    interpret::ResponseInterpreter interpreter,
    std::shared_ptr<model::IVisionModelClient> primary,
    std::shared_ptr<model::IVisionModelClient> secondary,
    std::shared_ptr<IImageSource> image_source)
    : config_(std::move(config)),
      prompts_(std::move(prompts)),
      detector_(std::move(detector)),
      interpreter_(std::move(interpreter)),
      primary_(std::move(primary)),
      secondary_(std::move(secondary)),
      image_source_(std::move(image_source)) {
  if (!primary_) {
    throw std::invalid_argument("InspectionOrchestrator: primary client is required");
  }
  if (config_.mode == ic::PipelineMode::Staged) {
    if (!prompts_.contains(config_.staged_prompt)) {
      throw std::invalid_argument("InspectionOrchestrator: unknown staged prompt " +
                                  config_.staged_prompt);
    }
    return;
  }
  if (!secondary_) {
    throw std::invalid_argument("InspectionOrchestrator: hybrid mode requires a secondary client");
  }
  if (!prompts_.contains(config_.primary_prompt)) {
    throw std::invalid_argument("InspectionOrchestrator: unknown primary prompt " +
                                config_.primary_prompt);
  }
  if (!prompts_.contains(config_.secondary_prompt)) {
    throw std::invalid_argument("InspectionOrchestrator: unknown secondary prompt " +
                                config_.secondary_prompt);
  }
}

bool InspectionOrchestrator::should_trust(const ic::ModelVerdict& primary) const {
  if (!primary.result) {
    return interpret::contains_any_phrase(primary.rationale, config_.border_terms);
  }
  return interpret::contains_any_phrase(primary.rationale, config_.certainty_phrases);
}

ic::DecisionRecord InspectionOrchestrator::inspect(const ic::ImageSample& sample,
                                                   StageTimingCallback* timing_cb) const {
  const auto start = Clock::now();
  ic::DecisionRecord::Fields f;
  f.mode = config_.mode;
  f.source = sample.source;
  f.stage_trail.emplace_back(ic::stage::kHeuristic);

  auto stage_start = Clock::now();
  f.heuristic = detector_.detect(sample);
  report(timing_cb, ic::stage::kHeuristic, stage_start);

  if (f.heuristic.has_border) {
    f.final_result = false;
    f.final_rationale = "heuristic border detected: " + f.heuristic.explanation;
    return resolve(f, start);
  }

  std::vector<std::byte> png;
  std::span<const std::byte> image = sample.encoded;
  ic::ImageFormat format = sample.format;
  if (image.empty()) {
    std::optional<std::vector<std::byte>> encoded;
    if (sample.raster.valid()) encoded = vision::encode_png(sample.raster);
    if (!encoded) {
      return resolve_failed(f, ic::FailureKind::NotAnImage, ic::stage::kHeuristic, start);
    }
    png = std::move(*encoded);
    image = png;
    format = ic::ImageFormat::Png;
  } else if (format == ic::ImageFormat::Unknown) {
    format = vision::sniff_format(image);
  }
  const std::string_view media = ic::media_type(format);

  const bool staged = config_.mode == ic::PipelineMode::Staged;
  const PromptVersion* primary_prompt =
      prompts_.find(staged ? config_.staged_prompt : config_.primary_prompt);

  f.stage_trail.emplace_back(ic::stage::kPrimary);
  stage_start = Clock::now();
  auto a = run_model_stage(*primary_, *primary_prompt, interpreter_, image, media);
  report(timing_cb, ic::stage::kPrimary, stage_start);
  if (!a) {
    return resolve_failed(f, ic::to_failure_kind(a.error()), ic::stage::kPrimary, start);
  }
  f.verdicts.push_back(*a);

  if (staged) {
    f.final_result = a->result;
    f.final_rationale = a->rationale + " [staged: " + a->backend_id + "]";
    return resolve(f, start);
  }
  if (should_trust(*a)) {
    f.final_result = a->result;
    f.final_rationale = a->rationale + " [primary trusted: " + a->backend_id + "]";
    return resolve(f, start);
  }

  f.stage_trail.emplace_back(ic::stage::kSecondary);
  stage_start = Clock::now();
  auto b = run_model_stage(*secondary_, *prompts_.find(config_.secondary_prompt), interpreter_,
                           image, media);
  report(timing_cb, ic::stage::kSecondary, stage_start);
  if (!b) {
    return resolve_failed(f, ic::to_failure_kind(b.error()), ic::stage::kSecondary, start);
  }
  f.verdicts.push_back(*b);

  f.final_result = b->result;
  std::string summary = " [primary " + a->backend_id + ": " + std::string(verdict_word(a->result)) +
                        ", secondary " + b->backend_id + ": " +
                        std::string(verdict_word(b->result));
  summary += a->result != b->result ? "; secondary overrides primary]" : "; verdicts agree]";
  f.final_rationale = b->rationale + summary;
  return resolve(f, start);
}

ic::DecisionRecord InspectionOrchestrator::inspect_url(std::string_view url,
                                                       StageTimingCallback* timing_cb) const {
  const auto start = Clock::now();
  ic::DecisionRecord::Fields f;
  f.mode = config_.mode;
  f.source = std::string(url);
  f.stage_trail.emplace_back(ic::stage::kHeuristic);
  f.heuristic.explanation = "not run";

  if (!image_source_) {
    return resolve_failed(f, ic::FailureKind::FetchFailed, "input", start);
  }
  auto fetched = image_source_->fetch(url);
  if (!fetched) {
    return resolve_failed(f, ic::to_failure_kind(fetched.error()), "input", start);
  }
  return inspect(*fetched, timing_cb);
}

}  // namespace inspecta::app
