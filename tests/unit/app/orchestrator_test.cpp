#include <inspecta/app/orchestrator.hpp>
#include <inspecta/model/mock_vision_model_client.hpp>
#include <gtest/gtest.h>
#include "support/test_support.hpp"
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace ia = inspecta::app;
namespace ic = inspecta::core;
namespace im = inspecta::model;
using inspecta::testing::framed_bgr;
using inspecta::testing::raster_sample;
using inspecta::testing::solid_bgr;

namespace {

using Trail = std::vector<std::string>;

struct Harness {
  std::shared_ptr<im::MockVisionModelClient> primary =
      std::make_shared<im::MockVisionModelClient>("nova");
  std::shared_ptr<im::MockVisionModelClient> secondary =
      std::make_shared<im::MockVisionModelClient>("claude");

  ia::InspectionOrchestrator make(ia::OrchestratorConfig cfg = {},
                                  std::shared_ptr<ia::IImageSource> source = nullptr) {
    return ia::InspectionOrchestrator(std::move(cfg), ia::default_prompt_table(),
                                      inspecta::vision::BorderDetector{},
                                      inspecta::interpret::ResponseInterpreter{}, primary,
                                      secondary, std::move(source));
  }
};

ic::ImageSample clean_sample() { return raster_sample(solid_bgr(200, 200, 255, 255, 255)); }

ic::ImageSample red_framed_sample() { return raster_sample(framed_bgr(200, 200, 5, 0, 0, 255)); }

/// Serves fixed outcomes per location.
class ScriptedImageSource : public ia::IImageSource {
 public:
  std::map<std::string, std::expected<ic::ImageSample, ic::InputError>> outcomes;

  std::expected<ic::ImageSample, ic::InputError> fetch(std::string_view location) override {
    const auto it = outcomes.find(std::string(location));
    if (it == outcomes.end()) return std::unexpected(ic::InputError::NetworkError);
    return it->second;
  }
};

}  // namespace

TEST(InspectionOrchestrator, HeuristicBorderShortCircuits) {
  Harness h;
  const auto orch = h.make();
  const auto record = orch.inspect(red_framed_sample());

  EXPECT_FALSE(record.final_result());
  EXPECT_EQ(record.stage_trail(), Trail({"heuristic"}));
  EXPECT_TRUE(record.verdicts().empty());
  EXPECT_FALSE(record.failed());
  EXPECT_TRUE(record.heuristic().has_border);
  EXPECT_EQ(record.final_rationale().rfind("heuristic border detected: ", 0), 0u);
  EXPECT_EQ(h.primary->call_count(), 0);
  EXPECT_EQ(h.secondary->call_count(), 0);
}

TEST(InspectionOrchestrator, StagedHeuristicBorderAlsoShortCircuits) {
  Harness h;
  ia::OrchestratorConfig cfg;
  cfg.mode = ic::PipelineMode::Staged;
  const auto orch = h.make(cfg);
  const auto record = orch.inspect(red_framed_sample());
  EXPECT_FALSE(record.final_result());
  EXPECT_EQ(record.stage_trail(), Trail({"heuristic"}));
  EXPECT_EQ(record.mode(), ic::PipelineMode::Staged);
  EXPECT_EQ(h.primary->call_count(), 0);
}

TEST(InspectionOrchestrator, TrustedPrimaryRejection) {
  Harness h;
  h.primary->set_response("결과: false\n사유: 파란 테두리가 있습니다");
  const auto orch = h.make();
  const auto record = orch.inspect(clean_sample());

  EXPECT_FALSE(record.final_result());
  EXPECT_EQ(record.stage_trail(), Trail({"heuristic", "primary"}));
  ASSERT_EQ(record.verdicts().size(), 1u);
  EXPECT_EQ(record.verdicts()[0].backend_id, "nova");
  EXPECT_EQ(record.verdicts()[0].prompt_id, "v1.3");
  EXPECT_EQ(record.final_rationale(), "파란 테두리가 있습니다 [primary trusted: nova]");
  EXPECT_EQ(h.secondary->call_count(), 0);
}

TEST(InspectionOrchestrator, TrustedPrimaryAcceptanceNeedsCertaintyPhrase) {
  Harness h;
  h.primary->set_response("결과: true\n사유: 브랜드 로고만 있음");
  ia::OrchestratorConfig cfg;
  cfg.certainty_phrases.push_back("브랜드 로고만");
  const auto orch = h.make(cfg);
  const auto record = orch.inspect(clean_sample());

  EXPECT_TRUE(record.final_result());
  EXPECT_EQ(record.stage_trail(), Trail({"heuristic", "primary"}));
  EXPECT_EQ(record.final_rationale(), "브랜드 로고만 있음 [primary trusted: nova]");
  EXPECT_EQ(h.secondary->call_count(), 0);
}

TEST(InspectionOrchestrator, UncertainAcceptanceEscalates) {
  Harness h;
  h.primary->set_response("결과: true\n사유: 브랜드 로고만 있음");
  h.secondary->set_response("결과: true\n사유: 배경에 문제가 없음");
  const auto orch = h.make();
  const auto record = orch.inspect(clean_sample());

  EXPECT_TRUE(record.final_result());
  EXPECT_EQ(record.stage_trail(), Trail({"heuristic", "primary", "secondary"}));
  ASSERT_EQ(record.verdicts().size(), 2u);
  EXPECT_EQ(record.verdicts()[1].backend_id, "claude");
  EXPECT_EQ(record.verdicts()[1].prompt_id, "v1.1");
  EXPECT_EQ(record.final_rationale(),
            "배경에 문제가 없음 [primary nova: pass, secondary claude: pass; verdicts agree]");
}

TEST(InspectionOrchestrator, SecondaryOverridesAmbiguousRejection) {
  Harness h;
  h.primary->set_response("결과: false\n사유: 광고 문구가 있습니다");
  h.secondary->set_response("결과: true\n사유: 브랜드명만 표시됨");
  const auto orch = h.make();
  const auto record = orch.inspect(clean_sample());

  EXPECT_TRUE(record.final_result());
  EXPECT_EQ(record.stage_trail(), Trail({"heuristic", "primary", "secondary"}));
  EXPECT_EQ(record.final_rationale(),
            "브랜드명만 표시됨 [primary nova: reject, secondary claude: pass; "
            "secondary overrides primary]");
  EXPECT_FALSE(record.verdicts()[0].result);
  EXPECT_TRUE(record.verdicts()[1].result);
}

TEST(InspectionOrchestrator, SecondaryUsesStricterPrompt) {
  Harness h;
  h.primary->set_response("결과: true\n사유: 괜찮아 보입니다");
  const auto orch = h.make();
  (void)orch.inspect(clean_sample());
  EXPECT_EQ(h.primary->last_instruction(), orch.prompts().find("v1.3")->text);
  EXPECT_EQ(h.secondary->last_instruction(), orch.prompts().find("v1.1")->text);
}

TEST(InspectionOrchestrator, StagedModeCallsPrimaryOnce) {
  Harness h;
  h.primary->set_response("결과: false\n사유: 할인 가격 문구");
  ia::OrchestratorConfig cfg;
  cfg.mode = ic::PipelineMode::Staged;
  const auto orch = h.make(cfg);
  const auto record = orch.inspect(clean_sample());

  EXPECT_FALSE(record.final_result());
  EXPECT_EQ(record.stage_trail(), Trail({"heuristic", "primary"}));
  EXPECT_EQ(record.final_rationale(), "할인 가격 문구 [staged: nova]");
  EXPECT_EQ(record.verdicts().at(0).prompt_id, "v3.2");
  EXPECT_EQ(h.primary->call_count(), 1);
  EXPECT_EQ(h.secondary->call_count(), 0);
}

TEST(InspectionOrchestrator, PrimaryFailureIsRecorded) {
  Harness h;
  h.primary->set_failure(ic::TransportError::Auth);
  const auto orch = h.make();
  const auto record = orch.inspect(clean_sample());

  EXPECT_TRUE(record.failed());
  EXPECT_EQ(record.failure_kind(), ic::FailureKind::AuthFailed);
  EXPECT_FALSE(record.final_result());
  EXPECT_EQ(record.stage_trail(), Trail({"heuristic", "primary", "error"}));
  EXPECT_TRUE(record.verdicts().empty());
  EXPECT_EQ(record.final_rationale(), "inspection failed at primary stage: auth_failed");
  EXPECT_EQ(h.secondary->call_count(), 0);
}

TEST(InspectionOrchestrator, SecondaryFailureKeepsPrimaryVerdict) {
  Harness h;
  h.primary->set_response("결과: false\n사유: 광고 문구가 있습니다");
  h.secondary->set_failure(ic::TransportError::Timeout);
  const auto orch = h.make();
  const auto record = orch.inspect(clean_sample());

  EXPECT_EQ(record.failure_kind(), ic::FailureKind::TimedOut);
  EXPECT_EQ(record.stage_trail(), Trail({"heuristic", "primary", "secondary", "error"}));
  ASSERT_EQ(record.verdicts().size(), 1u);
  EXPECT_EQ(record.verdicts()[0].backend_id, "nova");
  EXPECT_FALSE(record.final_result());
}

TEST(InspectionOrchestrator, ThrowingClientBecomesNetworkFailure) {
  Harness h;
  h.primary->set_handler([](std::span<const std::byte>, std::string_view)
                             -> std::expected<im::ModelResponse, ic::TransportError> {
    throw std::runtime_error("boom");
  });
  const auto orch = h.make();
  const auto record = orch.inspect(clean_sample());
  EXPECT_EQ(record.failure_kind(), ic::FailureKind::NetworkFailed);
  EXPECT_EQ(record.stage_trail(), Trail({"heuristic", "primary", "error"}));
}

TEST(InspectionOrchestrator, EmptySampleIsNotAnImage) {
  Harness h;
  const auto orch = h.make();
  ic::ImageSample empty;
  empty.source = "nothing";
  const auto record = orch.inspect(empty);
  EXPECT_EQ(record.failure_kind(), ic::FailureKind::NotAnImage);
  EXPECT_EQ(record.stage_trail(), Trail({"heuristic", "error"}));
  EXPECT_TRUE(record.heuristic().decode_failed);
  EXPECT_EQ(h.primary->call_count(), 0);
}

TEST(InspectionOrchestrator, UndecodableBytesStillReachTheModel) {
  Harness h;
  h.primary->set_response("결과: false\n사유: 이미지에 선명한 테두리");
  const auto orch = h.make();
  ic::ImageSample sample;
  sample.encoded = {std::byte{0x00}, std::byte{0x01}, std::byte{0x02}};
  const auto record = orch.inspect(sample);
  EXPECT_TRUE(record.heuristic().decode_failed);
  EXPECT_FALSE(record.heuristic().has_border);
  EXPECT_EQ(h.primary->call_count(), 1);
  EXPECT_EQ(record.stage_trail(), Trail({"heuristic", "primary"}));
}

TEST(InspectionOrchestrator, ModelSeesEncodedPng) {
  Harness h;
  std::size_t seen = 0;
  bool png_magic = false;
  h.primary->set_handler([&](std::span<const std::byte> image, std::string_view)
                             -> std::expected<im::ModelResponse, ic::TransportError> {
    seen = image.size();
    png_magic = image.size() > 4 && image[1] == std::byte{'P'} && image[2] == std::byte{'N'} &&
                image[3] == std::byte{'G'};
    im::ModelResponse r;
    r.text = "결과: false\n사유: 테두리 있음";
    return r;
  });
  const auto orch = h.make();
  (void)orch.inspect(clean_sample());
  EXPECT_GT(seen, 0u);
  EXPECT_TRUE(png_magic);
}

TEST(InspectionOrchestrator, TimingCallbackReportsEachStage) {
  Harness h;
  h.primary->set_response("결과: false\n사유: 광고 문구가 있습니다");
  const auto orch = h.make();
  std::vector<std::string> stages;
  ia::StageTimingCallback cb = [&](std::string_view stage, double ms) {
    EXPECT_GE(ms, 0.0);
    stages.emplace_back(stage);
  };
  (void)orch.inspect(clean_sample(), &cb);
  EXPECT_EQ(stages, Trail({"heuristic", "primary", "secondary"}));
}

TEST(InspectionOrchestrator, RecordCarriesSourceModeAndTiming) {
  Harness h;
  const auto orch = h.make();
  const auto record = orch.inspect(raster_sample(solid_bgr(64, 64, 255, 255, 255), "shelf/1.png"));
  EXPECT_EQ(record.source(), "shelf/1.png");
  EXPECT_EQ(record.mode(), ic::PipelineMode::Hybrid);
  EXPECT_GE(record.elapsed_ms(), 0.0);
  EXPECT_NE(record.resolved_at(), std::chrono::system_clock::time_point{});
}

TEST(InspectionOrchestrator, ShouldTrustRules) {
  Harness h;
  const auto orch = h.make();
  ic::ModelVerdict v;
  v.result = false;
  v.rationale = "a blue Frame surrounds the product";
  EXPECT_TRUE(orch.should_trust(v));
  v.rationale = "광고 문구가 있습니다";
  EXPECT_FALSE(orch.should_trust(v));
  v.result = true;
  v.rationale = "테두리가 전혀 없는 깨끗한 배경";
  EXPECT_TRUE(orch.should_trust(v));
  v.rationale = "괜찮아 보입니다";
  EXPECT_FALSE(orch.should_trust(v));
}

TEST(InspectionOrchestrator, InspectUrlFetchFailures) {
  Harness h;
  auto source = std::make_shared<ScriptedImageSource>();
  source->outcomes.emplace("ftp://bad", std::unexpected(ic::InputError::InvalidUrl));
  source->outcomes.emplace("https://img.test/text.html", std::unexpected(ic::InputError::NotAnImage));
  source->outcomes.emplace("https://img.test/ok.png", clean_sample());
  const auto orch = h.make({}, source);

  const auto bad = orch.inspect_url("ftp://bad");
  EXPECT_EQ(bad.failure_kind(), ic::FailureKind::InvalidUrl);
  EXPECT_EQ(bad.stage_trail(), Trail({"heuristic", "error"}));
  EXPECT_EQ(bad.final_rationale(), "inspection failed at input stage: invalid_url");
  EXPECT_EQ(bad.source(), "ftp://bad");

  EXPECT_EQ(orch.inspect_url("https://img.test/missing").failure_kind(),
            ic::FailureKind::FetchFailed);
  EXPECT_EQ(orch.inspect_url("https://img.test/text.html").failure_kind(),
            ic::FailureKind::NotAnImage);
  EXPECT_EQ(h.primary->call_count(), 0);

  const auto ok = orch.inspect_url("https://img.test/ok.png");
  EXPECT_FALSE(ok.failed());
  EXPECT_EQ(h.primary->call_count(), 1);
}

TEST(InspectionOrchestrator, InspectUrlWithoutSourceFails) {
  Harness h;
  const auto orch = h.make();
  const auto record = orch.inspect_url("https://img.test/a.png");
  EXPECT_EQ(record.failure_kind(), ic::FailureKind::FetchFailed);
  EXPECT_EQ(record.heuristic().explanation, "not run");
}

TEST(InspectionOrchestrator, ConstructorValidation) {
  auto primary = std::make_shared<im::MockVisionModelClient>("nova");
  auto secondary = std::make_shared<im::MockVisionModelClient>("claude");
  const auto build = [&](ia::OrchestratorConfig cfg,
                         std::shared_ptr<im::IVisionModelClient> p,
                         std::shared_ptr<im::IVisionModelClient> s) {
    return ia::InspectionOrchestrator(std::move(cfg), ia::default_prompt_table(),
                                      inspecta::vision::BorderDetector{},
                                      inspecta::interpret::ResponseInterpreter{}, std::move(p),
                                      std::move(s));
  };

  EXPECT_THROW((void)build({}, nullptr, secondary), std::invalid_argument);
  EXPECT_THROW((void)build({}, primary, nullptr), std::invalid_argument);

  ia::OrchestratorConfig unknown_prompt;
  unknown_prompt.secondary_prompt = "v9.9";
  EXPECT_THROW((void)build(unknown_prompt, primary, secondary), std::invalid_argument);

  ia::OrchestratorConfig staged;
  staged.mode = ic::PipelineMode::Staged;
  EXPECT_NO_THROW((void)build(staged, primary, nullptr));
  staged.staged_prompt = "missing";
  EXPECT_THROW((void)build(staged, primary, nullptr), std::invalid_argument);
}
