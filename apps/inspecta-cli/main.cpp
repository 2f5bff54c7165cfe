/**
 * inspecta-cli: inspect product photos (URLs or local files) for decorative borders
 * and policy violations; print one decision per image.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/apps/inspecta-cli/inspecta_cli [--config path] --input <url|path> [...]
 */

#include <inspecta/app/config.hpp>
#include <inspecta/app/image_source.hpp>
#include <inspecta/app/inspection_runner.hpp>
#include <inspecta/app/orchestrator.hpp>
#include <inspecta/app/prompt_table.hpp>
#include <inspecta/app/result_store.hpp>
#include <inspecta/core/decision_record.hpp>
#include <inspecta/interpret/response_interpreter.hpp>
#include <inspecta/model/curl_http_transport.hpp>
#include <inspecta/model/http_vision_model_client.hpp>
#include <inspecta/model/mock_vision_model_client.hpp>
#include <inspecta/vision/border_detector.hpp>
#ifdef INSPECTA_HAS_TBB
#include <inspecta/app/inspection_runner_tbb.hpp>
#endif

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <expected>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace ia = inspecta::app;
namespace ic = inspecta::core;
namespace im = inspecta::model;

/// http(s) locations go to the network source, everything else is a file path.
class LocationImageSource : public ia::IImageSource {
 public:
  LocationImageSource(std::shared_ptr<im::IHttpTransport> transport, std::chrono::milliseconds timeout)
      : http_(std::move(transport), timeout) {}

  std::expected<ic::ImageSample, ic::InputError> fetch(std::string_view location) override {
    if (location.starts_with("http://") || location.starts_with("https://") ||
        location.find("://") != std::string_view::npos) {
      return http_.fetch(location);
    }
    return file_.fetch(location);
  }

 private:
  ia::HttpImageSource http_;
  ia::FileImageSource file_;
};

std::shared_ptr<im::IVisionModelClient> make_mock_client(const std::string& id,
                                                         const std::string& response) {
  auto mock = std::make_shared<im::MockVisionModelClient>(id);
  mock->set_response(response);
  return mock;
}

std::string trail_str(const std::vector<std::string>& trail) {
  std::string out;
  for (const auto& s : trail) {
    if (!out.empty()) out += ">";
    out += s;
  }
  return out;
}

std::string format_record(const ic::DecisionRecord& r) {
  std::ostringstream out;
  out << "source=" << r.source() << " result=" << (r.final_result() ? "pass" : "reject")
      << " trail=" << trail_str(r.stage_trail()) << " elapsed_ms=" << r.elapsed_ms()
      << " heuristic_confidence=" << r.heuristic().confidence;
  if (r.failure_kind()) out << " failure=" << ic::to_string(*r.failure_kind());
  out << "\n  rationale: " << r.final_rationale() << "\n";
  return out.str();
}

std::vector<std::string> read_lines(const std::string& path) {
  std::vector<std::string> lines;
  std::ifstream f(path);
  std::string line;
  while (std::getline(f, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty() || line[0] == '#') continue;
    lines.push_back(line);
  }
  return lines;
}

void print_usage() {
  std::cout << "Usage: inspecta_cli [options] --input <url|path> [--input ...]\n"
            << "  --config <path>        Inspection config (key=value file); default: built-in (mock backends)\n"
            << "  --mode <mode>          Override pipeline mode: hybrid | staged\n"
            << "  --backend <type>       Override backends: mock | http\n"
            << "  --input <url|path>     Image URL or local file (repeatable)\n"
            << "  --inputs-file <path>   File with one URL or path per line\n"
            << "  --workers <n>          Parallel workers (0 = hardware concurrency, 1 = sequential)\n"
#ifdef INSPECTA_HAS_TBB
            << "  --tbb                  Use the TBB batch runner\n"
#endif
            << "  --store <path>         Append decisions to a JSON-lines file\n"
            << "  --recent <n>           List the n most recent stored decisions and exit\n"
            << "  --mock-response <text> Primary mock backend answer (backend=mock only)\n"
            << "  --timing               Print per-stage timings\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string mode_override;
  std::string backend_override;
  std::string inputs_file;
  std::string store_override;
  std::string mock_response = "결과: true\n사유: 테두리가 전혀 없는 깔끔한 배경입니다";
  std::vector<std::string> inputs;
  long workers_override = -1;
  long recent = -1;
  bool timing = false;
  bool use_tbb = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--mode" && i + 1 < argc) {
      mode_override = argv[++i];
    } else if (arg == "--backend" && i + 1 < argc) {
      backend_override = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      inputs.emplace_back(argv[++i]);
    } else if (arg == "--inputs-file" && i + 1 < argc) {
      inputs_file = argv[++i];
    } else if (arg == "--workers" && i + 1 < argc) {
      workers_override = std::strtol(argv[++i], nullptr, 10);
    } else if (arg == "--store" && i + 1 < argc) {
      store_override = argv[++i];
    } else if (arg == "--recent" && i + 1 < argc) {
      recent = std::strtol(argv[++i], nullptr, 10);
    } else if (arg == "--mock-response" && i + 1 < argc) {
      mock_response = argv[++i];
    } else if (arg == "--timing") {
      timing = true;
    } else if (arg == "--tbb") {
      use_tbb = true;
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      std::cerr << "[ERROR] Unknown argument: " << arg << "\n";
      print_usage();
      return 1;
    }
  }

  ia::InspectionConfig cfg;
  try {
    cfg = config_path.empty() ? ia::default_config() : ia::load_config(config_path);
  } catch (const std::exception& e) {
    std::cerr << "[ERROR] Bad config " << config_path << ": " << e.what() << "\n";
    return 1;
  }

  if (!mode_override.empty() && !ic::parse_pipeline_mode(mode_override, cfg.orchestrator.mode)) {
    std::cerr << "[ERROR] Unknown --mode " << mode_override << " (use hybrid or staged)\n";
    return 1;
  }
  if (!backend_override.empty()) {
    if (backend_override == "mock") {
      cfg.backend_mode = ia::BackendMode::Mock;
    } else if (backend_override == "http") {
      cfg.backend_mode = ia::BackendMode::Http;
    } else {
      std::cerr << "[ERROR] Unknown --backend " << backend_override << " (use mock or http)\n";
      return 1;
    }
  }
  if (!store_override.empty()) cfg.store_path = store_override;
  if (workers_override >= 0) cfg.num_workers = static_cast<std::size_t>(workers_override);

  if (auto valid = ia::validate_config(cfg); !valid) {
    std::cerr << "[ERROR] Invalid config: " << valid.error() << "\n";
    return 1;
  }

  std::unique_ptr<ia::IResultStore> store;
  if (!cfg.store_path.empty()) {
    store = std::make_unique<ia::JsonlResultStore>(cfg.store_path);
  }

  if (recent >= 0) {
    if (!store) {
      std::cerr << "[ERROR] --recent needs --store or store_path in config\n";
      return 1;
    }
    auto listed = store->list_recent(static_cast<std::size_t>(recent));
    if (!listed) {
      std::cerr << "[ERROR] Cannot read " << cfg.store_path << ": "
                << ic::to_string(listed.error()) << "\n";
      return 1;
    }
    for (const auto& s : *listed) {
      std::cout << "[INFO] id=" << s.id << " " << format_record(s.record);
    }
    return 0;
  }

  if (!inputs_file.empty()) {
    auto more = read_lines(inputs_file);
    if (more.empty()) {
      std::cerr << "[WARN] No inputs read from " << inputs_file << "\n";
    }
    inputs.insert(inputs.end(), more.begin(), more.end());
  }
  if (inputs.empty()) {
    std::cerr << "[ERROR] No input given\n";
    print_usage();
    return 1;
  }

  std::unique_ptr<ia::InspectionOrchestrator> orchestrator;
  try {
    auto transport = std::make_shared<im::CurlHttpTransport>();
    ia::PromptTable prompts =
        cfg.prompt_file.empty() ? ia::default_prompt_table() : ia::load_prompt_table(cfg.prompt_file);

    std::shared_ptr<im::IVisionModelClient> primary;
    std::shared_ptr<im::IVisionModelClient> secondary;
    if (cfg.backend_mode == ia::BackendMode::Http) {
      primary = im::make_vision_model_client(cfg.primary, transport);
      if (cfg.orchestrator.mode == ic::PipelineMode::Hybrid) {
        secondary = im::make_vision_model_client(cfg.secondary, transport);
      }
    } else {
      primary = make_mock_client(cfg.primary.id, mock_response);
      secondary = make_mock_client(cfg.secondary.id,
                                   "결과: true\n사유: 장식용 테두리나 광고 문구가 없습니다");
    }

    inspecta::interpret::InterpreterConfig icfg = inspecta::interpret::default_interpreter_config();
    icfg.max_rationale_chars = cfg.max_rationale_chars;

    orchestrator = std::make_unique<ia::InspectionOrchestrator>(
        cfg.orchestrator, std::move(prompts), inspecta::vision::BorderDetector(cfg.detector),
        inspecta::interpret::ResponseInterpreter(std::move(icfg)), std::move(primary),
        std::move(secondary),
        std::make_shared<LocationImageSource>(transport,
                                              std::chrono::milliseconds(cfg.fetch_timeout_ms)));
  } catch (const std::exception& e) {
    std::cerr << "[ERROR] Setup failed: " << e.what() << "\n";
    return 1;
  }

  std::cout << "[INFO] Inspecting " << inputs.size() << " image(s), mode="
            << ic::to_string(cfg.orchestrator.mode)
            << " backend=" << (cfg.backend_mode == ia::BackendMode::Http ? "http" : "mock") << "\n";

  std::mutex out_mutex;
  std::size_t failures = 0;
  auto on_record = [&](std::size_t index, const ic::DecisionRecord& r) {
    std::string stored_note;
    if (store) {
      auto id = store->save(r);
      stored_note = id ? " stored_id=" + *id
                       : " store_error=" + std::string(ic::to_string(id.error()));
    }
    std::lock_guard lock(out_mutex);
    if (r.failed()) ++failures;
    (r.failed() ? std::cerr : std::cout)
        << (r.failed() ? "[WARN] " : "[INFO] ") << "#" << index << stored_note << " "
        << format_record(r);
  };

  if (timing && inputs.size() == 1) {
    ia::StageTimingCallback timing_cb = [](std::string_view stage, double ms) {
      std::cout << "[INFO] stage " << stage << " " << ms << " ms\n";
    };
    on_record(0, orchestrator->inspect_url(inputs.front(), &timing_cb));
  } else {
    if (timing) std::cerr << "[WARN] --timing applies to a single input only\n";
    ia::BatchResult results;
#ifdef INSPECTA_HAS_TBB
    if (use_tbb) {
      results = ia::run_inspection_batch_tbb(*orchestrator, inputs, on_record);
    } else
#endif
    if (cfg.num_workers == 1) {
      results = ia::run_inspection_batch(*orchestrator, inputs, on_record);
    } else {
      if (use_tbb) std::cerr << "[WARN] Built without TBB; using the thread pool\n";
      results = ia::run_inspection_batch_parallel(*orchestrator, inputs, on_record, cfg.num_workers);
    }
  }

  std::cout << "[INFO] Done: " << inputs.size() << " image(s), " << failures << " failed\n";
  return 0;
}
