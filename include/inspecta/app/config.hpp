#pragma once

#include <inspecta/app/orchestrator.hpp>
#include <inspecta/model/backend_config.hpp>
#include <inspecta/vision/border_detector.hpp>
#include <cstddef>
#include <expected>
#include <string>

namespace inspecta::app {

/// Model backend wiring: mock (scripted, no network) or http (real endpoints).
enum class BackendMode {
  Mock,
  Http,
};

/// Everything needed to build an orchestrator and its collaborators.
struct InspectionConfig {
  BackendMode backend_mode{BackendMode::Mock};
  OrchestratorConfig orchestrator;
  model::BackendConfig primary;
  model::BackendConfig secondary;
  vision::BorderDetectorConfig detector;
  std::size_t max_rationale_chars{300};
  std::string prompt_file;  // empty = built-in prompts
  int fetch_timeout_ms{15000};
  std::string store_path;   // empty = in-memory store
  std::size_t num_workers{0};
};

/// Load config from a key=value file (one per line, # comments) on top of the
/// defaults. A missing file yields the defaults. Throws std::invalid_argument
/// for a malformed numeric value or an unknown enumerated value.
InspectionConfig load_config(const std::string& path);

/// Default config when no file is provided.
InspectionConfig default_config();

/// Cross-field checks (positive timeouts, endpoints for http mode, ...).
/// Returns a description of the first problem found.
[[nodiscard]] std::expected<void, std::string> validate_config(const InspectionConfig& cfg);

}  // namespace inspecta::app
