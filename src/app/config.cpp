#include <inspecta/app/config.hpp>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace inspecta::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

/// "a, b ,c" -> {"a","b","c"}; empty items dropped.
std::vector<std::string> split_list(const std::string& value) {
  std::vector<std::string> items;
  std::size_t pos = 0;
  while (pos <= value.size()) {
    const auto comma = value.find(',', pos);
    std::string item = value.substr(pos, comma == std::string::npos ? std::string::npos : comma - pos);
    trim(item);
    if (!item.empty()) items.push_back(std::move(item));
    if (comma == std::string::npos) break;
    pos = comma + 1;
  }
  return items;
}

void apply_backend_key(model::BackendConfig& b, std::string_view field, const std::string& value) {
  if (field == "id") b.id = value;
  else if (field == "family") {
    if (!model::parse_backend_family(value, b.family)) {
      throw std::invalid_argument("unknown backend family: " + value);
    }
  }
  else if (field == "endpoint") b.endpoint = value;
  else if (field == "model") b.model = value;
  else if (field == "api_key_env") b.api_key_env = value;
  else if (field == "api_version") b.api_version = value;
  else if (field == "max_tokens") b.max_tokens = std::stoi(value);
  else if (field == "temperature") b.temperature = std::stod(value);
  else if (field == "timeout_ms") b.timeout_ms = std::stoi(value);
}

}  // namespace

InspectionConfig default_config() {
  InspectionConfig c;
  c.backend_mode = BackendMode::Mock;

  c.primary.id = "nova";
  c.primary.family = model::BackendFamily::VisionFocused;
  c.primary.api_key_env = "INSPECTA_PRIMARY_API_KEY";

  c.secondary.id = "claude";
  c.secondary.family = model::BackendFamily::Conversational;
  c.secondary.api_key_env = "INSPECTA_SECONDARY_API_KEY";
  return c;
}

InspectionConfig load_config(const std::string& path) {
  InspectionConfig c = default_config();
  std::ifstream f(path);
  if (!f) return c;

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    const std::string_view k = key;
    if (k == "backend") {
      if (value == "mock") c.backend_mode = BackendMode::Mock;
      else if (value == "http") c.backend_mode = BackendMode::Http;
      else throw std::invalid_argument("unknown backend: " + value);
    }
    else if (k == "mode") {
      if (!core::parse_pipeline_mode(value, c.orchestrator.mode)) {
        throw std::invalid_argument("unknown mode: " + value);
      }
    }
    else if (k == "primary_prompt") c.orchestrator.primary_prompt = value;
    else if (k == "secondary_prompt") c.orchestrator.secondary_prompt = value;
    else if (k == "staged_prompt") c.orchestrator.staged_prompt = value;
    else if (k == "border_terms") c.orchestrator.border_terms = split_list(value);
    else if (k == "certainty_phrases") c.orchestrator.certainty_phrases = split_list(value);
    else if (k == "prompt_file") c.prompt_file = value;
    else if (k == "fetch_timeout_ms") c.fetch_timeout_ms = std::stoi(value);
    else if (k == "store_path") c.store_path = value;
    else if (k == "workers") c.num_workers = std::stoul(value);
    else if (k == "rationale_max_chars") c.max_rationale_chars = std::stoul(value);
    else if (k == "detector.center_exclusion_ratio") c.detector.center_exclusion_ratio = std::stof(value);
    else if (k == "detector.band_thickness_ratio") c.detector.band_thickness_ratio = std::stof(value);
    else if (k == "detector.min_band_pixels") c.detector.min_band_pixels = static_cast<std::uint32_t>(std::stoul(value));
    else if (k == "detector.hue_low_fraction") c.detector.hue_low_fraction = std::stof(value);
    else if (k == "detector.hue_high_fraction") c.detector.hue_high_fraction = std::stof(value);
    else if (k == "detector.color_weight") c.detector.color_weight = std::stof(value);
    else if (k == "detector.edge_weight") c.detector.edge_weight = std::stof(value);
    else if (k == "detector.threshold") c.detector.decision_threshold = std::stof(value);
    else if (k.starts_with("primary.")) apply_backend_key(c.primary, k.substr(8), value);
    else if (k.starts_with("secondary.")) apply_backend_key(c.secondary, k.substr(10), value);
  }
  return c;
}

std::expected<void, std::string> validate_config(const InspectionConfig& cfg) {
  if (cfg.fetch_timeout_ms <= 0) {
    return std::unexpected("fetch_timeout_ms must be positive");
  }
  if (cfg.max_rationale_chars == 0) {
    return std::unexpected("rationale_max_chars must be positive");
  }
  const bool hybrid = cfg.orchestrator.mode == core::PipelineMode::Hybrid;
  std::vector<const model::BackendConfig*> backends{&cfg.primary};
  if (hybrid) backends.push_back(&cfg.secondary);
  for (const auto* b : backends) {
    if (b->id.empty()) {
      return std::unexpected("backend id must not be empty");
    }
    if (b->timeout_ms <= 0) {
      return std::unexpected("backend '" + b->id + "': timeout_ms must be positive");
    }
    if (b->max_tokens <= 0) {
      return std::unexpected("backend '" + b->id + "': max_tokens must be positive");
    }
    if (cfg.backend_mode == BackendMode::Http && b->endpoint.empty()) {
      return std::unexpected("backend '" + b->id + "': endpoint is required for backend=http");
    }
  }
  if (hybrid && cfg.primary.id == cfg.secondary.id) {
    return std::unexpected("primary and secondary backends must have distinct ids");
  }
  return {};
}

}  // namespace inspecta::app
