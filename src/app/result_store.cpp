#include <inspecta/app/result_store.hpp>
#include <nlohmann/json.hpp>
#include <openssl/rand.h>
#include <algorithm>
#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace inspecta::app {

namespace {

namespace ic = inspecta::core;
using nlohmann::json;

std::int64_t to_epoch_ms(std::chrono::system_clock::time_point t) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_ms(std::int64_t ms) {
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          std::chrono::milliseconds(ms)));
}

json verdict_json(const ic::ModelVerdict& v) {
  return {{"result", v.result},
          {"rationale", v.rationale},
          {"raw_text", v.raw_text},
          {"backend_id", v.backend_id},
          {"prompt_id", v.prompt_id}};
}

ic::ModelVerdict verdict_from_json(const json& j) {
  ic::ModelVerdict v;
  v.result = j.at("result").get<bool>();
  v.rationale = j.at("rationale").get<std::string>();
  v.raw_text = j.value("raw_text", "");
  v.backend_id = j.value("backend_id", "");
  v.prompt_id = j.value("prompt_id", "");
  return v;
}

json heuristic_json(const ic::HeuristicSignal& h) {
  json hues = json::array();
  for (const auto& m : h.matched_hues) {
    hues.push_back({{"name", m.name}, {"fraction", m.fraction}});
  }
  return {{"has_border", h.has_border},
          {"confidence", h.confidence},
          {"explanation", h.explanation},
          {"matched_hues", std::move(hues)},
          {"edge_ratio", h.edge_ratio},
          {"decode_failed", h.decode_failed}};
}

ic::HeuristicSignal heuristic_from_json(const json& j) {
  ic::HeuristicSignal h;
  h.has_border = j.value("has_border", false);
  h.confidence = j.value("confidence", 0.f);
  h.explanation = j.value("explanation", "");
  h.edge_ratio = j.value("edge_ratio", 0.f);
  h.decode_failed = j.value("decode_failed", false);
  if (const auto hues = j.find("matched_hues"); hues != j.end() && hues->is_array()) {
    for (const auto& m : *hues) {
      h.matched_hues.push_back({m.at("name").get<std::string>(), m.at("fraction").get<float>()});
    }
  }
  return h;
}

std::string hex_encode(const unsigned char* data, std::size_t n) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(n * 2);
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back(kDigits[data[i] >> 4]);
    out.push_back(kDigits[data[i] & 0x0F]);
  }
  return out;
}

}  // namespace

std::optional<std::string> generate_record_id() {
  std::array<unsigned char, 16> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    return std::nullopt;
  }
  return hex_encode(bytes.data(), bytes.size());
}

std::string to_json_line(const StoredRecord& stored) {
  const auto& r = stored.record;
  json verdicts = json::array();
  for (const auto& v : r.verdicts()) verdicts.push_back(verdict_json(v));

  json j;
  j["id"] = stored.id;
  j["stored_at_ms"] = to_epoch_ms(stored.stored_at);
  j["final_result"] = r.final_result();
  j["final_rationale"] = r.final_rationale();
  j["stage_trail"] = r.stage_trail();
  j["verdicts"] = std::move(verdicts);
  j["elapsed_ms"] = r.elapsed_ms();
  j["failure_kind"] =
      r.failure_kind() ? json(std::string(ic::to_string(*r.failure_kind()))) : json(nullptr);
  j["heuristic"] = heuristic_json(r.heuristic());
  j["mode"] = std::string(ic::to_string(r.mode()));
  j["source"] = r.source();
  j["resolved_at_ms"] = to_epoch_ms(r.resolved_at());
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<StoredRecord> from_json_line(std::string_view line) {
  const json j = json::parse(line.begin(), line.end(), nullptr, false);
  if (j.is_discarded() || !j.is_object()) return std::nullopt;

  try {
    ic::DecisionRecord::Fields f;
    f.final_result = j.at("final_result").get<bool>();
    f.final_rationale = j.at("final_rationale").get<std::string>();
    f.stage_trail = j.at("stage_trail").get<std::vector<std::string>>();
    for (const auto& v : j.at("verdicts")) f.verdicts.push_back(verdict_from_json(v));
    f.elapsed_ms = j.value("elapsed_ms", 0.0);
    if (const auto kind = j.find("failure_kind"); kind != j.end() && kind->is_string()) {
      ic::FailureKind k{};
      if (!ic::parse_failure_kind(kind->get<std::string>(), k)) return std::nullopt;
      f.failure_kind = k;
    }
    if (const auto h = j.find("heuristic"); h != j.end() && h->is_object()) {
      f.heuristic = heuristic_from_json(*h);
    }
    if (!ic::parse_pipeline_mode(j.value("mode", "hybrid"), f.mode)) return std::nullopt;
    f.source = j.value("source", "");
    f.resolved_at = from_epoch_ms(j.value("resolved_at_ms", std::int64_t{0}));

    return StoredRecord{j.at("id").get<std::string>(),
                        from_epoch_ms(j.value("stored_at_ms", std::int64_t{0})),
                        ic::DecisionRecord(std::move(f))};
  } catch (const json::exception&) {
    return std::nullopt;
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  }
}

std::vector<std::expected<std::string, ic::PersistenceError>> IResultStore::save_batch(
    std::span<const ic::DecisionRecord> records) {
  std::vector<std::expected<std::string, ic::PersistenceError>> ids;
  ids.reserve(records.size());
  for (const auto& r : records) {
    ids.push_back(save(r));
  }
  return ids;
}

std::expected<std::string, ic::PersistenceError> InMemoryResultStore::save(
    const ic::DecisionRecord& record) {
  auto id = generate_record_id();
  if (!id) {
    return std::unexpected(ic::PersistenceError::Unavailable);
  }
  std::lock_guard lock(mutex_);
  records_.push_back(StoredRecord{*id, std::chrono::system_clock::now(), record});
  return *id;
}

std::expected<StoredRecord, ic::PersistenceError> InMemoryResultStore::get(
    std::string_view id) const {
  std::lock_guard lock(mutex_);
  const auto it = std::find_if(records_.begin(), records_.end(),
                               [id](const StoredRecord& s) { return s.id == id; });
  if (it == records_.end()) {
    return std::unexpected(ic::PersistenceError::NotFound);
  }
  return *it;
}

std::expected<std::vector<StoredRecord>, ic::PersistenceError> InMemoryResultStore::list_recent(
    std::size_t limit) const {
  std::lock_guard lock(mutex_);
  std::vector<StoredRecord> out;
  const std::size_t n = std::min(limit, records_.size());
  out.reserve(n);
  for (auto it = records_.rbegin(); it != records_.rend() && out.size() < n; ++it) {
    out.push_back(*it);
  }
  return out;
}

std::size_t InMemoryResultStore::size() const {
  std::lock_guard lock(mutex_);
  return records_.size();
}

JsonlResultStore::JsonlResultStore(std::string path) : path_(std::move(path)) {
  if (path_.empty()) {
    throw std::invalid_argument("JsonlResultStore: path is empty");
  }
}

std::expected<std::string, ic::PersistenceError> JsonlResultStore::save(
    const ic::DecisionRecord& record) {
  auto id = generate_record_id();
  if (!id) {
    return std::unexpected(ic::PersistenceError::Unavailable);
  }
  const std::string line =
      to_json_line(StoredRecord{*id, std::chrono::system_clock::now(), record});

  std::lock_guard lock(mutex_);
  std::ofstream out(path_, std::ios::app);
  if (!out) {
    return std::unexpected(ic::PersistenceError::WriteFailed);
  }
  out << line << '\n';
  out.flush();
  if (!out) {
    return std::unexpected(ic::PersistenceError::WriteFailed);
  }
  return *id;
}

std::expected<std::vector<StoredRecord>, ic::PersistenceError> JsonlResultStore::read_all() const {
  std::vector<StoredRecord> all;
  std::lock_guard lock(mutex_);
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    return all;
  }
  std::ifstream in(path_);
  if (!in) {
    return std::unexpected(ic::PersistenceError::Unavailable);
  }
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    if (auto stored = from_json_line(line)) all.push_back(std::move(*stored));
  }
  return all;
}

std::expected<StoredRecord, ic::PersistenceError> JsonlResultStore::get(std::string_view id) const {
  auto all = read_all();
  if (!all) {
    return std::unexpected(all.error());
  }
  for (auto& s : *all) {
    if (s.id == id) return std::move(s);
  }
  return std::unexpected(ic::PersistenceError::NotFound);
}

std::expected<std::vector<StoredRecord>, ic::PersistenceError> JsonlResultStore::list_recent(
    std::size_t limit) const {
  auto all = read_all();
  if (!all) {
    return std::unexpected(all.error());
  }
  std::vector<StoredRecord> out;
  for (auto it = all->rbegin(); it != all->rend() && out.size() < limit; ++it) {
    out.push_back(std::move(*it));
  }
  return out;
}

}  // namespace inspecta::app
