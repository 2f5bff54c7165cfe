#include <inspecta/interpret/response_interpreter.hpp>
#include "text_utils.hpp"
#include <stdexcept>
#include <utility>

namespace inspecta::interpret {

namespace {

constexpr auto kFlags = std::regex::ECMAScript | std::regex::icase;

constexpr std::string_view kNoText = "no response text";
constexpr std::string_view kNoRationale = "no rationale given";
constexpr std::size_t kMinRationaleLine = 5;

bool is_ascii_space(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

bool is_leading_noise(char c) {
  const auto u = static_cast<unsigned char>(c);
  if (u >= 0x80) return false;
  return is_ascii_space(c) || c == '-' || c == '*' || c == ':' || c == '.' || c == ',' ||
         c == ';' || c == '#' || c == '>' || c == '!' || c == '?' || c == '_';
}

std::string collapse_spaces(std::string_view line) {
  std::string out;
  out.reserve(line.size());
  bool pending = false;
  for (const char c : line) {
    if (is_ascii_space(c)) {
      pending = !out.empty();
      continue;
    }
    if (pending) out.push_back(' ');
    pending = false;
    out.push_back(c);
  }
  return out;
}

}  // namespace

std::vector<std::string> default_scaffolding_patterns() {
  return {
      R"(이미지를 분석하기 위해[^\n]*?불러오겠습니다\.?)",
      R"(먼저 이미지를[^\n]*?불러오겠습니다\.?)",
      R"(이미지 파일을[^\n]*?읽겠습니다\.?)",
      R"((let me|i'll|i will) (first )?(load|read|open|look at) the image[^.\n]*\.?)",
  };
}

std::vector<std::string> default_rejection_phrases() {
  return {"부적합", "실패했", "위반", "테두리가 있", "문제가 있",
          "failed", "violation", "inappropriate", "has border"};
}

std::vector<std::string> default_acceptance_phrases() {
  return {"통과", "문제없", "문제가 없", "기준 충족", "깔끔",
          "clean", "meets", "criteria", "appropriate", "no border"};
}

InterpreterConfig default_interpreter_config() {
  InterpreterConfig cfg;
  cfg.scaffolding_patterns = default_scaffolding_patterns();
  cfg.rejection_phrases = default_rejection_phrases();
  cfg.acceptance_phrases = default_acceptance_phrases();
  return cfg;
}

ResponseInterpreter::ResponseInterpreter(InterpreterConfig config)
    : config_(std::move(config)) {
  if (config_.max_rationale_chars == 0) {
    throw std::invalid_argument("ResponseInterpreter: max_rationale_chars must be > 0");
  }
  scaffolding_.reserve(config_.scaffolding_patterns.size());
  for (const auto& pattern : config_.scaffolding_patterns) {
    try {
      scaffolding_.emplace_back(pattern, kFlags);
    } catch (const std::regex_error& e) {
      throw std::invalid_argument("ResponseInterpreter: bad scaffolding pattern '" + pattern +
                                  "': " + e.what());
    }
  }
  strategies_.push_back(std::make_unique<MarkerResultStrategy>());
  strategies_.push_back(std::make_unique<SingleKeywordResultStrategy>());
  strategies_.push_back(std::make_unique<PolarityResultStrategy>(config_.rejection_phrases,
                                                                 config_.acceptance_phrases));
}

std::string ResponseInterpreter::strip_scaffolding(std::string_view text) const {
  const std::string s = detail::erase_thinking_blocks(text);
  std::string out;
  for (const auto line : detail::split_lines(s)) {
    std::string kept(detail::cut_tool_echo(line));
    if (kept.size() <= kMaxPatternLineBytes) {
      for (const auto& re : scaffolding_) {
        kept = std::regex_replace(kept, re, "");
      }
    }
    std::string collapsed = collapse_spaces(kept);
    if (collapsed.empty()) continue;
    if (!out.empty()) out.push_back('\n');
    out += collapsed;
  }
  return out;
}

bool ResponseInterpreter::extract_result(std::string_view cleaned) const {
  for (const auto& strategy : strategies_) {
    if (auto r = strategy->extract(cleaned)) return *r;
  }
  return false;
}

std::string ResponseInterpreter::extract_rationale(std::string_view cleaned) const {
  if (const auto reason = detail::find_reason_value(cleaned)) {
    const auto field = detail::trim(*reason);
    if (!field.empty()) return std::string(field);
  }

  for (const auto line : detail::split_lines(cleaned)) {
    const auto trimmed = detail::trim(line);
    if (trimmed.empty()) continue;
    if (detail::find_result_marker(trimmed)) continue;
    if (detail::utf8_length(trimmed) > kMinRationaleLine) return std::string(trimmed);
  }

  const std::string without_markers = detail::erase_result_markers(cleaned);
  const auto rest = detail::trim(without_markers);
  if (detail::utf8_length(rest) > kMinRationaleLine) return std::string(rest);

  return std::string(cleaned);
}

std::string ResponseInterpreter::clean_rationale(std::string_view raw) const {
  std::string s = collapse_spaces(detail::erase_bool_words(raw));

  std::size_t start = 0;
  while (start < s.size() && is_leading_noise(s[start])) ++start;
  std::size_t end = s.size();
  while (end > start && (s[end - 1] == '.' || is_ascii_space(s[end - 1]))) --end;
  s = s.substr(start, end - start);

  if (s.empty()) return std::string(kNoRationale);
  if (detail::utf8_length(s) > config_.max_rationale_chars) {
    return detail::utf8_prefix(s, config_.max_rationale_chars) + "...";
  }
  return s;
}

std::pair<bool, std::string> ResponseInterpreter::extract(std::string_view text) const {
  const std::string cleaned = strip_scaffolding(text);
  if (cleaned.empty()) {
    return {false, std::string(kNoText)};
  }
  const bool result = extract_result(cleaned);
  return {result, clean_rationale(extract_rationale(cleaned))};
}

core::ModelVerdict ResponseInterpreter::interpret(std::string_view text, std::string backend_id,
                                                  std::string prompt_id) const {
  auto [result, rationale] = extract(text);
  core::ModelVerdict v;
  v.result = result;
  v.rationale = std::move(rationale);
  v.raw_text = std::string(text);
  v.backend_id = std::move(backend_id);
  v.prompt_id = std::move(prompt_id);
  return v;
}

}  // namespace inspecta::interpret
