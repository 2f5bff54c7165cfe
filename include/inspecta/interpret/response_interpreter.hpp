#pragma once

#include <inspecta/core/model_verdict.hpp>
#include <inspecta/interpret/extraction_strategy.hpp>
#include <cstddef>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace inspecta::interpret {

inline constexpr std::size_t kMaxPatternLineBytes = 2048;

struct InterpreterConfig {
  /// ECMAScript patterns (case-insensitive) removed from each line before
  /// extraction. Lines longer than kMaxPatternLineBytes are left to the
  /// built-in thinking-block and tool-echo removal only.
  std::vector<std::string> scaffolding_patterns;
  std::vector<std::string> rejection_phrases;
  std::vector<std::string> acceptance_phrases;
  /// Rationale limit in UTF-8 code points; longer rationales get "..." appended.
  std::size_t max_rationale_chars{300};
};

[[nodiscard]] std::vector<std::string> default_scaffolding_patterns();
[[nodiscard]] std::vector<std::string> default_rejection_phrases();
[[nodiscard]] std::vector<std::string> default_acceptance_phrases();
[[nodiscard]] InterpreterConfig default_interpreter_config();

/// Turns free-form model output into a verdict. Total: every input yields a
/// (result, rationale) pair; nothing throws after construction.
class ResponseInterpreter {
 public:
  /// Throws std::invalid_argument if a scaffolding pattern is not a valid regex
  /// or max_rationale_chars is zero.
  explicit ResponseInterpreter(InterpreterConfig config = default_interpreter_config());

  /// Removes tool echoes, preambles and thinking blocks; collapses whitespace
  /// per line and drops empty lines.
  [[nodiscard]] std::string strip_scaffolding(std::string_view text) const;

  [[nodiscard]] std::pair<bool, std::string> extract(std::string_view text) const;

  [[nodiscard]] core::ModelVerdict interpret(std::string_view text, std::string backend_id,
                                             std::string prompt_id) const;

  [[nodiscard]] const InterpreterConfig& config() const noexcept { return config_; }

  /// Strategy chain in evaluation order.
  [[nodiscard]] const std::vector<std::unique_ptr<IResultStrategy>>& strategies() const noexcept {
    return strategies_;
  }

 private:
  [[nodiscard]] bool extract_result(std::string_view cleaned) const;
  [[nodiscard]] std::string extract_rationale(std::string_view cleaned) const;
  [[nodiscard]] std::string clean_rationale(std::string_view raw) const;

  InterpreterConfig config_;
  std::vector<std::regex> scaffolding_;
  std::vector<std::unique_ptr<IResultStrategy>> strategies_;
};

}  // namespace inspecta::interpret
