#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace inspecta::app {

/// One versioned inspection instruction. The text is opaque to the pipeline.
struct PromptVersion {
  std::string version;
  std::string name;
  std::string text;
  std::string description;
};

/// Immutable set of prompt versions, built once and handed to the orchestrator.
class PromptTable {
 public:
  PromptTable() = default;

  /// Throws std::invalid_argument on an empty version/text or a duplicate version.
  explicit PromptTable(std::vector<PromptVersion> versions);

  /// nullptr if the version is not in the table.
  [[nodiscard]] const PromptVersion* find(std::string_view version) const noexcept;

  [[nodiscard]] bool contains(std::string_view version) const noexcept {
    return find(version) != nullptr;
  }

  [[nodiscard]] const std::vector<PromptVersion>& versions() const noexcept { return versions_; }
  [[nodiscard]] std::size_t size() const noexcept { return versions_.size(); }

 private:
  std::vector<PromptVersion> versions_;
};

/// Built-in prompts: v1.1 (strict border check), v1.3 (lenient general policy),
/// v3.2 (general inspection after the heuristic gate).
[[nodiscard]] PromptTable default_prompt_table();

/// Reads {"prompts":[{"version","name","text","description"}...]}.
/// Throws std::runtime_error if the file cannot be read or parsed.
[[nodiscard]] PromptTable load_prompt_table(const std::string& path);

}  // namespace inspecta::app
