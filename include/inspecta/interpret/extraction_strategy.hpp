#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace inspecta::interpret {

/// One tier of verdict extraction over scaffolding-free text.
/// nullopt means "no opinion, fall through to the next tier".
class IResultStrategy {
 public:
  virtual ~IResultStrategy() = default;

  [[nodiscard]] virtual std::string_view name() const noexcept = 0;

  [[nodiscard]] virtual std::optional<bool> extract(std::string_view cleaned) const = 0;
};

/// Explicit "결과: true|false" / "result: true|false" marker, case-insensitive.
class MarkerResultStrategy : public IResultStrategy {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "marker"; }
  [[nodiscard]] std::optional<bool> extract(std::string_view cleaned) const override;
};

/// Exactly one of the words "true" / "false" anywhere in the text.
class SingleKeywordResultStrategy : public IResultStrategy {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "single_keyword"; }
  [[nodiscard]] std::optional<bool> extract(std::string_view cleaned) const override;
};

/// Domain vocabulary: any rejection phrase -> false, else any acceptance
/// phrase -> true, else false. Always yields a value.
class PolarityResultStrategy : public IResultStrategy {
 public:
  PolarityResultStrategy(std::vector<std::string> rejection_phrases,
                         std::vector<std::string> acceptance_phrases);

  [[nodiscard]] std::string_view name() const noexcept override { return "polarity"; }
  [[nodiscard]] std::optional<bool> extract(std::string_view cleaned) const override;

  /// Same as extract() without the optional wrapper.
  [[nodiscard]] bool infer(std::string_view cleaned) const;

 private:
  std::vector<std::string> rejection_;
  std::vector<std::string> acceptance_;
};

/// True if any phrase occurs in text, comparing ASCII letters case-insensitively.
[[nodiscard]] bool contains_any_phrase(std::string_view text,
                                       const std::vector<std::string>& phrases);

}  // namespace inspecta::interpret
