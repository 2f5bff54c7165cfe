#include <inspecta/interpret/extraction_strategy.hpp>
#include "text_utils.hpp"
#include <utility>

namespace inspecta::interpret {

std::optional<bool> MarkerResultStrategy::extract(std::string_view cleaned) const {
  const auto marker = detail::find_result_marker(cleaned);
  if (!marker) return std::nullopt;
  return marker->value;
}

std::optional<bool> SingleKeywordResultStrategy::extract(std::string_view cleaned) const {
  const bool has_true = detail::contains_word(cleaned, "true");
  const bool has_false = detail::contains_word(cleaned, "false");
  if (has_true == has_false) return std::nullopt;
  return has_true;
}

PolarityResultStrategy::PolarityResultStrategy(std::vector<std::string> rejection_phrases,
                                               std::vector<std::string> acceptance_phrases)
    : rejection_(std::move(rejection_phrases)), acceptance_(std::move(acceptance_phrases)) {}

bool PolarityResultStrategy::infer(std::string_view cleaned) const {
  if (detail::contains_any(cleaned, rejection_)) return false;
  if (detail::contains_any(cleaned, acceptance_)) return true;
  return false;
}

std::optional<bool> PolarityResultStrategy::extract(std::string_view cleaned) const {
  return infer(cleaned);
}

bool contains_any_phrase(std::string_view text, const std::vector<std::string>& phrases) {
  return detail::contains_any(text, phrases);
}

}  // namespace inspecta::interpret
