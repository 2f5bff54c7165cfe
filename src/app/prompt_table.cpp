#include <inspecta/app/prompt_table.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace inspecta::app {

namespace {

constexpr const char* kOutputFormat = R"(
## OUTPUT FORMAT (answer in Korean):
결과: true or false
사유: concrete grounds for the decision (do not use the words true/false))";

std::string with_output_format(std::string body) {
  return body + kOutputFormat;
}

}  // namespace

PromptTable::PromptTable(std::vector<PromptVersion> versions) : versions_(std::move(versions)) {
  std::unordered_set<std::string> seen;
  for (const auto& v : versions_) {
    if (v.version.empty() || v.text.empty()) {
      throw std::invalid_argument("PromptTable: prompt version and text must be non-empty");
    }
    if (!seen.insert(v.version).second) {
      throw std::invalid_argument("PromptTable: duplicate prompt version " + v.version);
    }
  }
}

const PromptVersion* PromptTable::find(std::string_view version) const noexcept {
  for (const auto& v : versions_) {
    if (v.version == version) return &v;
  }
  return nullptr;
}

PromptTable default_prompt_table() {
  std::vector<PromptVersion> v;
  v.push_back({"v1.1", "strict border detection",
               with_output_format(R"(Product image inspection expert. Inspect only the background outside the product.

## CRITICAL: EXAMINE IMAGE EDGES CAREFULLY
Look at the outer perimeter of the image: top, bottom, left and right edges.
Is there a coloured line, frame or border running along any of them?

### FALSE (violations)
1. Coloured borders or rectangular frames on the image edges
2. Advertising text: prices, discounts, sale phrases

### TRUE (acceptable)
1. Brand names and logos
2. Clean images with no coloured border around the edges
State explicitly whether a border is present.)"),
               "Stricter border-focused prompt used to re-check ambiguous verdicts"});
  v.push_back({"v1.3", "lenient general policy",
               with_output_format(R"(Product image inspection expert. Inspect only the background outside the product.

## POLICY: ONLY REJECT OBVIOUS DECORATIVE BORDERS
Reject (FALSE) only for clear artificial borders framing the entire image like a
picture frame, or for advertising text (prices, discounts, sale phrases).
Accept (TRUE) brand names and logos, natural store environments, plain photography
backgrounds, product packaging and natural shadows.
If borders are not obvious, choose TRUE.)"),
               "Default first-pass prompt"});
  v.push_back({"v3.2", "general inspection",
               with_output_format(R"(Product image inspection expert. The image has already passed an automatic
border check. Inspect the background outside the product for policy violations:
advertising text (prices, discounts, sale phrases), promotional stickers or
decorative graphics added on top of the photo.
Brand names, official certification marks, packaging text and natural
environments are acceptable.)"),
               "Single model stage after the heuristic gate"});
  return PromptTable(std::move(v));
}

PromptTable load_prompt_table(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    throw std::runtime_error("cannot open prompt file: " + path);
  }
  const nlohmann::json doc = nlohmann::json::parse(f, nullptr, false);
  if (doc.is_discarded() || !doc.is_object() || !doc.contains("prompts") ||
      !doc["prompts"].is_array()) {
    throw std::runtime_error("prompt file is not a {\"prompts\": [...]} document: " + path);
  }

  std::vector<PromptVersion> versions;
  for (const auto& entry : doc["prompts"]) {
    if (!entry.is_object()) {
      throw std::runtime_error("prompt entry is not an object in " + path);
    }
    PromptVersion p;
    p.version = entry.value("version", "");
    p.name = entry.value("name", "");
    p.text = entry.value("text", "");
    p.description = entry.value("description", "");
    versions.push_back(std::move(p));
  }
  try {
    return PromptTable(std::move(versions));
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error(std::string(e.what()) + " in " + path);
  }
}

}  // namespace inspecta::app
