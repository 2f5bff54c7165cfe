#include "text_utils.hpp"

#include <array>

namespace inspecta::interpret::detail {

namespace {

constexpr std::array<std::string_view, 2> kResultLabels = {"결과", "result"};
constexpr std::array<std::string_view, 2> kReasonLabels = {"사유", "reason"};
constexpr std::string_view kFullWidthColon = "\xEF\xBC\x9A";

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

bool is_inline_space(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

bool is_continuation(char c) {
  return (static_cast<unsigned char>(c) & 0xC0u) == 0x80u;
}

char lower(char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

bool starts_with_icase(std::string_view s, std::size_t pos, std::string_view lowered) {
  if (s.size() - pos < lowered.size()) return false;
  for (std::size_t i = 0; i < lowered.size(); ++i) {
    if (lower(s[pos + i]) != lowered[i]) return false;
  }
  return true;
}

std::size_t next_code_point(std::string_view s, std::size_t i) {
  const auto lead = static_cast<unsigned char>(s[i]);
  std::size_t extra = 0;
  if (lead >= 0xF0u && lead <= 0xF7u) {
    extra = 3;
  } else if (lead >= 0xE0u) {
    extra = lead <= 0xEFu ? 2 : 0;
  } else if (lead >= 0xC0u) {
    extra = 1;
  }
  ++i;
  while (extra > 0 && i < s.size() && is_continuation(s[i])) {
    ++i;
    --extra;
  }
  return i;
}

bool word_at(std::string_view s, std::size_t pos, std::string_view lowered_word) {
  if (!starts_with_icase(s, pos, lowered_word)) return false;
  if (pos > 0 && is_word_byte(s[pos - 1])) return false;
  const auto after = pos + lowered_word.size();
  return after >= s.size() || !is_word_byte(s[after]);
}

struct Label {
  std::size_t begin{0};
  std::size_t value{0};
};

// Matches label, optional '*', inline spaces, ':' or '：', then inline
// spaces and '*' before the value.
std::optional<std::size_t> value_after_label(std::string_view s, std::size_t i) {
  while (i < s.size() && s[i] == '*') ++i;
  while (i < s.size() && is_inline_space(s[i])) ++i;
  if (i < s.size() && s[i] == ':') {
    ++i;
  } else if (s.substr(i, kFullWidthColon.size()) == kFullWidthColon) {
    i += kFullWidthColon.size();
  } else {
    return std::nullopt;
  }
  while (i < s.size() && (is_inline_space(s[i]) || s[i] == '*')) ++i;
  return i;
}

template <std::size_t N>
std::optional<Label> find_label(std::string_view s,
                                const std::array<std::string_view, N>& labels,
                                std::size_t from) {
  while (from < s.size()) {
    std::size_t best = std::string_view::npos;
    std::size_t best_len = 0;
    for (const auto label : labels) {
      const auto p = find_icase(s, label, from);
      if (p < best) {
        best = p;
        best_len = label.size();
      }
    }
    if (best == std::string_view::npos) return std::nullopt;
    if (auto value = value_after_label(s, best + best_len)) {
      return Label{best, *value};
    }
    from = best + 1;
  }
  return std::nullopt;
}

}  // namespace

std::string to_lower_ascii(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = lower(c);
  return out;
}

std::string_view trim(std::string_view s) {
  std::size_t start = 0;
  while (start < s.size() && is_space(s[start])) ++start;
  std::size_t end = s.size();
  while (end > start && is_space(s[end - 1])) --end;
  return s.substr(start, end - start);
}

std::vector<std::string_view> split_lines(std::string_view s) {
  std::vector<std::string_view> lines;
  std::size_t pos = 0;
  while (pos <= s.size()) {
    const auto nl = s.find('\n', pos);
    if (nl == std::string_view::npos) {
      lines.push_back(s.substr(pos));
      break;
    }
    lines.push_back(s.substr(pos, nl - pos));
    pos = nl + 1;
  }
  return lines;
}

std::size_t utf8_length(std::string_view s) {
  std::size_t n = 0;
  for (std::size_t i = 0; i < s.size(); i = next_code_point(s, i)) ++n;
  return n;
}

std::string utf8_prefix(std::string_view s, std::size_t max_chars) {
  std::size_t i = 0;
  for (std::size_t chars = 0; i < s.size() && chars < max_chars; ++chars) {
    i = next_code_point(s, i);
  }
  return std::string(s.substr(0, i));
}

bool contains_any(std::string_view text, const std::vector<std::string>& phrases) {
  const std::string lowered = to_lower_ascii(text);
  for (const auto& p : phrases) {
    if (p.empty()) continue;
    if (lowered.find(to_lower_ascii(p)) != std::string::npos) return true;
  }
  return false;
}

std::size_t find_icase(std::string_view s, std::string_view lowered_needle, std::size_t from) {
  if (lowered_needle.empty()) return from <= s.size() ? from : std::string_view::npos;
  const char first = lowered_needle.front();
  const char first_upper = (first >= 'a' && first <= 'z')
                               ? static_cast<char>(first - 'a' + 'A')
                               : first;
  for (std::size_t i = from; i < s.size(); ++i) {
    if (s[i] != first && s[i] != first_upper) continue;
    if (starts_with_icase(s, i, lowered_needle)) return i;
  }
  return std::string_view::npos;
}

bool is_word_byte(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
         c == '_';
}

bool contains_word(std::string_view text, std::string_view lowered_word) {
  for (auto p = find_icase(text, lowered_word); p != std::string_view::npos;
       p = find_icase(text, lowered_word, p + 1)) {
    if (word_at(text, p, lowered_word)) return true;
  }
  return false;
}

std::string erase_bool_words(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    if (word_at(text, i, "true")) {
      i += 4;
    } else if (word_at(text, i, "false")) {
      i += 5;
    } else {
      out.push_back(text[i]);
      ++i;
    }
  }
  return out;
}

std::optional<ResultMarker> find_result_marker(std::string_view text, std::size_t from) {
  while (auto label = find_label(text, kResultLabels, from)) {
    if (starts_with_icase(text, label->value, "true")) {
      return ResultMarker{label->begin, label->value + 4, true};
    }
    if (starts_with_icase(text, label->value, "false")) {
      return ResultMarker{label->begin, label->value + 5, false};
    }
    from = label->begin + 1;
  }
  return std::nullopt;
}

std::string erase_result_markers(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  std::size_t pos = 0;
  while (auto marker = find_result_marker(text, pos)) {
    out.append(text.substr(pos, marker->begin - pos));
    pos = marker->end;
  }
  out.append(text.substr(pos));
  return out;
}

std::optional<std::string_view> find_reason_value(std::string_view text) {
  const auto label = find_label(text, kReasonLabels, 0);
  if (!label) return std::nullopt;
  const auto nl = text.find('\n', label->value);
  const auto end = nl == std::string_view::npos ? text.size() : nl;
  if (end == label->value) return std::nullopt;
  return text.substr(label->value, end - label->value);
}

std::string erase_thinking_blocks(std::string_view text) {
  constexpr std::string_view kOpen = "<thinking>";
  constexpr std::string_view kClose = "</thinking>";
  std::string out;
  out.reserve(text.size());
  std::size_t pos = 0;
  while (pos < text.size()) {
    const auto open = find_icase(text, kOpen, pos);
    if (open == std::string_view::npos) break;
    const auto close = find_icase(text, kClose, open + kOpen.size());
    if (close == std::string_view::npos) break;
    out.append(text.substr(pos, open - pos));
    pos = close + kClose.size();
  }
  if (pos < text.size()) out.append(text.substr(pos));
  return out;
}

std::string_view cut_tool_echo(std::string_view line) {
  for (auto p = find_icase(line, "tool #"); p != std::string_view::npos;
       p = find_icase(line, "tool #", p + 1)) {
    std::size_t i = p + 6;
    const std::size_t digits = i;
    while (i < line.size() && line[i] >= '0' && line[i] <= '9') ++i;
    if (i > digits && i < line.size() && line[i] == ':') return line.substr(0, p);
  }
  return line;
}

}  // namespace inspecta::interpret::detail
