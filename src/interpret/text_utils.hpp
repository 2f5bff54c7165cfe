#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace inspecta::interpret::detail {

/// Lower-cases ASCII letters only; multi-byte UTF-8 sequences pass through.
std::string to_lower_ascii(std::string_view s);

std::string_view trim(std::string_view s);

std::vector<std::string_view> split_lines(std::string_view s);

/// Number of UTF-8 code points. A lead byte absorbs at most the continuation
/// bytes its length allows; stray continuation bytes count one each.
std::size_t utf8_length(std::string_view s);

/// First max_chars code points of s, never splitting a multi-byte sequence.
std::string utf8_prefix(std::string_view s, std::size_t max_chars);

/// True if any phrase (compared ASCII-case-insensitively) occurs in text.
bool contains_any(std::string_view text, const std::vector<std::string>& phrases);

/// Position of lowered_needle in s comparing ASCII letters case-insensitively,
/// or npos. lowered_needle must already be lower case.
std::size_t find_icase(std::string_view s, std::string_view lowered_needle,
                       std::size_t from = 0);

/// Word test for \b-style boundaries: ASCII letters, digits and '_'.
bool is_word_byte(char c);

/// True if lowered_word occurs in text with a word boundary on both sides.
bool contains_word(std::string_view text, std::string_view lowered_word);

/// text with every standalone "true" / "false" (any case) removed.
std::string erase_bool_words(std::string_view text);

/// "결과: true" / "result: false" span. Labels may be wrapped in '*' and the
/// colon may be ASCII or full-width; the marker never crosses a newline.
struct ResultMarker {
  std::size_t begin{0};
  std::size_t end{0};
  bool value{false};
};

std::optional<ResultMarker> find_result_marker(std::string_view text, std::size_t from = 0);

/// text with every result marker span removed.
std::string erase_result_markers(std::string_view text);

/// Rest of the line after the first "사유:" / "reason:" label, untrimmed.
std::optional<std::string_view> find_reason_value(std::string_view text);

/// Drops every <thinking>...</thinking> block. An unterminated block is kept.
std::string erase_thinking_blocks(std::string_view text);

/// line cut at the first "Tool #<digits>:" echo, or line unchanged.
std::string_view cut_tool_echo(std::string_view line);

}  // namespace inspecta::interpret::detail
