#pragma once
#include <algorithm>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

namespace tc {

// (line, column) of byte_pos in the raw text, both 1-based.
inline std::pair<size_t, size_t> calc_line_col(const std::string &s,
                                               size_t byte_pos) {
  byte_pos = std::min(byte_pos, s.size());
  const auto head = s.begin() + static_cast<std::ptrdiff_t>(byte_pos);
  const size_t line =
      1 + static_cast<size_t>(std::count(s.begin(), head, '\n'));
  const size_t nl =
      byte_pos ? s.rfind('\n', byte_pos - 1) : std::string::npos;
  const size_t col = nl == std::string::npos ? byte_pos + 1 : byte_pos - nl;
  return {line, col};
}

// Returns the line holding byte_pos with a caret under the offending column.
inline std::string context_snippet(const std::string &s, size_t byte_pos,
                                   size_t window = 60) {
  byte_pos = std::min(byte_pos, s.size());
  size_t line_start = s.rfind('\n', byte_pos ? byte_pos - 1 : 0);
  line_start = (line_start == std::string::npos || line_start >= byte_pos)
                   ? 0
                   : line_start + 1;
  size_t start = std::max(line_start, byte_pos > window ? byte_pos - window : 0);
  size_t end = std::min(s.find('\n', byte_pos), s.size());
  end = std::min(end, byte_pos + window);

  std::string snippet = s.substr(start, end - start);
  std::string caret_line(byte_pos - start, ' ');
  caret_line.push_back('^');
  return snippet + "\n" + caret_line;
}

// Human readable report for a parse failure, used by the driver.
inline nlohmann::json describe_parse_error(const std::string &text,
                                           const nlohmann::json::parse_error &e) {
  const size_t byte = e.byte > 0 ? e.byte - 1 : 0; // nlohmann counts from 1
  auto [line, col] = calc_line_col(text, byte);
  return {{"ok", false},
          {"kind", "parse_error"},
          {"what", e.what()},
          {"byte", e.byte},
          {"line", line},
          {"column", col},
          {"context", context_snippet(text, byte)}};
}

} // namespace tc
