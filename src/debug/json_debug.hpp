#pragma once
#include <algorithm>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

// Returns (line, column) from a byte position in the raw text (1-based).
inline std::pair<size_t, size_t> calc_line_col(const std::string &s,
                                               size_t byte_pos) {
  byte_pos = std::min(byte_pos, s.size());
  size_t line = 1, col = 1;
  for (size_t i = 0; i < byte_pos; ++i) {
    if (s[i] == '\n') {
      ++line;
      col = 1;
    } else {
      ++col;
    }
  }
  return {line, col};
}

// Error body for a request whose JSON failed to parse: where it broke and a
// short excerpt with a caret under the offending byte.
inline nlohmann::json parse_error_json(const std::string &body,
                                       const nlohmann::json::parse_error &e,
                                       size_t window = 40) {
  const size_t byte = std::min<size_t>(e.byte, body.size());
  auto [line, col] = calc_line_col(body, byte);

  const size_t from = byte > window ? byte - window : 0;
  const size_t to = std::min(body.size(), byte + window);
  std::string excerpt = body.substr(from, to - from);
  excerpt += "\n" + std::string(byte - from, ' ') + "^";

  return {{"ok", false},      {"kind", "parse_error"}, {"what", e.what()},
          {"byte", byte},     {"line", line},          {"column", col},
          {"context", excerpt}};
}
