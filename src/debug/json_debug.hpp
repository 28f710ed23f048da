#pragma once
#include <algorithm>
#include <nlohmann/json.hpp>
#include <string>

// Where a JSON parse failed, for error bodies the dashboard can show.
struct JsonErrorPosition {
  size_t byte = 0;
  size_t line = 1; // 1-based
  size_t column = 1;
  std::string context; // window of the raw text with a caret line under it
};

inline JsonErrorPosition locate_json_error(const std::string &raw,
                                           size_t byte_pos,
                                           size_t window = 60) {
  JsonErrorPosition pos;
  pos.byte = std::min(byte_pos, raw.size());
  for (size_t i = 0; i < pos.byte; ++i) {
    if (raw[i] == '\n') {
      ++pos.line;
      pos.column = 1;
    } else {
      ++pos.column;
    }
  }

  const size_t start = pos.byte > window ? pos.byte - window : 0;
  const size_t end = std::min(raw.size(), pos.byte + window);
  pos.context = raw.substr(start, end - start) + "\n" +
                std::string(pos.byte - start, ' ') + "^";
  return pos;
}

inline nlohmann::json
parse_error_json(const std::string &raw,
                 const nlohmann::json::parse_error &e) {
  const auto pos = locate_json_error(raw, e.byte);
  return {{"ok", false},       {"kind", "parse_error"},
          {"what", e.what()},  {"byte", pos.byte},
          {"line", pos.line},  {"column", pos.column},
          {"context", pos.context}};
}
