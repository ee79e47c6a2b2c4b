#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

namespace gr4ft::utils {

inline std::string to_lower(std::string_view value) {
  std::string out(value.begin(), value.end());
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return out;
}

inline bool is_blank_char(char ch) { return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n'; }

inline std::string_view trim_view(std::string_view value) {
  size_t first = 0;
  while (first < value.size() && is_blank_char(value[first])) {
    first++;
  }
  size_t last = value.size();
  while (last > first && is_blank_char(value[last - 1])) {
    last--;
  }
  return value.substr(first, last - first);
}

inline std::string trim_copy(std::string_view value) {
  std::string_view trimmed = trim_view(value);
  return std::string(trimmed.begin(), trimmed.end());
}

inline std::string trim_end_copy(std::string_view value) {
  size_t last = value.size();
  while (last > 0 && is_blank_char(value[last - 1])) {
    last--;
  }
  return std::string(value.substr(0, last));
}

inline bool is_blank(std::string_view value) { return trim_view(value).empty(); }

// splits on '\n'; a trailing newline does not produce an empty last line
inline std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      lines.emplace_back(text.substr(start));
      break;
    }
    lines.emplace_back(text.substr(start, end - start));
    start = end + 1;
  }
  return lines;
}

inline std::string leading_whitespace(std::string_view line) {
  size_t n = 0;
  while (n < line.size() && (line[n] == ' ' || line[n] == '\t')) {
    n++;
  }
  return std::string(line.substr(0, n));
}

// fnv-1a, stable across runs and platforms
inline uint64_t fnv1a_64(std::string_view data) {
  uint64_t hash = 0xcbf29ce484222325ULL;
  for (unsigned char ch : data) {
    hash ^= ch;
    hash *= 0x100000001b3ULL;
  }
  return hash;
}

inline std::string to_hex_u64(uint64_t value) {
  char buffer[17];
  std::snprintf(buffer, sizeof(buffer), "%016llx", static_cast<unsigned long long>(value));
  return std::string(buffer);
}

} // namespace gr4ft::utils
