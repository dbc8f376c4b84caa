#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace wx_agent::core {

inline std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

inline std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

inline std::vector<std::string> split_whitespace(const std::string& text) {
  std::vector<std::string> words;
  std::string current;
  for (const char c : text) {
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      if (!current.empty()) {
        words.push_back(std::move(current));
        current.clear();
      }
      continue;
    }
    current.push_back(c);
  }
  if (!current.empty()) {
    words.push_back(std::move(current));
  }
  return words;
}

// Trims, collapses inner whitespace and title-cases each space- or
// hyphen-separated word: "  new   york " -> "New York".
inline std::string canonical_city_name(const std::string& raw) {
  std::string out;
  for (const auto& word : split_whitespace(raw)) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    bool word_start = true;
    for (const char c : word) {
      const auto uc = static_cast<unsigned char>(c);
      out.push_back(static_cast<char>(word_start ? std::toupper(uc) : std::tolower(uc)));
      word_start = c == '-';
    }
  }
  return out;
}

}  // namespace wx_agent::core
