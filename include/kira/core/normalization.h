#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace kira::core {

// Deterministic ASCII-only normalization utilities.
// These functions are locale-independent and produce byte-stable output
// across all platforms and compilers.

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
// Non-ASCII characters are preserved unchanged.
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

// equals_ignore_ascii_case compares two strings with ASCII case folding only.
inline bool equals_ignore_ascii_case(const std::string_view a, const std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    char ca = a[i];
    char cb = b[i];
    if (ca >= 'A' && ca <= 'Z') {
      ca = static_cast<char>(ca + ('a' - 'A'));
    }
    if (cb >= 'A' && cb <= 'Z') {
      cb = static_cast<char>(cb + ('a' - 'A'));
    }
    if (ca != cb) {
      return false;
    }
  }
  return true;
}

inline bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\v' || ch == '\f';
}

// trim removes leading and trailing ASCII whitespace.
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

// join concatenates parts with a separator ("a, b, c").
inline std::string join(const std::vector<std::string>& parts, const std::string_view separator) {
  std::string result;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      result.append(separator);
    }
    result.append(parts[i]);
  }
  return result;
}

// split_lines splits on '\n' only. join(split_lines(s), "\n") == s for every input,
// which is what lets the front-matter codec hand back body bytes unchanged.
inline std::vector<std::string> split_lines(const std::string_view text) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (true) {
    const std::size_t pos = text.find('\n', start);
    if (pos == std::string_view::npos) {
      lines.emplace_back(text.substr(start));
      break;
    }
    lines.emplace_back(text.substr(start, pos - start));
    start = pos + 1;
  }
  return lines;
}

}  // namespace kira::core
