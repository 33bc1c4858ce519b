#include "kira/frontmatter/yaml_scalar.h"

#include "kira/core/normalization.h"
#include "kira/domain/field_value.h"

namespace kira::frontmatter {

bool needs_quoting(const std::string_view value) {
  if (value.empty()) {
    return true;
  }
  if (core::is_ascii_space(value.front()) || core::is_ascii_space(value.back())) {
    return true;
  }
  if (value.find_first_of(kYamlSpecialChars) != std::string_view::npos) {
    return true;
  }
  const char first = value.front();
  return first == '-' || first == '?' || first == '@' || first == '`';
}

std::string quote(const std::string_view value) {
  std::string out;
  out.reserve(value.size() + 2);
  out.push_back('"');
  for (const char ch : value) {
    switch (ch) {
      case '\\':
        out += "\\\\";
        break;
      case '"':
        out += "\\\"";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out.push_back(ch);
        break;
    }
  }
  out.push_back('"');
  return out;
}

std::string format_scalar(const std::string_view value) {
  if (needs_quoting(value) || domain::resolve_plain_scalar(std::string(value)).is_null()) {
    return quote(value);
  }
  return std::string(value);
}

std::string format_string_value(const std::string_view value) {
  if (needs_quoting(value)) {
    return quote(value);
  }
  if (!domain::resolve_plain_scalar(std::string(value)).is_string()) {
    return quote(value);
  }
  return std::string(value);
}

}  // namespace kira::frontmatter
