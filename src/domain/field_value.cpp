#include "kira/domain/field_value.h"

#include <charconv>
#include <cmath>
#include <iterator>
#include <limits>
#include <optional>
#include <string_view>
#include <system_error>

namespace kira::domain {

namespace {

constexpr std::string_view kStrTag = "tag:yaml.org,2002:str";

bool is_null_literal(const std::string_view text) {
  return text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL";
}

bool is_digit(const char ch) {
  return ch >= '0' && ch <= '9';
}

std::optional<bool> resolve_bool(const std::string_view text) {
  if (text == "true" || text == "True" || text == "TRUE") {
    return true;
  }
  if (text == "false" || text == "False" || text == "FALSE") {
    return false;
  }
  return std::nullopt;
}

// Parses [-+]?[0-9]+, 0o[0-7]+ or 0x[0-9a-fA-F]+. Values that overflow int64 are
// left to the float resolver.
std::optional<std::int64_t> resolve_integer(const std::string_view text) {
  if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'o')) {
    const int base = text[1] == 'x' ? 16 : 8;
    std::int64_t value = 0;
    const char* first = text.data() + 2;
    const char* last = text.data() + text.size();
    // from_chars would accept "0x-5".
    if (*first == '-' || *first == '+') {
      return std::nullopt;
    }
    const auto [ptr, ec] = std::from_chars(first, last, value, base);
    if (ec != std::errc{} || ptr != last) {
      return std::nullopt;
    }
    return value;
  }

  std::size_t start = 0;
  if (!text.empty() && (text[0] == '-' || text[0] == '+')) {
    start = 1;
  }
  if (start >= text.size()) {
    return std::nullopt;
  }
  for (std::size_t i = start; i < text.size(); ++i) {
    if (!is_digit(text[i])) {
      return std::nullopt;
    }
  }

  // from_chars rejects a leading '+'.
  const char* first = text.data() + (text[0] == '+' ? 1 : 0);
  const char* last = text.data() + text.size();
  std::int64_t value = 0;
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

// Parses [-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)? plus the .inf / .nan forms.
std::optional<double> resolve_float(const std::string_view text) {
  std::string_view rest = text;
  bool negative = false;
  if (!rest.empty() && (rest[0] == '-' || rest[0] == '+')) {
    negative = rest[0] == '-';
    rest.remove_prefix(1);
  }
  if (rest == ".inf" || rest == ".Inf" || rest == ".INF") {
    return negative ? -std::numeric_limits<double>::infinity()
                    : std::numeric_limits<double>::infinity();
  }
  if (text == ".nan" || text == ".NaN" || text == ".NAN") {
    return std::numeric_limits<double>::quiet_NaN();
  }

  std::size_t pos = 0;
  std::size_t int_digits = 0;
  while (pos < rest.size() && is_digit(rest[pos])) {
    ++pos;
    ++int_digits;
  }
  std::size_t frac_digits = 0;
  if (pos < rest.size() && rest[pos] == '.') {
    ++pos;
    while (pos < rest.size() && is_digit(rest[pos])) {
      ++pos;
      ++frac_digits;
    }
  }
  if (int_digits == 0 && frac_digits == 0) {
    return std::nullopt;
  }
  if (pos < rest.size() && (rest[pos] == 'e' || rest[pos] == 'E')) {
    ++pos;
    if (pos < rest.size() && (rest[pos] == '-' || rest[pos] == '+')) {
      ++pos;
    }
    std::size_t exp_digits = 0;
    while (pos < rest.size() && is_digit(rest[pos])) {
      ++pos;
      ++exp_digits;
    }
    if (exp_digits == 0) {
      return std::nullopt;
    }
  }
  if (pos != rest.size()) {
    return std::nullopt;
  }

  double value = 0.0;
  const auto [ptr, ec] = std::from_chars(rest.data(), rest.data() + rest.size(), value);
  if (ptr != rest.data() + rest.size() ||
      (ec != std::errc{} && ec != std::errc::result_out_of_range)) {
    return std::nullopt;
  }
  return negative ? -value : value;
}

std::string mapping_display(const YAML::Node& node) {
  YAML::Emitter out;
  out << YAML::Flow << node;
  return out.good() ? std::string(out.c_str()) : std::string("map[]");
}

}  // namespace

double FieldValue::as_number() const {
  if (kind() == Kind::kInteger) {
    return static_cast<double>(as_integer());
  }
  return as_float();
}

bool FieldValue::is_empty() const {
  switch (kind()) {
    case Kind::kNull:
      return true;
    case Kind::kString:
      return as_string().empty();
    case Kind::kSequence:
      return as_sequence().empty();
    default:
      return false;
  }
}

std::string FieldValue::display_string() const {
  switch (kind()) {
    case Kind::kNull:
      return "<nil>";
    case Kind::kString:
      return as_string();
    case Kind::kInteger:
      return std::to_string(as_integer());
    case Kind::kFloat:
      return format_double(as_float());
    case Kind::kBool:
      return as_bool() ? "true" : "false";
    case Kind::kSequence: {
      std::string out = "[";
      const auto& items = as_sequence();
      for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
          out += " ";
        }
        out += items[i].display_string();
      }
      out += "]";
      return out;
    }
    case Kind::kMapping:
      return mapping_display(as_mapping());
  }
  return {};
}

std::string FieldValue::uniqueness_key() const {
  return kind_name(kind()) + ":" + display_string();
}

std::string kind_name(const FieldValue::Kind kind) {
  switch (kind) {
    case FieldValue::Kind::kNull:
      return "null";
    case FieldValue::Kind::kString:
      return "string";
    case FieldValue::Kind::kInteger:
      return "integer";
    case FieldValue::Kind::kFloat:
      return "float";
    case FieldValue::Kind::kBool:
      return "bool";
    case FieldValue::Kind::kSequence:
      return "sequence";
    case FieldValue::Kind::kMapping:
      return "mapping";
  }
  return "unknown";
}

FieldValue resolve_plain_scalar(const std::string& text) {
  if (is_null_literal(text)) {
    return FieldValue::null();
  }
  if (const auto b = resolve_bool(text)) {
    return FieldValue::boolean(*b);
  }
  if (const auto i = resolve_integer(text)) {
    return FieldValue::integer(*i);
  }
  if (const auto f = resolve_float(text)) {
    return FieldValue::floating(*f);
  }
  return FieldValue::string(text);
}

FieldValue field_value_from_yaml(const YAML::Node& node) {
  if (!node.IsDefined() || node.IsNull()) {
    return FieldValue::null();
  }

  if (node.IsSequence()) {
    FieldValue::Sequence items;
    items.reserve(node.size());
    for (const auto& child : node) {
      items.push_back(field_value_from_yaml(child));
    }
    return FieldValue::sequence(std::move(items));
  }

  if (node.IsMap()) {
    return FieldValue::mapping(YAML::Clone(node));
  }

  // Quoted scalars carry the non-specific "!" tag; plain scalars carry "?".
  const std::string& tag = node.Tag();
  if (tag == "!" || tag == kStrTag) {
    return FieldValue::string(node.Scalar());
  }
  return resolve_plain_scalar(node.Scalar());
}

std::string format_double(const double value) {
  if (std::isnan(value)) {
    return ".nan";
  }
  if (std::isinf(value)) {
    return value > 0 ? ".inf" : "-.inf";
  }
  char buffer[64];  // NOLINT(cppcoreguidelines-avoid-c-arrays)
  const auto [ptr, ec] = std::to_chars(std::begin(buffer), std::end(buffer), value);
  if (ec != std::errc{}) {
    return std::to_string(value);
  }
  return std::string(std::begin(buffer), ptr);
}

}  // namespace kira::domain
