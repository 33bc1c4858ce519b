#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace kira::schema {

enum class FieldType {
  kString,
  kDate,
  kEmail,
  kUrl,
  kNumber,
  kArray,
  kEnum,
};

inline std::string to_string(const FieldType type) {
  switch (type) {
    case FieldType::kString:
      return "string";
    case FieldType::kDate:
      return "date";
    case FieldType::kEmail:
      return "email";
    case FieldType::kUrl:
      return "url";
    case FieldType::kNumber:
      return "number";
    case FieldType::kArray:
      return "array";
    case FieldType::kEnum:
      return "enum";
  }
  return "unknown";
}

// parse_field_type maps the configuration spelling to a FieldType (exact match).
inline std::optional<FieldType> parse_field_type(const std::string_view text) {
  if (text == "string") {
    return FieldType::kString;
  }
  if (text == "date") {
    return FieldType::kDate;
  }
  if (text == "email") {
    return FieldType::kEmail;
  }
  if (text == "url") {
    return FieldType::kUrl;
  }
  if (text == "number") {
    return FieldType::kNumber;
  }
  if (text == "array") {
    return FieldType::kArray;
  }
  if (text == "enum") {
    return FieldType::kEnum;
  }
  return std::nullopt;
}

// Array elements may only be strings, numbers or enum values.
inline bool is_valid_item_type(const FieldType type) {
  return type == FieldType::kString || type == FieldType::kNumber || type == FieldType::kEnum;
}

}  // namespace kira::schema
