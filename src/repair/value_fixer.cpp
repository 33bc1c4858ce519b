#include "kira/repair/value_fixer.h"

#include "kira/core/normalization.h"
#include "kira/schema/date_format.h"
#include "kira/validation/field_validator.h"

namespace kira::repair {

namespace {

using domain::FieldValue;

std::optional<FieldValue> fix_date(const FieldValue& value, const schema::FieldConfig& config) {
  if (!value.is_string() || config.date_format.parse(value.as_string()).has_value()) {
    return std::nullopt;
  }
  const auto date = schema::parse_alternate_date(value.as_string());
  if (!date.has_value()) {
    return std::nullopt;
  }
  std::string fixed = config.date_format.format(*date);
  if (fixed == value.as_string()) {
    return std::nullopt;
  }
  return FieldValue::string(std::move(fixed));
}

std::optional<FieldValue> fix_enum(const FieldValue& value, const schema::FieldConfig& config) {
  if (!value.is_string()) {
    return std::nullopt;
  }
  const std::string& original = value.as_string();
  const std::string trimmed = core::trim(original);

  for (const auto& allowed : config.allowed_values) {
    if (trimmed == allowed) {
      if (trimmed == original) {
        return std::nullopt;
      }
      return FieldValue::string(allowed);
    }
  }
  if (config.is_case_sensitive()) {
    return std::nullopt;
  }
  for (const auto& allowed : config.allowed_values) {
    if (core::equals_ignore_ascii_case(trimmed, allowed)) {
      return FieldValue::string(allowed);
    }
  }
  return std::nullopt;
}

std::optional<FieldValue> fix_email(const FieldValue& value) {
  if (!value.is_string()) {
    return std::nullopt;
  }
  const std::string& original = value.as_string();
  std::string fixed = core::trim(original);
  const std::string lower = core::normalize_ascii_lower(fixed);
  if (lower != fixed && validation::is_valid_email(lower)) {
    fixed = lower;
  }
  if (fixed == original) {
    return std::nullopt;
  }
  return FieldValue::string(std::move(fixed));
}

}  // namespace

std::optional<FieldValue> try_fix_field_value(const FieldValue& value,
                                              const schema::FieldConfig& config) {
  switch (config.type) {
    case schema::FieldType::kDate:
      return fix_date(value, config);
    case schema::FieldType::kEnum:
      return fix_enum(value, config);
    case schema::FieldType::kEmail:
      return fix_email(value);
    default:
      return std::nullopt;
  }
}

std::optional<std::string> try_fix_date_string(const std::string_view text) {
  const auto date = schema::parse_alternate_date(text);
  if (!date.has_value()) {
    return std::nullopt;
  }
  return schema::DateFormat{}.format(*date);
}

}  // namespace kira::repair
