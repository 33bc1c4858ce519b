#pragma once

#include "kira/domain/field_value.h"
#include "kira/schema/date_format.h"
#include "kira/schema/field_type.h"

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace kira::schema {

// Relative tokens accepted by min_date / max_date.
inline constexpr std::string_view kRelativeToday = "today";
inline constexpr std::string_view kRelativeFuture = "future";

// FieldConfig is one entry of the `fields` section of kira.yml.
// Constraint members are only meaningful for the types noted beside them; the
// loader compiles `format` into `pattern` (string) or `date_format` (date).
struct FieldConfig {
  FieldType type{FieldType::kString};
  bool required{false};
  std::optional<domain::FieldValue> default_value;

  std::string format;                 // regex (string) or date pattern (date)
  std::optional<std::regex> pattern;  // compiled string format
  DateFormat date_format;             // compiled date format

  std::optional<int> min_length;  // string, array
  std::optional<int> max_length;  // string, array
  std::optional<double> min_value;
  std::optional<double> max_value;
  std::string min_date;  // absolute date, "today" or "future"
  std::string max_date;

  std::vector<std::string> allowed_values;  // enum, array of enum
  std::optional<FieldType> item_type;       // array
  bool unique{false};                       // array
  std::vector<std::string> schemes;         // url, lower-cased by the loader
  std::optional<bool> case_sensitive;       // enum

  // Informational only.
  std::string description;
  std::string display_name;
  std::string category;
  bool deprecated{false};

  [[nodiscard]] bool is_case_sensitive() const { return case_sensitive.value_or(true); }
};

}  // namespace kira::schema
