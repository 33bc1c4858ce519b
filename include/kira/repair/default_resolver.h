#pragma once

#include "kira/core/clock.h"
#include "kira/core/result.h"
#include "kira/domain/field_value.h"
#include "kira/domain/work_item.h"
#include "kira/schema/schema.h"

#include <string>
#include <vector>

namespace kira::repair {

// Literal default that resolves to the current date for date fields.
inline constexpr std::string_view kTodayDefault = "today";

// resolve_default converts config.default_value into a value of the field's
// type. Requires config.default_value to be set.
//
//   string  any scalar, rendered as text
//   date    "today" (formatted with the field's pattern) or a date in that pattern
//   email   "" (placeholder) or a valid address
//   url     "" (placeholder) or a valid URL
//   number  a number, or a string that parses as one
//   array   a sequence, or a single value wrapped in one
//   enum    a string in allowed_values (case-insensitive when configured)
//
// An unusable default is a kConfiguration error.
[[nodiscard]] core::Result<domain::FieldValue, core::Error> resolve_default(
    const schema::FieldConfig& config, const core::IClock& clock);

// apply_field_defaults fills every configured, non-hardcoded field that is
// absent or empty and has a default. Returns the names of the fields it set,
// in schema order. Non-empty values are never touched.
[[nodiscard]] core::Result<std::vector<std::string>, core::Error> apply_field_defaults(
    domain::WorkItem& item, const schema::Schema& schema, const core::IClock& clock);

// verify_defaults resolves every configured default once so a broken default
// is reported when the schema is loaded, before any file is touched.
[[nodiscard]] core::Result<bool, core::Error> verify_defaults(const schema::Schema& schema,
                                                              const core::IClock& clock);

}  // namespace kira::repair
