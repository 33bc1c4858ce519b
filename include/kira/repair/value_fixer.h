#pragma once

#include "kira/domain/field_value.h"
#include "kira/schema/field_config.h"

#include <optional>
#include <string>
#include <string_view>

namespace kira::repair {

// try_fix_field_value attempts a type-specific repair of an existing value. It
// does not require the value to be invalid; nullopt means "leave it alone".
//
//   date   a value the field format rejects but a common encoding accepts is
//          reformatted with the field's pattern
//   enum   surrounding whitespace is trimmed and, for case-insensitive enums,
//          the value is replaced by the canonical spelling from allowed_values
//   email  whitespace is trimmed and the address lower-cased
//
// A repaired value is returned only when it differs from the input.
[[nodiscard]] std::optional<domain::FieldValue> try_fix_field_value(
    const domain::FieldValue& value, const schema::FieldConfig& config);

// Canonical YYYY-MM-DD form of a hand-written date, or nullopt when no known
// encoding matches. Used for the hardcoded `created` field.
[[nodiscard]] std::optional<std::string> try_fix_date_string(std::string_view text);

}  // namespace kira::repair
