#pragma once

#include "kira/core/clock.h"
#include "kira/domain/field_value.h"
#include "kira/schema/field_config.h"

#include <optional>
#include <string>
#include <string_view>

namespace kira::validation {

// local@domain.tld with a deliberately small character set.
[[nodiscard]] bool is_valid_email(std::string_view email);

// Request-URI well-formedness: 1..2048 bytes without control bytes, either an
// absolute path or "scheme:" followed by an opaque part or //authority[/path].
// Bracketed IPv6 hosts must be at most 45 characters of hex digits, ':' and '.'.
[[nodiscard]] bool is_valid_url(std::string_view url);

// Lower-cased scheme of a URL, empty when it has none.
[[nodiscard]] std::string url_scheme(std::string_view url);

// validate_field_value checks one value against one schema entry.
// Checks run in order (type, format, enum membership, range) and the first
// failure is returned as a message; nullopt means the value is valid.
// Relative date bounds resolve against clock.today().
[[nodiscard]] std::optional<std::string> validate_field_value(const domain::FieldValue& value,
                                                              const schema::FieldConfig& config,
                                                              const core::IClock& clock);

// Enum membership honouring config.is_case_sensitive().
[[nodiscard]] bool is_allowed_value(std::string_view value, const schema::FieldConfig& config);

}  // namespace kira::validation
