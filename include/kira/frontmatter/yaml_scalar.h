#pragma once

#include <string>
#include <string_view>

namespace kira::frontmatter {

// Characters that force a scalar into double quotes.
inline constexpr std::string_view kYamlSpecialChars = ":#[]{},\"'\\\n\r\t&*!|>%";

// needs_quoting is true for empty strings, strings with leading or trailing
// whitespace, strings containing any of kYamlSpecialChars, and strings that
// start with a YAML indicator that is not in that set ('-', '?', '@', '`').
[[nodiscard]] bool needs_quoting(std::string_view value);

// quote returns a double-quoted scalar, escaping backslash, double quote,
// newline, carriage return and tab.
[[nodiscard]] std::string quote(std::string_view value);

// format_scalar emits `value` plain when that is safe, quoted otherwise.
// The hardcoded fields use this form: their text is read back verbatim, so
// "001" stays plain. Null literals ("null", "~") are quoted so they do not
// read back as an empty field.
[[nodiscard]] std::string format_scalar(std::string_view value);

// format_string_value additionally quotes strings whose plain form would
// resolve to another kind ("123", "true", "null", "1.5"), so a string field
// re-parses as a string.
[[nodiscard]] std::string format_string_value(std::string_view value);

}  // namespace kira::frontmatter
