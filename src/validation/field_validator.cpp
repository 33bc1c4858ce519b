#include "kira/validation/field_validator.h"

#include "kira/core/normalization.h"

#include <regex>
#include <set>

namespace kira::validation {

namespace {

using domain::FieldValue;
using schema::FieldConfig;
using schema::FieldType;

constexpr std::size_t kMaxUrlLength = 2048;
constexpr std::size_t kMaxBracketedHostLength = 45;

bool is_alpha(const char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

bool is_digit(const char ch) {
  return ch >= '0' && ch <= '9';
}

bool is_hex(const char ch) {
  return is_digit(ch) || (ch >= 'a' && ch <= 'f') || (ch >= 'A' && ch <= 'F');
}

// ────────────────────────────────────────────────────────────────
// URL helpers
// ────────────────────────────────────────────────────────────────

bool has_control_byte(const std::string_view text) {
  for (const char ch : text) {
    const auto byte = static_cast<unsigned char>(ch);
    if (byte < 0x20 || byte == 0x7f) {
      return true;
    }
  }
  return false;
}

bool has_valid_escapes(const std::string_view text) {
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '%') {
      continue;
    }
    if (i + 2 >= text.size() || !is_hex(text[i + 1]) || !is_hex(text[i + 2])) {
      return false;
    }
    i += 2;
  }
  return true;
}

bool is_valid_bracketed_host(const std::string_view url) {
  const auto open = url.find('[');
  const auto close = url.find(']');
  if (open == std::string_view::npos || close == std::string_view::npos || close <= open) {
    return false;
  }
  const std::string_view inner = url.substr(open + 1, close - open - 1);
  if (inner.empty() || inner.size() > kMaxBracketedHostLength) {
    return false;
  }
  for (const char ch : inner) {
    if (!is_hex(ch) && ch != ':' && ch != '.') {
      return false;
    }
  }
  return true;
}

// Empty, or ':' followed only by digits.
bool is_valid_optional_port(const std::string_view port) {
  if (port.empty()) {
    return true;
  }
  if (port.front() != ':') {
    return false;
  }
  for (const char ch : port.substr(1)) {
    if (!is_digit(ch)) {
      return false;
    }
  }
  return true;
}

bool is_valid_userinfo(const std::string_view userinfo) {
  static constexpr std::string_view kAllowed = "-._:~!$&'()*+,;=%@";
  for (const char ch : userinfo) {
    if (!is_alpha(ch) && !is_digit(ch) && kAllowed.find(ch) == std::string_view::npos) {
      return false;
    }
  }
  return has_valid_escapes(userinfo);
}

bool is_valid_host_char(const char ch) {
  static constexpr std::string_view kAllowed = "-._~!$&'()*+,;=:[]<>\"%";
  return is_alpha(ch) || is_digit(ch) || static_cast<unsigned char>(ch) >= 0x80 ||
         kAllowed.find(ch) != std::string_view::npos;
}

bool is_valid_authority(const std::string_view authority) {
  std::string_view host = authority;
  const auto at = authority.rfind('@');
  if (at != std::string_view::npos) {
    if (!is_valid_userinfo(authority.substr(0, at))) {
      return false;
    }
    host = authority.substr(at + 1);
  }

  if (!host.empty() && host.front() == '[') {
    const auto close = host.find(']');
    if (close == std::string_view::npos) {
      return false;
    }
    return is_valid_optional_port(host.substr(close + 1));
  }

  const auto colon = host.rfind(':');
  if (colon != std::string_view::npos && !is_valid_optional_port(host.substr(colon))) {
    return false;
  }
  for (const char ch : host) {
    if (!is_valid_host_char(ch)) {
      return false;
    }
  }
  return has_valid_escapes(host);
}

struct SchemeSplit {
  std::string_view scheme;
  std::string_view rest;
  bool malformed{false};
};

// A scheme is a letter followed by letters, digits, '+', '-' or '.', ended by ':'.
SchemeSplit split_scheme(const std::string_view url) {
  for (std::size_t i = 0; i < url.size(); ++i) {
    const char ch = url[i];
    if (is_alpha(ch)) {
      continue;
    }
    if (is_digit(ch) || ch == '+' || ch == '-' || ch == '.') {
      if (i == 0) {
        return SchemeSplit{{}, url, false};
      }
      continue;
    }
    if (ch == ':') {
      if (i == 0) {
        return SchemeSplit{{}, url, true};
      }
      return SchemeSplit{url.substr(0, i), url.substr(i + 1), false};
    }
    break;
  }
  return SchemeSplit{{}, url, false};
}

bool is_valid_request_uri(const std::string_view url) {
  if (url == "*") {
    return true;
  }
  const SchemeSplit split = split_scheme(url);
  if (split.malformed) {
    return false;
  }

  std::string_view rest = split.rest;
  if (const auto query = rest.find('?'); query != std::string_view::npos) {
    rest = rest.substr(0, query);
  }

  if (rest.empty() || rest.front() != '/') {
    // "mailto:x" style opaque URIs need a scheme; bare relative paths are rejected.
    return !split.scheme.empty();
  }

  if (!split.scheme.empty() && rest.substr(0, 2) == "//") {
    std::string_view authority = rest.substr(2);
    const auto slash = authority.find('/');
    if (slash == std::string_view::npos) {
      rest = {};
    } else {
      rest = authority.substr(slash);
      authority = authority.substr(0, slash);
    }
    if (!is_valid_authority(authority)) {
      return false;
    }
  }

  return has_valid_escapes(rest);
}

// ────────────────────────────────────────────────────────────────
// Checks
// ────────────────────────────────────────────────────────────────

std::optional<std::string> check_type(const FieldValue& value, const FieldConfig& config) {
  const std::string got = kind_name(value.kind());
  switch (config.type) {
    case FieldType::kString:
      if (!value.is_string()) {
        return "expected string, got " + got;
      }
      return std::nullopt;
    case FieldType::kDate:
      if (!value.is_string()) {
        return "expected date string, got " + got;
      }
      return std::nullopt;
    case FieldType::kEmail:
      if (!value.is_string()) {
        return "expected email string, got " + got;
      }
      if (!is_valid_email(value.as_string())) {
        return "invalid email format: " + value.as_string();
      }
      return std::nullopt;
    case FieldType::kUrl:
      if (!value.is_string()) {
        return "expected URL string, got " + got;
      }
      if (!is_valid_url(value.as_string())) {
        return "invalid URL format: " + value.as_string();
      }
      return std::nullopt;
    case FieldType::kNumber:
      if (!value.is_number()) {
        return "expected number, got " + got;
      }
      return std::nullopt;
    case FieldType::kArray:
      if (!value.is_sequence()) {
        return "expected array, got " + got;
      }
      return std::nullopt;
    case FieldType::kEnum:
      if (!value.is_string()) {
        return "expected enum string, got " + got;
      }
      return std::nullopt;
  }
  return "unknown field type: " + to_string(config.type);
}

std::optional<std::string> check_format(const FieldValue& value, const FieldConfig& config) {
  if (config.type == FieldType::kString && config.pattern.has_value()) {
    if (!std::regex_search(value.as_string(), *config.pattern)) {
      return "value '" + value.as_string() + "' does not match format pattern: " + config.format;
    }
  }
  if (config.type == FieldType::kDate) {
    if (!config.date_format.parse(value.as_string()).has_value()) {
      return "date '" + value.as_string() + "' does not match format: " +
             config.date_format.pattern();
    }
  }
  return std::nullopt;
}

std::optional<std::string> check_enum(const FieldValue& value, const FieldConfig& config) {
  if (config.type != FieldType::kEnum || is_allowed_value(value.as_string(), config)) {
    return std::nullopt;
  }
  return "value '" + value.as_string() +
         "' is not in allowed values: " + core::join(config.allowed_values, ", ");
}

std::optional<std::string> check_length(const std::string_view what, const std::size_t length,
                                        const FieldConfig& config) {
  const auto size = static_cast<long long>(length);
  if (config.min_length && size < *config.min_length) {
    return std::string(what) + " length " + std::to_string(size) + " is less than min_length " +
           std::to_string(*config.min_length);
  }
  if (config.max_length && size > *config.max_length) {
    return std::string(what) + " length " + std::to_string(size) +
           " is greater than max_length " + std::to_string(*config.max_length);
  }
  return std::nullopt;
}

std::optional<std::string> check_number_range(const FieldValue& value, const FieldConfig& config) {
  const double number = value.as_number();
  if (config.min_value && number < *config.min_value) {
    return "value " + domain::format_double(number) + " is less than min " +
           domain::format_double(*config.min_value);
  }
  if (config.max_value && number > *config.max_value) {
    return "value " + domain::format_double(number) + " is greater than max " +
           domain::format_double(*config.max_value);
  }
  return std::nullopt;
}

std::optional<std::string> check_date_range(const FieldValue& value, const FieldConfig& config,
                                            const core::IClock& clock) {
  const auto parsed = config.date_format.parse(value.as_string());
  if (!parsed.has_value()) {
    return std::nullopt;  // reported by the format check
  }
  const core::CalendarDate date = parsed->date;
  const core::CalendarDate today = clock.today();
  const schema::DateFormat iso;

  if (!config.min_date.empty()) {
    core::CalendarDate min_date;
    if (config.min_date == schema::kRelativeToday) {
      min_date = today;
    } else if (config.min_date == schema::kRelativeFuture) {
      min_date = core::add_days(today, 1);
    } else if (const auto absolute = iso.parse(config.min_date)) {
      min_date = absolute->date;
    } else {
      return "invalid min_date format: " + config.min_date;
    }
    if (date < min_date) {
      return "date " + core::to_iso_date(date) + " is before min_date " + config.min_date;
    }
  }

  if (!config.max_date.empty() && config.max_date != schema::kRelativeFuture) {
    core::CalendarDate max_date;
    if (config.max_date == schema::kRelativeToday) {
      max_date = today;
    } else if (const auto absolute = iso.parse(config.max_date)) {
      max_date = absolute->date;
    } else {
      return "invalid max_date format: " + config.max_date;
    }
    if (date > max_date) {
      return "date " + core::to_iso_date(date) + " is after max_date " + config.max_date;
    }
  }
  return std::nullopt;
}

std::optional<std::string> check_array_item(const FieldValue& item, const FieldConfig& config) {
  const std::string got = kind_name(item.kind());
  switch (*config.item_type) {
    case FieldType::kString:
      if (!item.is_string()) {
        return "expected string item, got " + got;
      }
      return std::nullopt;
    case FieldType::kNumber:
      if (!item.is_number()) {
        return "expected number item, got " + got;
      }
      return std::nullopt;
    case FieldType::kEnum:
      if (!item.is_string()) {
        return "expected enum string item, got " + got;
      }
      if (!is_allowed_value(item.as_string(), config)) {
        return "value '" + item.as_string() +
               "' is not in allowed values: " + core::join(config.allowed_values, ", ");
      }
      return std::nullopt;
    default:
      return std::nullopt;
  }
}

std::optional<std::string> check_array_range(const FieldValue& value, const FieldConfig& config) {
  const auto& items = value.as_sequence();
  if (auto problem = check_length("array", items.size(), config)) {
    return problem;
  }

  if (config.item_type.has_value()) {
    for (std::size_t i = 0; i < items.size(); ++i) {
      if (const auto problem = check_array_item(items[i], config)) {
        return "array item at index " + std::to_string(i) + ": " + *problem;
      }
    }
  }

  if (config.unique) {
    std::set<std::string> seen;
    for (const auto& item : items) {
      if (!seen.insert(item.uniqueness_key()).second) {
        return "array contains duplicate value: " + item.display_string();
      }
    }
  }
  return std::nullopt;
}

std::optional<std::string> check_url_scheme(const FieldValue& value, const FieldConfig& config) {
  if (config.schemes.empty()) {
    return std::nullopt;
  }
  const std::string scheme = url_scheme(value.as_string());
  for (const auto& allowed : config.schemes) {
    if (scheme == allowed) {
      return std::nullopt;
    }
  }
  return "URL scheme '" + scheme +
         "' is not allowed. Allowed schemes: " + core::join(config.schemes, ", ");
}

std::optional<std::string> check_range(const FieldValue& value, const FieldConfig& config,
                                       const core::IClock& clock) {
  switch (config.type) {
    case FieldType::kString:
      return check_length("string", value.as_string().size(), config);
    case FieldType::kNumber:
      return check_number_range(value, config);
    case FieldType::kDate:
      return check_date_range(value, config, clock);
    case FieldType::kArray:
      return check_array_range(value, config);
    case FieldType::kUrl:
      return check_url_scheme(value, config);
    default:
      return std::nullopt;
  }
}

}  // namespace

bool is_valid_email(const std::string_view email) {
  static const std::regex kEmailPattern(R"(^[a-zA-Z0-9._%+\-]+@[a-zA-Z0-9.\-]+\.[a-zA-Z]{2,}$)");
  return std::regex_match(email.begin(), email.end(), kEmailPattern);
}

bool is_valid_url(const std::string_view url) {
  if (url.empty() || url.size() > kMaxUrlLength) {
    return false;
  }
  if (has_control_byte(url)) {
    return false;
  }
  if (url.find('[') != std::string_view::npos && url.find(']') != std::string_view::npos &&
      !is_valid_bracketed_host(url)) {
    return false;
  }
  return is_valid_request_uri(url);
}

std::string url_scheme(const std::string_view url) {
  return core::normalize_ascii_lower(split_scheme(url).scheme);
}

bool is_allowed_value(const std::string_view value, const FieldConfig& config) {
  const bool case_sensitive = config.is_case_sensitive();
  for (const auto& allowed : config.allowed_values) {
    if (case_sensitive ? value == allowed : core::equals_ignore_ascii_case(value, allowed)) {
      return true;
    }
  }
  return false;
}

std::optional<std::string> validate_field_value(const FieldValue& value, const FieldConfig& config,
                                                const core::IClock& clock) {
  if (auto problem = check_type(value, config)) {
    return problem;
  }
  if (auto problem = check_format(value, config)) {
    return problem;
  }
  if (auto problem = check_enum(value, config)) {
    return problem;
  }
  return check_range(value, config, clock);
}

}  // namespace kira::validation
