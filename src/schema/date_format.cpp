#include "kira/schema/date_format.h"

#include "kira/core/normalization.h"

#include <array>
#include <iomanip>
#include <sstream>

namespace kira::schema {

namespace {

constexpr std::array<std::string_view, 12> kMonthNames = {
    "January", "February", "March",     "April",   "May",      "June",
    "July",    "August",   "September", "October", "November", "December",
};

bool is_digit(const char ch) {
  return ch >= '0' && ch <= '9';
}

// Reads exactly `width` digits at `pos`; advances pos on success.
std::optional<int> read_fixed_digits(const std::string_view text, std::size_t& pos,
                                     const std::size_t width) {
  if (pos + width > text.size()) {
    return std::nullopt;
  }
  int value = 0;
  for (std::size_t i = 0; i < width; ++i) {
    const char ch = text[pos + i];
    if (!is_digit(ch)) {
      return std::nullopt;
    }
    value = value * 10 + (ch - '0');
  }
  pos += width;
  return value;
}

// Matches a month name (full or three-letter) case-insensitively; returns 1..12.
std::optional<int> read_month_name(const std::string_view text, std::size_t& pos,
                                   const bool abbreviated) {
  for (std::size_t i = 0; i < kMonthNames.size(); ++i) {
    const std::string_view name = abbreviated ? kMonthNames[i].substr(0, 3) : kMonthNames[i];
    if (pos + name.size() <= text.size() &&
        core::equals_ignore_ascii_case(text.substr(pos, name.size()), name)) {
      pos += name.size();
      return static_cast<int>(i) + 1;
    }
  }
  return std::nullopt;
}

}  // namespace

DateFormat::DateFormat()
    : pattern_(kDefaultDatePattern), tokens_(tokenize(kDefaultDatePattern).value()) {}

core::Result<DateFormat, core::Error> DateFormat::compile(const std::string_view pattern) {
  const std::string_view source = pattern.empty() ? kDefaultDatePattern : pattern;
  auto tokens = tokenize(source);
  if (!tokens.has_value()) {
    return core::Result<DateFormat, core::Error>::err(tokens.error());
  }
  return core::Result<DateFormat, core::Error>::ok(
      DateFormat(std::string(source), std::move(tokens.value())));
}

core::Result<std::vector<DateFormat::Token>, core::Error> DateFormat::tokenize(
    const std::string_view source) {
  using R = core::Result<std::vector<Token>, core::Error>;

  std::vector<Token> tokens;
  std::string literal;
  const auto flush_literal = [&]() {
    if (!literal.empty()) {
      tokens.push_back(Token{TokenKind::kLiteral, literal});
      literal.clear();
    }
  };

  for (std::size_t i = 0; i < source.size(); ++i) {
    const char ch = source[i];
    if (ch != '%') {
      literal.push_back(ch);
      continue;
    }
    if (i + 1 >= source.size()) {
      return R::err(core::configuration_error("dangling '%' at end of date format '" +
                                              std::string(source) + "'"));
    }
    const char directive = source[++i];
    if (directive == '%') {
      literal.push_back('%');
      continue;
    }

    TokenKind kind = TokenKind::kLiteral;
    switch (directive) {
      case 'Y':
        kind = TokenKind::kYear4;
        break;
      case 'y':
        kind = TokenKind::kYear2;
        break;
      case 'm':
        kind = TokenKind::kMonth2;
        break;
      case 'b':
        kind = TokenKind::kMonthAbbrev;
        break;
      case 'B':
        kind = TokenKind::kMonthName;
        break;
      case 'd':
        kind = TokenKind::kDay2;
        break;
      case 'H':
        kind = TokenKind::kHour2;
        break;
      case 'M':
        kind = TokenKind::kMinute2;
        break;
      case 'S':
        kind = TokenKind::kSecond2;
        break;
      default:
        return R::err(core::configuration_error("unknown directive '%" + std::string(1, directive) +
                                                "' in date format '" + std::string(source) + "'"));
    }
    flush_literal();
    tokens.push_back(Token{kind, {}});
  }
  flush_literal();
  return R::ok(std::move(tokens));
}

std::optional<DateTime> DateFormat::parse(const std::string_view text) const {
  // Unspecified components default to 2000-01-01 00:00:00 (a leap year, so
  // "%m-%d" accepts 02-29).
  int year = 2000;
  int month = 1;
  int day = 1;
  DateTime result;
  std::size_t pos = 0;

  for (const auto& token : tokens_) {
    std::optional<int> value;
    switch (token.kind) {
      case TokenKind::kLiteral:
        if (text.substr(pos, token.literal.size()) != token.literal) {
          return std::nullopt;
        }
        pos += token.literal.size();
        continue;
      case TokenKind::kYear4:
        value = read_fixed_digits(text, pos, 4);
        if (value) {
          year = *value;
        }
        break;
      case TokenKind::kYear2:
        value = read_fixed_digits(text, pos, 2);
        if (value) {
          year = *value >= 69 ? 1900 + *value : 2000 + *value;
        }
        break;
      case TokenKind::kMonth2:
        value = read_fixed_digits(text, pos, 2);
        if (value) {
          month = *value;
        }
        break;
      case TokenKind::kMonthAbbrev:
      case TokenKind::kMonthName:
        value = read_month_name(text, pos, token.kind == TokenKind::kMonthAbbrev);
        if (value) {
          month = *value;
        }
        break;
      case TokenKind::kDay2:
        value = read_fixed_digits(text, pos, 2);
        if (value) {
          day = *value;
        }
        break;
      case TokenKind::kHour2:
        value = read_fixed_digits(text, pos, 2);
        if (value && *value > 23) {
          return std::nullopt;
        }
        if (value) {
          result.hour = *value;
        }
        break;
      case TokenKind::kMinute2:
        value = read_fixed_digits(text, pos, 2);
        if (value && *value > 59) {
          return std::nullopt;
        }
        if (value) {
          result.minute = *value;
        }
        break;
      case TokenKind::kSecond2:
        value = read_fixed_digits(text, pos, 2);
        if (value && *value > 59) {
          return std::nullopt;
        }
        if (value) {
          result.second = *value;
        }
        break;
    }
    if (!value) {
      return std::nullopt;
    }
  }

  if (pos != text.size() || !core::is_valid_date(year, month, day)) {
    return std::nullopt;
  }
  result.date = core::CalendarDate{year, month, day};
  return result;
}

std::string DateFormat::format(const DateTime& value) const {
  std::ostringstream oss;
  oss << std::setfill('0');
  for (const auto& token : tokens_) {
    switch (token.kind) {
      case TokenKind::kLiteral:
        oss << token.literal;
        break;
      case TokenKind::kYear4:
        oss << std::setw(4) << value.date.year;
        break;
      case TokenKind::kYear2:
        oss << std::setw(2) << (value.date.year % 100);
        break;
      case TokenKind::kMonth2:
        oss << std::setw(2) << value.date.month;
        break;
      case TokenKind::kMonthAbbrev:
        oss << kMonthNames.at(static_cast<std::size_t>(value.date.month - 1)).substr(0, 3);
        break;
      case TokenKind::kMonthName:
        oss << kMonthNames.at(static_cast<std::size_t>(value.date.month - 1));
        break;
      case TokenKind::kDay2:
        oss << std::setw(2) << value.date.day;
        break;
      case TokenKind::kHour2:
        oss << std::setw(2) << value.hour;
        break;
      case TokenKind::kMinute2:
        oss << std::setw(2) << value.minute;
        break;
      case TokenKind::kSecond2:
        oss << std::setw(2) << value.second;
        break;
    }
  }
  return oss.str();
}

std::string DateFormat::format(const core::CalendarDate& date) const {
  return format(DateTime{date, 0, 0, 0});
}

std::optional<std::string> check_date_format(const DateFormat& format) {
  const DateTime reference{{2006, 1, 2}, 15, 4, 5};
  const DateTime other{{2007, 2, 3}, 16, 5, 6};

  const std::string first = format.format(reference);
  if (first == format.format(other)) {
    return "invalid date format '" + format.pattern() +
           "': format does not contain date or time components";
  }

  const auto reparsed = format.parse(first);
  if (!reparsed.has_value() || format.format(*reparsed) != first) {
    return "invalid date format '" + format.pattern() + "': format does not round-trip";
  }
  return std::nullopt;
}

std::optional<core::CalendarDate> parse_iso_timestamp(const std::string_view text) {
  std::size_t pos = 0;
  const auto year = read_fixed_digits(text, pos, 4);
  if (!year || pos >= text.size() || text[pos++] != '-') {
    return std::nullopt;
  }
  const auto month = read_fixed_digits(text, pos, 2);
  if (!month || pos >= text.size() || text[pos++] != '-') {
    return std::nullopt;
  }
  const auto day = read_fixed_digits(text, pos, 2);
  if (!day || pos >= text.size() || text[pos++] != 'T') {
    return std::nullopt;
  }

  const auto hour = read_fixed_digits(text, pos, 2);
  if (!hour || *hour > 23 || pos >= text.size() || text[pos++] != ':') {
    return std::nullopt;
  }
  const auto minute = read_fixed_digits(text, pos, 2);
  if (!minute || *minute > 59 || pos >= text.size() || text[pos++] != ':') {
    return std::nullopt;
  }
  const auto second = read_fixed_digits(text, pos, 2);
  if (!second || *second > 59) {
    return std::nullopt;
  }

  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    const std::size_t fraction_start = pos;
    while (pos < text.size() && is_digit(text[pos])) {
      ++pos;
    }
    if (pos == fraction_start || pos - fraction_start > 9) {
      return std::nullopt;
    }
  }

  if (pos >= text.size()) {
    return std::nullopt;
  }
  if (text[pos] == 'Z') {
    ++pos;
  } else if (text[pos] == '+' || text[pos] == '-') {
    ++pos;
    const auto offset_hours = read_fixed_digits(text, pos, 2);
    if (!offset_hours || *offset_hours > 23 || pos >= text.size() || text[pos++] != ':') {
      return std::nullopt;
    }
    const auto offset_minutes = read_fixed_digits(text, pos, 2);
    if (!offset_minutes || *offset_minutes > 59) {
      return std::nullopt;
    }
  } else {
    return std::nullopt;
  }

  if (pos != text.size() || !core::is_valid_date(*year, *month, *day)) {
    return std::nullopt;
  }
  return core::CalendarDate{*year, *month, *day};
}

std::optional<core::CalendarDate> parse_alternate_date(const std::string_view text) {
  static constexpr std::array<std::string_view, 3> kAlternatePatterns = {
      "%Y-%m-%d",
      "%Y/%m/%d",
      "%m/%d/%Y",
  };

  for (const auto pattern : kAlternatePatterns) {
    const auto format = DateFormat::compile(pattern);
    if (!format.has_value()) {
      continue;
    }
    if (const auto parsed = format.value().parse(text)) {
      return parsed->date;
    }
  }
  return parse_iso_timestamp(text);
}

}  // namespace kira::schema
