#pragma once

#include "kira/core/result.h"
#include "kira/core/time.h"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kira::schema {

// The pattern used when a date field configures no format (YYYY-MM-DD).
inline constexpr std::string_view kDefaultDatePattern = "%Y-%m-%d";

struct DateTime {
  core::CalendarDate date;
  int hour{0};
  int minute{0};
  int second{0};
};

// DateFormat is a compiled strftime-style date pattern.
//
// Supported directives: %Y (4 digits), %y (2 digits), %m, %d, %H, %M, %S (2 digits),
// %b (Jan), %B (January), %%. Every other character is matched literally.
// Parsing is strict: fixed widths, the whole input must be consumed and the
// resulting calendar day must exist. Month names match ASCII case-insensitively.
class DateFormat {
 public:
  // Default-constructed formats use kDefaultDatePattern.
  DateFormat();

  // Fails with a kConfiguration error on a dangling '%' or an unknown directive.
  // An empty pattern compiles to kDefaultDatePattern.
  [[nodiscard]] static core::Result<DateFormat, core::Error> compile(std::string_view pattern);

  [[nodiscard]] const std::string& pattern() const noexcept { return pattern_; }

  [[nodiscard]] std::optional<DateTime> parse(std::string_view text) const;

  [[nodiscard]] std::string format(const DateTime& value) const;
  [[nodiscard]] std::string format(const core::CalendarDate& date) const;

 private:
  enum class TokenKind {
    kLiteral,
    kYear4,
    kYear2,
    kMonth2,
    kMonthAbbrev,
    kMonthName,
    kDay2,
    kHour2,
    kMinute2,
    kSecond2,
  };

  struct Token {
    TokenKind kind{TokenKind::kLiteral};
    std::string literal;
  };

  DateFormat(std::string pattern, std::vector<Token> tokens)
      : pattern_(std::move(pattern)), tokens_(std::move(tokens)) {}

  static core::Result<std::vector<Token>, core::Error> tokenize(std::string_view pattern);

  std::string pattern_;
  std::vector<Token> tokens_;
};

// check_date_format rejects patterns that cannot serve as a schema date format:
// the pattern must render two different reference instants differently (so a
// pattern of pure literal text is rejected) and must survive a
// format -> parse -> format round trip. Returns the problem, or nullopt when usable.
[[nodiscard]] std::optional<std::string> check_date_format(const DateFormat& format);

// parse_iso_timestamp accepts YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM).
// The calendar day is the one in the timestamp's own offset.
[[nodiscard]] std::optional<core::CalendarDate> parse_iso_timestamp(std::string_view text);

// parse_alternate_date tries the common encodings found in hand-edited files, in
// order: YYYY-MM-DD, YYYY/MM/DD, MM/DD/YYYY, then ISO-8601 / RFC3339 timestamps.
[[nodiscard]] std::optional<core::CalendarDate> parse_alternate_date(std::string_view text);

}  // namespace kira::schema
