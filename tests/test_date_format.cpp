#include "kira/schema/date_format.h"

#include <catch2/catch.hpp>

using kira::core::CalendarDate;
using kira::schema::DateFormat;

namespace {

DateFormat compile_ok(const std::string& pattern) {
  auto compiled = DateFormat::compile(pattern);
  REQUIRE(compiled.has_value());
  return compiled.value();
}

}  // namespace

TEST_CASE("Default date format is YYYY-MM-DD", "[schema][date_format]") {
  const DateFormat format;
  REQUIRE(format.pattern() == "%Y-%m-%d");

  SECTION("valid dates parse") {
    const auto parsed = format.parse("2024-01-15");
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->date == CalendarDate{2024, 1, 15});
  }

  SECTION("parsing is strict") {
    REQUIRE_FALSE(format.parse("2024-1-15").has_value());
    REQUIRE_FALSE(format.parse("2024-01-15 ").has_value());
    REQUIRE_FALSE(format.parse("2024/01/15").has_value());
    REQUIRE_FALSE(format.parse("2024-02-30").has_value());
    REQUIRE_FALSE(format.parse("2023-02-29").has_value());
    REQUIRE_FALSE(format.parse("").has_value());
  }

  SECTION("formatting pads every component") {
    REQUIRE(format.format(CalendarDate{2024, 3, 5}) == "2024-03-05");
  }

  SECTION("an empty pattern compiles to the default") {
    REQUIRE(compile_ok("").pattern() == "%Y-%m-%d");
  }
}

TEST_CASE("Custom date patterns", "[schema][date_format]") {
  SECTION("slash separated day-first pattern") {
    const auto format = compile_ok("%d/%m/%Y");
    const auto parsed = format.parse("15/01/2024");
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->date == CalendarDate{2024, 1, 15});
    REQUIRE(format.format(CalendarDate{2024, 1, 15}) == "15/01/2024");
  }

  SECTION("month names match case-insensitively and format canonically") {
    const auto format = compile_ok("%b %d, %Y");
    const auto parsed = format.parse("jan 02, 2006");
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->date == CalendarDate{2006, 1, 2});
    REQUIRE(format.format(parsed->date) == "Jan 02, 2006");

    const auto full = compile_ok("%B %Y");
    REQUIRE(full.format(CalendarDate{2024, 9, 1}) == "September 2024");
  }

  SECTION("two-digit years pivot at 69") {
    const auto format = compile_ok("%y%m%d");
    REQUIRE(format.parse("240115")->date == CalendarDate{2024, 1, 15});
    REQUIRE(format.parse("690115")->date == CalendarDate{1969, 1, 15});
  }

  SECTION("time components are range checked") {
    const auto format = compile_ok("%Y-%m-%d %H:%M:%S");
    const auto parsed = format.parse("2024-01-15 13:45:30");
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->hour == 13);
    REQUIRE(parsed->minute == 45);
    REQUIRE(parsed->second == 30);
    REQUIRE_FALSE(format.parse("2024-01-15 24:00:00").has_value());
    REQUIRE_FALSE(format.parse("2024-01-15 12:60:00").has_value());
  }

  SECTION("%% is a literal percent sign") {
    const auto format = compile_ok("%Y%%%m");
    REQUIRE(format.format(CalendarDate{2024, 5, 1}) == "2024%05");
  }
}

TEST_CASE("Date pattern compile errors", "[schema][date_format]") {
  SECTION("dangling percent") {
    auto compiled = DateFormat::compile("%Y-%");
    REQUIRE_FALSE(compiled.has_value());
    REQUIRE(compiled.error().kind == kira::core::ErrorKind::kConfiguration);
    REQUIRE(compiled.error().message == "dangling '%' at end of date format '%Y-%'");
  }

  SECTION("unknown directive") {
    auto compiled = DateFormat::compile("%Y-%q");
    REQUIRE_FALSE(compiled.has_value());
    REQUIRE(compiled.error().message == "unknown directive '%q' in date format '%Y-%q'");
  }
}

TEST_CASE("Date pattern usability checks", "[schema][date_format]") {
  SECTION("usable patterns pass") {
    REQUIRE_FALSE(kira::schema::check_date_format(compile_ok("%Y-%m-%d")).has_value());
    REQUIRE_FALSE(kira::schema::check_date_format(compile_ok("%d.%m.%y")).has_value());
  }

  SECTION("a pattern without components is rejected") {
    const auto problem = kira::schema::check_date_format(compile_ok("invalid"));
    REQUIRE(problem.has_value());
    REQUIRE(*problem ==
            "invalid date format 'invalid': format does not contain date or time components");
  }

  SECTION("escaped percent signs are still only literal text") {
    const auto problem = kira::schema::check_date_format(compile_ok("%%"));
    REQUIRE(problem.has_value());
    REQUIRE(*problem ==
            "invalid date format '%%': format does not contain date or time components");
  }
}

TEST_CASE("Alternate date encodings", "[schema][date_format]") {
  SECTION("common hand-written forms") {
    REQUIRE(kira::schema::parse_alternate_date("2024-01-15") == CalendarDate{2024, 1, 15});
    REQUIRE(kira::schema::parse_alternate_date("2024/01/15") == CalendarDate{2024, 1, 15});
    REQUIRE(kira::schema::parse_alternate_date("01/15/2024") == CalendarDate{2024, 1, 15});
  }

  SECTION("ISO-8601 timestamps keep their own calendar day") {
    REQUIRE(kira::schema::parse_alternate_date("2024-01-15T10:30:00Z") ==
            CalendarDate{2024, 1, 15});
    REQUIRE(kira::schema::parse_alternate_date("2024-01-15T23:30:00-05:00") ==
            CalendarDate{2024, 1, 15});
    REQUIRE(kira::schema::parse_alternate_date("2024-01-15T10:30:00.123456789Z") ==
            CalendarDate{2024, 1, 15});
  }

  SECTION("unrecognised text") {
    REQUIRE_FALSE(kira::schema::parse_alternate_date("15th January").has_value());
    REQUIRE_FALSE(kira::schema::parse_alternate_date("2024-01-15T10:30:00").has_value());
    REQUIRE_FALSE(kira::schema::parse_alternate_date("2024-01-15T10:30:00.Z").has_value());
  }
}
