#include "kira/core/clock.h"
#include "kira/core/time.h"

#include <catch2/catch.hpp>

using kira::core::CalendarDate;

TEST_CASE("Calendar arithmetic", "[core][time]") {
  SECTION("leap years follow the Gregorian rules") {
    REQUIRE(kira::core::is_leap_year(2024));
    REQUIRE(kira::core::is_leap_year(2000));
    REQUIRE_FALSE(kira::core::is_leap_year(1900));
    REQUIRE_FALSE(kira::core::is_leap_year(2023));
  }

  SECTION("days that do not exist are invalid") {
    REQUIRE(kira::core::is_valid_date(2024, 2, 29));
    REQUIRE_FALSE(kira::core::is_valid_date(2023, 2, 29));
    REQUIRE_FALSE(kira::core::is_valid_date(2024, 13, 1));
    REQUIRE_FALSE(kira::core::is_valid_date(2024, 4, 31));
    REQUIRE_FALSE(kira::core::is_valid_date(2024, 1, 0));
    REQUIRE_FALSE(kira::core::is_valid_date(0, 1, 1));
  }

  SECTION("day counts are anchored at the Unix epoch") {
    REQUIRE(kira::core::to_days(CalendarDate{1970, 1, 1}) == 0);
    REQUIRE(kira::core::to_days(CalendarDate{1970, 1, 2}) == 1);
    REQUIRE(kira::core::to_days(CalendarDate{1969, 12, 31}) == -1);
    REQUIRE(kira::core::from_days(0) == CalendarDate{1970, 1, 1});
  }

  SECTION("add_days crosses month and year boundaries") {
    REQUIRE(kira::core::add_days(CalendarDate{2024, 2, 28}, 1) == CalendarDate{2024, 2, 29});
    REQUIRE(kira::core::add_days(CalendarDate{2023, 2, 28}, 1) == CalendarDate{2023, 3, 1});
    REQUIRE(kira::core::add_days(CalendarDate{2023, 12, 31}, 1) == CalendarDate{2024, 1, 1});
    REQUIRE(kira::core::add_days(CalendarDate{2024, 1, 1}, -1) == CalendarDate{2023, 12, 31});
  }

  SECTION("dates compare chronologically") {
    REQUIRE(CalendarDate{2024, 1, 31} < CalendarDate{2024, 2, 1});
    REQUIRE(CalendarDate{2023, 12, 31} < CalendarDate{2024, 1, 1});
  }

  SECTION("ISO rendering is zero padded") {
    REQUIRE(kira::core::to_iso_date(CalendarDate{2024, 3, 5}) == "2024-03-05");
    REQUIRE(kira::core::to_iso_date(CalendarDate{987, 1, 1}) == "0987-01-01");
  }
}

TEST_CASE("FixedClock pins today", "[core][clock]") {
  const kira::core::FixedClock clock(CalendarDate{2025, 6, 15});
  REQUIRE(clock.today() == CalendarDate{2025, 6, 15});
}
