#pragma once

#include <compare>
#include <cstdint>
#include <string>

namespace kira::core {

// CalendarDate is a timezone-free calendar day. Every date comparison in the
// engine happens on this type, so a stored date string and "today" always share
// the same reference frame (midnight of the day, no offset).
struct CalendarDate {
  int year{1970};
  int month{1};
  int day{1};

  auto operator<=>(const CalendarDate&) const = default;
};

[[nodiscard]] bool is_leap_year(int year) noexcept;

[[nodiscard]] int days_in_month(int year, int month) noexcept;

// is_valid_date rejects days that do not exist (2023-02-29, 2024-13-01, ...).
[[nodiscard]] bool is_valid_date(int year, int month, int day) noexcept;

// Days since 1970-01-01 (proleptic Gregorian), negative before the epoch.
[[nodiscard]] std::int64_t to_days(const CalendarDate& date) noexcept;

[[nodiscard]] CalendarDate from_days(std::int64_t days) noexcept;

[[nodiscard]] CalendarDate add_days(const CalendarDate& date, std::int64_t days) noexcept;

// Canonical YYYY-MM-DD rendering used in messages.
[[nodiscard]] std::string to_iso_date(const CalendarDate& date);

}  // namespace kira::core
