#include "kira/core/time.h"

#include <iomanip>
#include <sstream>

namespace kira::core {

bool is_leap_year(const int year) noexcept {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(const int year, const int month) noexcept {
  switch (month) {
    case 1:
    case 3:
    case 5:
    case 7:
    case 8:
    case 10:
    case 12:
      return 31;
    case 4:
    case 6:
    case 9:
    case 11:
      return 30;
    case 2:
      return is_leap_year(year) ? 29 : 28;
    default:
      return 0;
  }
}

bool is_valid_date(const int year, const int month, const int day) noexcept {
  if (year < 1 || year > 9999 || month < 1 || month > 12) {
    return false;
  }
  return day >= 1 && day <= days_in_month(year, month);
}

// Civil-from-days / days-from-civil (Howard Hinnant's algorithms).
std::int64_t to_days(const CalendarDate& date) noexcept {
  const std::int64_t y = date.month <= 2 ? date.year - 1 : date.year;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const std::int64_t yoe = y - era * 400;
  const std::int64_t m = date.month;
  const std::int64_t doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + date.day - 1;
  const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

CalendarDate from_days(std::int64_t days) noexcept {
  days += 719468;
  const std::int64_t era = (days >= 0 ? days : days - 146096) / 146097;
  const std::int64_t doe = days - era * 146097;
  const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const std::int64_t mp = (5 * doy + 2) / 153;
  const std::int64_t d = doy - (153 * mp + 2) / 5 + 1;
  const std::int64_t m = mp < 10 ? mp + 3 : mp - 9;
  const std::int64_t y = yoe + era * 400 + (m <= 2 ? 1 : 0);
  return CalendarDate{static_cast<int>(y), static_cast<int>(m), static_cast<int>(d)};
}

CalendarDate add_days(const CalendarDate& date, const std::int64_t days) noexcept {
  return from_days(to_days(date) + days);
}

std::string to_iso_date(const CalendarDate& date) {
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << date.year << '-' << std::setw(2) << date.month
      << '-' << std::setw(2) << date.day;
  return oss.str();
}

}  // namespace kira::core
