#include "kira/core/clock.h"

#include <chrono>
#include <ctime>

namespace kira::core {

CalendarDate SystemClock::today() const {
  const auto now = std::chrono::system_clock::now();
  const std::time_t time_t_now = std::chrono::system_clock::to_time_t(now);

  std::tm local_tm{};
  localtime_r(&time_t_now, &local_tm);
  return CalendarDate{local_tm.tm_year + 1900, local_tm.tm_mon + 1, local_tm.tm_mday};
}

CalendarDate FixedClock::today() const {
  return fixed_date_;
}

}  // namespace kira::core
