#pragma once

#include "kira/core/time.h"

namespace kira::core {

// Abstract clock interface for date injection.
// Allows production code to use the system calendar while tests pin "today".
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Current calendar date in the user's local calendar.
  // Relative date bounds ("today", "future") and the "today" default resolve against this.
  [[nodiscard]] virtual CalendarDate today() const = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: reads the system clock and converts to the local calendar day.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  [[nodiscard]] CalendarDate today() const override;
};

// Fixed clock: returns a constant date for deterministic tests.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(CalendarDate fixed_date) : fixed_date_(fixed_date) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  [[nodiscard]] CalendarDate today() const override;

 private:
  CalendarDate fixed_date_;
};

}  // namespace kira::core
