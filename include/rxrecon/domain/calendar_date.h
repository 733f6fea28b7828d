#pragma once

#include <string>

namespace rxrecon::domain {

// CalendarDate is a proleptic Gregorian date with no time zone.
// Values built by normalize::normalize_date are always valid calendar dates.
struct CalendarDate {
  int year{0};
  int month{0};
  int day{0};

  auto operator<=>(const CalendarDate&) const = default;

  // to_iso renders YYYY-MM-DD.
  [[nodiscard]] std::string to_iso() const;
};

[[nodiscard]] bool is_leap_year(int year);
[[nodiscard]] int days_in_month(int year, int month);

}  // namespace rxrecon::domain
