#pragma once

#include "rxrecon/domain/calendar_date.h"

#include <optional>
#include <string_view>

namespace rxrecon::normalize {

// normalize_date accepts, after trimming:
//   YYYY-MM-DD
//   MM/DD/YYYY   (month and day may be a single digit)
//   DD-MMM-YY    (two-digit years are 20YY)
//   DD-MMM-YYYY  (month names are three letters, any case: "29-FEB-28")
// Impossible calendar dates (Feb 30, Feb 29 outside leap years) and any other text
// yield nullopt. Never throws.
[[nodiscard]] std::optional<domain::CalendarDate> normalize_date(std::string_view raw);

}  // namespace rxrecon::normalize
