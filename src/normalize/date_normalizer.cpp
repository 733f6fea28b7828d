#include "rxrecon/normalize/date_normalizer.h"

#include "rxrecon/core/normalization.h"

#include <array>
#include <string>
#include <vector>

namespace rxrecon::normalize {

namespace {

constexpr std::array<std::string_view, 12> kMonthAbbreviations = {
    "jan", "feb", "mar", "apr", "may", "jun", "jul", "aug", "sep", "oct", "nov", "dec"};

std::optional<int> parse_digits(const std::string_view text, const std::size_t min_width,
                                const std::size_t max_width) {
  if (text.size() < min_width || text.size() > max_width) {
    return std::nullopt;
  }
  int value = 0;
  for (const char ch : text) {
    if (!core::is_ascii_digit(ch)) {
      return std::nullopt;
    }
    value = value * 10 + (ch - '0');
  }
  return value;
}

std::optional<int> parse_month_name(const std::string_view text) {
  const std::string lowered = core::normalize_ascii_lower(text);
  for (std::size_t i = 0; i < kMonthAbbreviations.size(); ++i) {
    if (lowered == kMonthAbbreviations[i]) {
      return static_cast<int>(i) + 1;
    }
  }
  return std::nullopt;
}

std::vector<std::string_view> split(const std::string_view text, const char separator) {
  std::vector<std::string_view> parts;
  std::size_t start = 0;
  while (true) {
    const auto pos = text.find(separator, start);
    if (pos == std::string_view::npos) {
      parts.push_back(text.substr(start));
      return parts;
    }
    parts.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
}

std::optional<domain::CalendarDate> checked(const std::optional<int> year,
                                            const std::optional<int> month,
                                            const std::optional<int> day) {
  if (!year || !month || !day) {
    return std::nullopt;
  }
  if (*month < 1 || *month > 12) {
    return std::nullopt;
  }
  if (*day < 1 || *day > domain::days_in_month(*year, *month)) {
    return std::nullopt;
  }
  return domain::CalendarDate{.year = *year, .month = *month, .day = *day};
}

}  // namespace

std::optional<domain::CalendarDate> normalize_date(const std::string_view raw) {
  const std::string text = core::trim(raw);
  if (text.empty()) {
    return std::nullopt;
  }

  if (text.find('/') != std::string::npos) {
    const auto parts = split(text, '/');
    if (parts.size() != 3) {
      return std::nullopt;
    }
    return checked(parse_digits(parts[2], 4, 4), parse_digits(parts[0], 1, 2),
                   parse_digits(parts[1], 1, 2));
  }

  const auto parts = split(text, '-');
  if (parts.size() != 3) {
    return std::nullopt;
  }

  if (parts[0].size() == 4) {
    return checked(parse_digits(parts[0], 4, 4), parse_digits(parts[1], 2, 2),
                   parse_digits(parts[2], 2, 2));
  }

  auto year = parse_digits(parts[2], 2, 4);
  if (parts[2].size() == 3) {
    return std::nullopt;
  }
  if (year && parts[2].size() == 2) {
    *year += 2000;
  }
  return checked(year, parse_month_name(parts[1]), parse_digits(parts[0], 1, 2));
}

}  // namespace rxrecon::normalize
