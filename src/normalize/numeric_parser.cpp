#include "rxrecon/normalize/numeric_parser.h"

#include "rxrecon/core/normalization.h"

#include <cmath>
#include <cstdlib>
#include <string>

namespace rxrecon::normalize {

std::optional<double> parse_decimal(const std::string_view raw) {
  std::string cleaned;
  cleaned.reserve(raw.size());
  for (const char ch : raw) {
    if (ch == '$' || ch == ',' || ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r') {
      continue;
    }
    cleaned.push_back(ch);
  }

  // [+-]digits[.digits] or [+-].digits
  std::size_t pos = 0;
  if (pos < cleaned.size() && (cleaned[pos] == '-' || cleaned[pos] == '+')) {
    ++pos;
  }
  std::size_t digit_count = 0;
  bool seen_point = false;
  for (; pos < cleaned.size(); ++pos) {
    const char ch = cleaned[pos];
    if (core::is_ascii_digit(ch)) {
      ++digit_count;
    } else if (ch == '.' && !seen_point) {
      seen_point = true;
    } else {
      return std::nullopt;
    }
  }
  if (digit_count == 0) {
    return std::nullopt;
  }

  return std::strtod(cleaned.c_str(), nullptr);
}

std::optional<std::int64_t> parse_quantity(const std::string_view raw) {
  const auto value = parse_decimal(raw);
  if (!value || std::trunc(*value) != *value) {
    return std::nullopt;
  }
  // 2^63; int64 holds [-2^63, 2^63).
  constexpr double kInt64Bound = 9223372036854775808.0;
  if (!std::isfinite(*value) || *value < -kInt64Bound || *value >= kInt64Bound) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(*value);
}

}  // namespace rxrecon::normalize
