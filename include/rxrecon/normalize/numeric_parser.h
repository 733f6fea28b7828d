#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace rxrecon::normalize {

// parse_decimal reads amounts as printed on invoices: "$1,141.92", " 23.790 ", "-4.5".
// Currency symbols, thousands separators and whitespace are ignored.
// Returns nullopt for empty input or anything that is not a plain decimal number.
[[nodiscard]] std::optional<double> parse_decimal(std::string_view raw);

// parse_quantity is parse_decimal restricted to whole numbers ("48", "1,200", "48.0").
[[nodiscard]] std::optional<std::int64_t> parse_quantity(std::string_view raw);

}  // namespace rxrecon::normalize
