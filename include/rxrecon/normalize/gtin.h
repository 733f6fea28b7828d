#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace rxrecon::normalize {

// GS1 GTIN helpers. Inputs are digit strings unless stated otherwise; any other
// character makes the helpers return nullopt / false.

// gtin_check_digit computes the GS1 mod-10 check digit for the digits that precede it
// (weights 3,1,3,... from the rightmost body digit).
[[nodiscard]] std::optional<int> gtin_check_digit(std::string_view body);

// has_valid_check_digit accepts GTIN-8, GTIN-12, GTIN-13 and GTIN-14 whose last digit
// equals the computed check digit.
[[nodiscard]] bool has_valid_check_digit(std::string_view gtin);

// to_gtin14 left-pads a 12-, 13- or 14-digit GTIN with zeros to 14 digits.
[[nodiscard]] std::optional<std::string> to_gtin14(std::string_view gtin);

enum class PackagingLevel {
  kItem,             // indicator 0
  kCase,             // indicators 1-8
  kVariableMeasure,  // indicator 9
};

// packaging_indicator returns the first digit of the GTIN-14 form.
[[nodiscard]] std::optional<int> packaging_indicator(std::string_view gtin);
[[nodiscard]] std::optional<PackagingLevel> packaging_level(std::string_view gtin);

// sgtin_urn_to_gtin14 converts "urn:epc:id:sgtin:<company>.<indicator+item>.<serial>"
// (or the idpat form) to a GTIN-14, computing the check digit the URN omits.
// Company prefix and item reference must total 13 digits.
[[nodiscard]] std::optional<std::string> sgtin_urn_to_gtin14(std::string_view urn);

}  // namespace rxrecon::normalize
