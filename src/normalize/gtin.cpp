#include "rxrecon/normalize/gtin.h"

#include "rxrecon/core/normalization.h"

#include <algorithm>

namespace rxrecon::normalize {

namespace {

constexpr std::size_t kGtin14Length = 14;
constexpr std::string_view kSgtinPrefix = "urn:epc:id:sgtin:";
constexpr std::string_view kSgtinPatternPrefix = "urn:epc:idpat:sgtin:";

bool all_digits(const std::string_view text) {
  return !text.empty() && std::all_of(text.begin(), text.end(), core::is_ascii_digit);
}

}  // namespace

std::optional<int> gtin_check_digit(const std::string_view body) {
  if (!all_digits(body)) {
    return std::nullopt;
  }

  int sum = 0;
  bool triple = true;
  for (auto it = body.rbegin(); it != body.rend(); ++it) {
    const int digit = *it - '0';
    sum += triple ? digit * 3 : digit;
    triple = !triple;
  }
  return (10 - (sum % 10)) % 10;
}

bool has_valid_check_digit(const std::string_view gtin) {
  const std::size_t n = gtin.size();
  if (n != 8 && n != 12 && n != 13 && n != kGtin14Length) {
    return false;
  }
  const auto expected = gtin_check_digit(gtin.substr(0, n - 1));
  return expected.has_value() && core::is_ascii_digit(gtin.back()) &&
         *expected == gtin.back() - '0';
}

std::optional<std::string> to_gtin14(const std::string_view gtin) {
  if (!all_digits(gtin) || gtin.size() < 12 || gtin.size() > kGtin14Length) {
    return std::nullopt;
  }
  return std::string(kGtin14Length - gtin.size(), '0') + std::string(gtin);
}

std::optional<int> packaging_indicator(const std::string_view gtin) {
  const auto padded = to_gtin14(gtin);
  if (!padded) {
    return std::nullopt;
  }
  return padded->front() - '0';
}

std::optional<PackagingLevel> packaging_level(const std::string_view gtin) {
  const auto indicator = packaging_indicator(gtin);
  if (!indicator) {
    return std::nullopt;
  }
  if (*indicator == 0) {
    return PackagingLevel::kItem;
  }
  if (*indicator == 9) {
    return PackagingLevel::kVariableMeasure;
  }
  return PackagingLevel::kCase;
}

std::optional<std::string> sgtin_urn_to_gtin14(const std::string_view urn) {
  const std::string lowered = core::normalize_ascii_lower(core::trim(urn));
  std::string_view rest = lowered;
  if (rest.substr(0, kSgtinPrefix.size()) == kSgtinPrefix) {
    rest.remove_prefix(kSgtinPrefix.size());
  } else if (rest.substr(0, kSgtinPatternPrefix.size()) == kSgtinPatternPrefix) {
    rest.remove_prefix(kSgtinPatternPrefix.size());
  } else {
    return std::nullopt;
  }

  const auto first_dot = rest.find('.');
  if (first_dot == std::string_view::npos) {
    return std::nullopt;
  }
  const std::string_view company = rest.substr(0, first_dot);
  std::string_view item_ref = rest.substr(first_dot + 1);
  // Serial (or '*' in a pattern) follows the second dot and is not part of the GTIN.
  if (const auto second_dot = item_ref.find('.'); second_dot != std::string_view::npos) {
    item_ref = item_ref.substr(0, second_dot);
  }

  if (!all_digits(company) || !all_digits(item_ref) ||
      company.size() + item_ref.size() != kGtin14Length - 1) {
    return std::nullopt;
  }

  std::string body;
  body.reserve(kGtin14Length);
  body.push_back(item_ref.front());
  body.append(company);
  body.append(item_ref.substr(1));

  const auto check = gtin_check_digit(body);
  if (!check) {
    return std::nullopt;
  }
  body.push_back(static_cast<char>('0' + *check));
  return body;
}

}  // namespace rxrecon::normalize
