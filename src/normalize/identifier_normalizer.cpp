#include "rxrecon/normalize/identifier_normalizer.h"

#include "rxrecon/core/normalization.h"
#include "rxrecon/normalize/gtin.h"

#include <string>
#include <vector>

namespace rxrecon::normalize {

namespace {

constexpr std::string_view kUsPharmaPrefix = "03";
constexpr std::string_view kGs1GtinElement = "(01)";

domain::CanonicalIdentifier unknown(const std::string_view raw) {
  return domain::CanonicalIdentifier{.value = domain::UnknownIdentifier{std::string(raw)},
                                     .low_confidence = true};
}

domain::CanonicalIdentifier canonical(domain::IdentifierValue value) {
  return domain::CanonicalIdentifier{.value = std::move(value), .low_confidence = false};
}

std::string left_pad(const std::string_view digits, const std::size_t width) {
  if (digits.size() >= width) {
    return std::string(digits);
  }
  return std::string(width - digits.size(), '0') + std::string(digits);
}

domain::Ndc make_ndc(const std::string_view labeler, const std::string_view product,
                     const std::string_view package) {
  return domain::Ndc{.labeler = left_pad(labeler, 5),
                     .product = left_pad(product, 4),
                     .package = left_pad(package, 2)};
}

// Strips a leading "ndc" / "gtin" label (any case) followed by a separator or colon.
std::string_view strip_label(std::string_view text) {
  for (const std::string_view label : {std::string_view("ndc"), std::string_view("gtin")}) {
    if (text.size() <= label.size()) {
      continue;
    }
    bool matches = true;
    for (std::size_t i = 0; i < label.size(); ++i) {
      if (core::ascii_lower(text[i]) != label[i]) {
        matches = false;
        break;
      }
    }
    if (matches && !core::is_ascii_alnum(text[label.size()])) {
      text.remove_prefix(label.size());
      return text;
    }
  }
  return text;
}

// Splits on any non-alphanumeric character. Returns nullopt when a letter appears.
std::optional<std::vector<std::string>> digit_groups(const std::string_view text) {
  std::vector<std::string> groups;
  std::string current;
  for (const char ch : text) {
    if (core::is_ascii_digit(ch)) {
      current.push_back(ch);
      continue;
    }
    if (core::is_ascii_alnum(ch)) {
      return std::nullopt;
    }
    if (!current.empty()) {
      groups.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    groups.push_back(std::move(current));
  }
  return groups;
}

std::optional<domain::Ndc> ndc_from_groups(const std::vector<std::string>& groups) {
  const auto& a = groups[0];
  const auto& b = groups[1];
  const auto& c = groups[2];
  const bool layout_542 = a.size() == 5 && b.size() == 4 && c.size() == 2;
  const bool layout_532 = a.size() == 5 && b.size() == 3 && c.size() == 2;
  const bool layout_442 = a.size() == 4 && b.size() == 4 && c.size() == 2;
  const bool layout_541 = a.size() == 5 && b.size() == 4 && c.size() == 1;
  if (layout_542 || layout_532 || layout_442 || layout_541) {
    return make_ndc(a, b, c);
  }
  return std::nullopt;
}

domain::CanonicalIdentifier from_gtin14(const std::string& gtin14, const std::string_view raw) {
  const auto ndc = ndc_from_gtin14(gtin14);
  if (!ndc) {
    return unknown(raw);
  }
  return canonical(domain::Gtin{.digits = gtin14, .ndc = *ndc});
}

}  // namespace

std::optional<domain::Ndc> ndc_from_gtin14(const std::string_view gtin14) {
  if (gtin14.size() != 14) {
    return std::nullopt;
  }
  for (const char ch : gtin14) {
    if (!core::is_ascii_digit(ch)) {
      return std::nullopt;
    }
  }

  const std::string_view middle = gtin14.substr(1, 12);
  if (middle.substr(0, kUsPharmaPrefix.size()) == kUsPharmaPrefix) {
    const std::string_view ndc10 = middle.substr(2);
    return make_ndc(ndc10.substr(0, 5), ndc10.substr(5, 3), ndc10.substr(8, 2));
  }
  const std::string_view ndc11 = middle.substr(1);
  return make_ndc(ndc11.substr(0, 5), ndc11.substr(5, 4), ndc11.substr(9, 2));
}

domain::CanonicalIdentifier normalize_identifier(const std::string_view raw) {
  const std::string trimmed = core::trim(raw);
  if (trimmed.empty()) {
    return unknown(raw);
  }

  if (const auto from_urn = sgtin_urn_to_gtin14(trimmed)) {
    return from_gtin14(*from_urn, raw);
  }

  std::string_view text = trimmed;
  if (text.substr(0, kGs1GtinElement.size()) == kGs1GtinElement) {
    text.remove_prefix(kGs1GtinElement.size());
    std::string digits;
    while (!text.empty() && digits.size() < 14 && core::is_ascii_digit(text.front())) {
      digits.push_back(text.front());
      text.remove_prefix(1);
    }
    // Only another element string (or nothing) may follow the 14 digits.
    if (digits.size() == 14 && (text.empty() || text.front() == '(')) {
      return from_gtin14(digits, raw);
    }
    return unknown(raw);
  }

  const auto groups = digit_groups(strip_label(text));
  if (!groups) {
    return unknown(raw);
  }

  if (groups->size() == 3) {
    if (auto ndc = ndc_from_groups(*groups)) {
      return canonical(std::move(*ndc));
    }
    return unknown(raw);
  }

  if (groups->size() != 1) {
    return unknown(raw);
  }

  const std::string& digits = groups->front();
  switch (digits.size()) {
    case 11:
      return canonical(make_ndc(digits.substr(0, 5), digits.substr(5, 4), digits.substr(9, 2)));
    case 10:
      return canonical(make_ndc(digits.substr(0, 5), digits.substr(5, 3), digits.substr(8, 2)));
    case 12:
    case 13:
    case 14:
      return from_gtin14(*to_gtin14(digits), raw);
    default:
      return unknown(raw);
  }
}

std::optional<domain::CanonicalIdentifier> normalize_optional_identifier(
    const std::optional<std::string>& raw) {
  if (!raw || core::trim(*raw).empty()) {
    return std::nullopt;
  }
  return normalize_identifier(*raw);
}

}  // namespace rxrecon::normalize
