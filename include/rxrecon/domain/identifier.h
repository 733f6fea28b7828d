#pragma once

#include <string>
#include <variant>

namespace rxrecon::domain {

// Ndc is a National Drug Code in the 11-digit 5-4-2 billing layout.
// Each segment is zero-padded: labeler has 5 digits, product 4, package 2.
struct Ndc {
  std::string labeler;
  std::string product;
  std::string package;

  auto operator<=>(const Ndc&) const = default;

  // "LLLLL-PPPP-KK"
  [[nodiscard]] std::string to_string() const { return labeler + "-" + product + "-" + package; }
};

// Gtin keeps the full 14 digits as read plus the NDC embedded in them.
struct Gtin {
  std::string digits;
  Ndc ndc;

  auto operator<=>(const Gtin&) const = default;
};

// UnknownIdentifier keeps input that matched no recognized shape, unchanged.
struct UnknownIdentifier {
  std::string raw;

  auto operator<=>(const UnknownIdentifier&) const = default;
};

using IdentifierValue = std::variant<Ndc, Gtin, UnknownIdentifier>;

struct CanonicalIdentifier {
  IdentifierValue value{UnknownIdentifier{}};
  bool low_confidence{true};

  // key is the comparison key: canonical NDC text for Ndc and Gtin, raw text otherwise.
  // A GTIN and the NDC it embeds share one key.
  [[nodiscard]] std::string key() const;

  // "ndc", "gtin" or "unknown"
  [[nodiscard]] const char* kind_name() const;

  [[nodiscard]] bool is_unknown() const { return std::holds_alternative<UnknownIdentifier>(value); }

  // is_canonical reports a high-confidence NDC or GTIN, the only case where two
  // identifiers can be said to agree or disagree.
  [[nodiscard]] bool is_canonical() const { return !is_unknown() && !low_confidence; }

  friend bool operator==(const CanonicalIdentifier& a, const CanonicalIdentifier& b) {
    return a.low_confidence == b.low_confidence && a.key() == b.key();
  }
};

}  // namespace rxrecon::domain
