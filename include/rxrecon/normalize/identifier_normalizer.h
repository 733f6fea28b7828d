#pragma once

#include "rxrecon/domain/identifier.h"

#include <optional>
#include <string_view>

namespace rxrecon::normalize {

// normalize_identifier canonicalizes an NDC or GTIN as printed on a document.
//
// Recognized shapes (whitespace and punctuation separate digit groups):
//   NDC, three groups   5-4-2, 5-3-2, 4-4-2, 5-4-1  -> zero-padded to 5-4-2
//   NDC, bare digits    11 digits read as 5-4-2
//                       10 digits read as 5-3-2 (4-4-2 and 5-4-1 cannot be told apart
//                       without separators, so this is positional and may be wrong)
//   GTIN                12, 13 or 14 digits, "(01)" + 14 digits (further GS1 element
//                       strings may follow), or an SGTIN URN
// An optional leading "NDC" or "GTIN" label is ignored.
//
// GTIN to NDC drops the indicator and check digit. When the remaining 12 digits begin
// with the US pharmaceutical prefix "03", the next 10 digits are an NDC-10 read as 5-3-2;
// otherwise the last 11 digits are read as 5-4-2. Check digits are not validated here.
//
// Anything else yields UnknownIdentifier{raw} with low_confidence set. Never throws.
// normalize_identifier(normalize_identifier(x).key()) == normalize_identifier(x).
[[nodiscard]] domain::CanonicalIdentifier normalize_identifier(std::string_view raw);

// normalize_optional_identifier returns nullopt for an absent or blank identifier.
[[nodiscard]] std::optional<domain::CanonicalIdentifier> normalize_optional_identifier(
    const std::optional<std::string>& raw);

// ndc_from_gtin14 applies the GTIN to NDC rule above to a 14-digit string.
[[nodiscard]] std::optional<domain::Ndc> ndc_from_gtin14(std::string_view gtin14);

}  // namespace rxrecon::normalize
