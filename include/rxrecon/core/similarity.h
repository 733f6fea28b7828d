#pragma once

#include <cstddef>
#include <string_view>

namespace rxrecon::core {

// String similarity measures used for descriptions and vendor names.
// All scores are in [0, 1]; 1 means identical after normalization.

// levenshtein_distance counts single-byte insertions, deletions and substitutions.
[[nodiscard]] std::size_t levenshtein_distance(std::string_view a, std::string_view b);

// edit_similarity = 1 - distance / max(|a|, |b|). Two empty strings score 1.
[[nodiscard]] double edit_similarity(std::string_view a, std::string_view b);

// token_overlap = |A ∩ B| / min(|A|, |B|) over sorted unique alphanumeric tokens.
// Rewards a short PO product name fully contained in a longer invoice description.
// Returns 0 when either side has no tokens.
[[nodiscard]] double token_overlap(std::string_view a, std::string_view b);

// text_similarity = max(edit_similarity(spaced keys), token_overlap).
[[nodiscard]] double text_similarity(std::string_view a, std::string_view b);

// party_name_similarity compares organization names ignoring case and punctuation.
// 1 when one key contains the other ("Eugia US LLC" vs "EUGIA US, LLC (f/k/a ...)"),
// otherwise edit similarity of the keys. Empty names score 0.
[[nodiscard]] double party_name_similarity(std::string_view a, std::string_view b);

// names_match is party_name_similarity >= threshold.
[[nodiscard]] bool names_match(std::string_view a, std::string_view b, double threshold);

}  // namespace rxrecon::core
