#pragma once

#include "rxrecon/core/result.h"

#include <cstddef>
#include <string>

namespace rxrecon::matching {

// FieldWeights combine per-field scores into one invoice-line / PO-line similarity.
struct FieldWeights {
  double identifier{0.45};
  double lot{0.15};
  double quantity{0.20};
  double price{0.20};
};

// AggregateWeights combine line similarity, header agreement and coverage into the
// overall score of one candidate purchase order.
struct AggregateWeights {
  double line_similarity{0.70};  // NOLINT(readability-identifier-naming)
  double header{0.20};
  double coverage{0.10};
};

// ReconciliationConfig holds every weight and threshold the engine reads.
// It is passed by value to the components that need it and never changes afterwards.
struct ReconciliationConfig {
  FieldWeights field_weights;          // NOLINT(readability-identifier-naming)
  AggregateWeights aggregate_weights;  // NOLINT(readability-identifier-naming)

  double line_match_floor{0.35};             // pairs below this stay unmatched
  double acceptance_threshold{0.50};         // overall score needed to accept a PO
  double description_match_threshold{0.80};  // partial identifier credit needs this much
  double vendor_match_threshold{0.80};
  double price_variance_tolerance{0.02};     // relative; smaller price deltas are not reported
  double variance_error_threshold{0.10};     // relative; larger variances are errors
  double subtotal_relative_tolerance{0.01};  // NOLINT(readability-identifier-naming)
  double amount_tolerance{0.01};             // absolute currency tolerance
  std::size_t candidate_window{10};          // NOLINT(readability-identifier-naming)

  // validate rejects negative weights, a weight group that sums to zero, and any
  // threshold or tolerance outside [0, 1].
  [[nodiscard]] core::Result<bool, std::string> validate() const;
};

// config_to_json serializes a config with alphabetically sorted keys.
[[nodiscard]] std::string config_to_json(const ReconciliationConfig& config);

// config_from_json overlays the keys present in json_str onto base.
// Unknown keys are ignored. Throws nlohmann::json::exception on malformed JSON or
// wrongly typed values.
[[nodiscard]] ReconciliationConfig config_from_json(const std::string& json_str,
                                                    ReconciliationConfig base = {});

}  // namespace rxrecon::matching
