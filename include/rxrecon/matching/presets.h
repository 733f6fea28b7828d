#pragma once

#include "rxrecon/matching/config.h"

namespace rxrecon::matching {

inline ReconciliationConfig default_config() {
  return ReconciliationConfig{};
}

// strict_compliance_preset leans on identifier and lot agreement and demands a higher
// overall score before a purchase order is accepted.
inline ReconciliationConfig strict_compliance_preset() {
  ReconciliationConfig config;
  config.field_weights = FieldWeights{0.55, 0.25, 0.10, 0.10};
  config.line_match_floor = 0.50;
  config.acceptance_threshold = 0.75;
  config.price_variance_tolerance = 0.01;
  config.variance_error_threshold = 0.05;
  return config;
}

}  // namespace rxrecon::matching
