#include "rxrecon/domain/match_result.h"

#include <algorithm>

namespace rxrecon::domain {

bool MatchResult::requires_review() const {
  if (!matched_purchase_order_id.has_value()) {
    return true;
  }
  return std::any_of(issues.begin(), issues.end(),
                     [](const Discrepancy& d) { return d.severity == Severity::kError; });
}

}  // namespace rxrecon::domain
