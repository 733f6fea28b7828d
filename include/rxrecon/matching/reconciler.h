#pragma once

#include "rxrecon/core/result.h"
#include "rxrecon/domain/calendar_date.h"
#include "rxrecon/domain/invoice.h"
#include "rxrecon/domain/match_result.h"
#include "rxrecon/domain/purchase_order.h"
#include "rxrecon/matching/config.h"
#include "rxrecon/matching/discrepancy_reporter.h"
#include "rxrecon/matching/line_item_matcher.h"
#include "rxrecon/matching/score_aggregator.h"

#include <vector>

namespace rxrecon::matching {

// Reconciler matches one invoice against an already loaded list of candidate purchase orders.
//
// 1. Validates the config, the invoice and every candidate; the first problem is returned
//    as an InputError and nothing is matched.
// 2. Aligns and scores each candidate, in the order given.
// 3. Chooses the best candidate, reports discrepancies against it and folds every
//    line-level kind back into the corresponding LineItemMatch.
//
// A best score below acceptance_threshold still returns the best attempt's lines and
// issues, with no matched id and a leading no-confident-match. With no candidates the
// result has no line matches, score 0, no-confident-match and the invoice-only issues.
//
// reconcile() is const; one Reconciler may serve concurrent calls.
class Reconciler {
 public:
  explicit Reconciler(ReconciliationConfig config = ReconciliationConfig{});

  [[nodiscard]] core::Result<domain::MatchResult, core::InputError> reconcile(
      const domain::Invoice& invoice, const std::vector<domain::PurchaseOrder>& candidates,
      const domain::CalendarDate& as_of) const;

  [[nodiscard]] const ReconciliationConfig& config() const { return config_; }

 private:
  ReconciliationConfig config_;
  LineItemMatcher matcher_;
  ScoreAggregator aggregator_;
  DiscrepancyReporter reporter_;
};

}  // namespace rxrecon::matching
