#pragma once

#include "rxrecon/core/ids.h"
#include "rxrecon/domain/discrepancy.h"

#include <cstddef>
#include <optional>
#include <vector>

namespace rxrecon::domain {

// FieldScores records the per-field scores behind one pair similarity.
// lot is empty when the PO line carries no lot and the lot weight was redistributed.
struct FieldScores {
  double identifier{0.0};
  std::optional<double> lot;
  double quantity{0.0};
  double price{0.0};
  double description{0.0};
};

// LineItemMatch aligns at most one invoice line with at most one PO line.
// An empty invoice_line is an unmatched PO line; an empty po_line is an unmatched invoice line.
struct LineItemMatch {
  std::optional<int> invoice_line;
  std::optional<int> po_line;
  double similarity{0.0};
  FieldScores breakdown;
  std::vector<DiscrepancyKind> issues;  // sorted, unique

  [[nodiscard]] bool is_pair() const { return invoice_line.has_value() && po_line.has_value(); }
};

struct CandidateScore {
  core::PurchaseOrderId id;
  double overall{0.0};
  double mean_similarity{0.0};
  double header_agreement{0.0};
  double coverage{0.0};
  std::size_t matched_lines{0};
};

struct MatchResult {
  std::optional<core::PurchaseOrderId> matched_purchase_order_id;
  double match_score{0.0};
  std::vector<LineItemMatch> line_item_matches;
  std::vector<Discrepancy> issues;

  // Provenance: the best attempt even when it was not accepted, and every candidate's score
  // in evaluation order.
  std::optional<core::PurchaseOrderId> best_candidate_id;
  std::vector<CandidateScore> candidate_scores;

  // requires_review is true when nothing was accepted or any issue is an error.
  [[nodiscard]] bool requires_review() const;
};

}  // namespace rxrecon::domain
