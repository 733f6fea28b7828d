#pragma once

#include "rxrecon/domain/invoice.h"
#include "rxrecon/domain/match_result.h"
#include "rxrecon/domain/purchase_order.h"
#include "rxrecon/matching/config.h"

#include <cstddef>
#include <optional>
#include <vector>

namespace rxrecon::matching {

// CandidateChoice names the winning entry of a score list.
// best_index is empty only for an empty list; accepted tells whether the winner cleared
// the acceptance threshold.
struct CandidateChoice {
  std::optional<std::size_t> best_index;
  bool accepted{false};
};

// ScoreAggregator turns one candidate's line alignment into an overall score:
//   overall = w_line * mean pair similarity + w_header * header agreement + w_cov * coverage
// (weights normalized to sum to 1), and picks the best candidate.
class ScoreAggregator {
 public:
  explicit ScoreAggregator(ReconciliationConfig config = ReconciliationConfig{});

  [[nodiscard]] domain::CandidateScore score(
      const domain::Invoice& invoice, const domain::PurchaseOrder& candidate,
      const std::vector<domain::LineItemMatch>& line_matches) const;

  // Mean of vendor similarity and PO-number equality; vendor similarity alone when the
  // invoice declares no PO number.
  [[nodiscard]] double header_agreement(const domain::Invoice& invoice,
                                        const domain::PurchaseOrder& candidate) const;

  // Highest overall score wins; ties go to the lexicographically smaller PO id, so the
  // choice does not depend on the order of scores.
  [[nodiscard]] CandidateChoice choose(const std::vector<domain::CandidateScore>& scores) const;

 private:
  ReconciliationConfig config_;
};

// po_numbers_equal compares PO numbers ignoring case and punctuation. Blank never matches.
[[nodiscard]] bool po_numbers_equal(const std::string& a, const std::string& b);

}  // namespace rxrecon::matching
