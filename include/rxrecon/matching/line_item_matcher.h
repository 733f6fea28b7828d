#pragma once

#include "rxrecon/domain/invoice.h"
#include "rxrecon/domain/match_result.h"
#include "rxrecon/domain/purchase_order.h"
#include "rxrecon/matching/config.h"

#include <vector>

namespace rxrecon::matching {

// LineItemMatcher aligns invoice lines with the lines of one purchase order.
//
// Pair similarity is the weighted mean of the field scores in FieldScores. The lot field
// is left out (its weight spread over the others) when the PO line carries no lot.
// Assignment is greedy over the full similarity matrix: the best remaining pair is taken,
// its row and column removed, until a side runs out or the best pair falls below
// line_match_floor. Equal similarities go to the smaller invoice line number, then the
// smaller PO line number.
//
// align() is const and keeps no state between calls.
class LineItemMatcher {
 public:
  explicit LineItemMatcher(ReconciliationConfig config = ReconciliationConfig{});

  // Output: every invoice line in line-number order (paired or unmatched), then the
  // unmatched PO lines in line-number order.
  [[nodiscard]] std::vector<domain::LineItemMatch> align(
      const std::vector<domain::InvoiceLineItem>& invoice_items,
      const std::vector<domain::PurchaseOrderLineItem>& po_items) const;

  [[nodiscard]] domain::FieldScores field_scores(const domain::InvoiceLineItem& invoice_item,
                                                 const domain::PurchaseOrderLineItem& po_item) const;

  [[nodiscard]] double pair_similarity(const domain::FieldScores& scores) const;

 private:
  ReconciliationConfig config_;
};

// lot_key lowercases and drops whitespace; lots compare equal when their keys do.
[[nodiscard]] std::string lot_key(const std::string& lot);

}  // namespace rxrecon::matching
