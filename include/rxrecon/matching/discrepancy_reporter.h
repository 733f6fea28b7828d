#pragma once

#include "rxrecon/domain/calendar_date.h"
#include "rxrecon/domain/discrepancy.h"
#include "rxrecon/domain/invoice.h"
#include "rxrecon/domain/match_result.h"
#include "rxrecon/domain/purchase_order.h"
#include "rxrecon/matching/config.h"

#include <vector>

namespace rxrecon::matching {

// DiscrepancyReporter derives typed issues from an alignment.
//
// Order of the returned list:
//   1. header issues: subtotal-mismatch, po-number-mismatch
//   2. invoice lines by line number; within a line, DiscrepancyKind declaration order
//   3. unmatched PO lines by line number
// no-confident-match is not produced here; the Reconciler prepends it.
//
// candidate is null when there was no purchase order to compare against. Only the
// invoice-only checks run then (subtotal, line totals, identifier parsing, lot expiry),
// and no line is reported as unmatched.
class DiscrepancyReporter {
 public:
  explicit DiscrepancyReporter(ReconciliationConfig config = ReconciliationConfig{});

  [[nodiscard]] std::vector<domain::Discrepancy> report(
      const std::vector<domain::LineItemMatch>& line_matches, const domain::Invoice& invoice,
      const domain::PurchaseOrder* candidate, const domain::CalendarDate& as_of) const;

 private:
  ReconciliationConfig config_;

  void report_pair(const domain::InvoiceLineItem& invoice_item,
                   const domain::PurchaseOrderLineItem& po_item,
                   std::vector<domain::Discrepancy>& out) const;

  void report_invoice_only(const domain::InvoiceLineItem& invoice_item,
                           const domain::CalendarDate& as_of,
                           std::vector<domain::Discrepancy>& out) const;
};

}  // namespace rxrecon::matching
