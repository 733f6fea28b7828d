#pragma once

#include "rxrecon/core/ids.h"
#include "rxrecon/domain/invoice.h"
#include "rxrecon/domain/purchase_order.h"
#include "rxrecon/matching/config.h"
#include "rxrecon/storage/repositories.h"

#include <vector>

namespace rxrecon::matching {

struct CandidateSelection {
  std::vector<domain::PurchaseOrder> candidates;
  std::vector<core::PurchaseOrderId> missing_ids;  // explicit ids the source does not know
};

// CandidateSelector decides which purchase orders an invoice is compared against.
//
// Explicit ids: exactly those orders, in the order given, duplicates collapsed to the first
// occurrence. Without ids: orders sharing the invoice's PO number or vendor, ranked
// exact PO number first, then vendor similarity (descending), then id, and cut to
// candidate_window. An empty selection is a normal outcome.
class CandidateSelector {
 public:
  explicit CandidateSelector(const storage::IPurchaseOrderRepository& repository,
                             ReconciliationConfig config = ReconciliationConfig{});

  [[nodiscard]] CandidateSelection select(
      const domain::Invoice& invoice,
      const std::vector<core::PurchaseOrderId>& explicit_po_ids) const;

 private:
  const storage::IPurchaseOrderRepository& repository_;
  ReconciliationConfig config_;

  [[nodiscard]] CandidateSelection select_explicit(
      const std::vector<core::PurchaseOrderId>& explicit_po_ids) const;
  [[nodiscard]] CandidateSelection select_inferred(const domain::Invoice& invoice) const;
};

}  // namespace rxrecon::matching
