#pragma once

#include "rxrecon/core/clock.h"
#include "rxrecon/core/id_generator.h"
#include "rxrecon/core/ids.h"
#include "rxrecon/core/result.h"
#include "rxrecon/core/services.h"
#include "rxrecon/domain/calendar_date.h"
#include "rxrecon/domain/invoice.h"
#include "rxrecon/domain/match_result.h"
#include "rxrecon/matching/config.h"
#include "rxrecon/storage/audit_event.h"

#include <optional>
#include <string>
#include <vector>

namespace rxrecon::app {

// ────────────────────────────────────────────────────────────────
// Reconciliation Pipeline
// ────────────────────────────────────────────────────────────────

struct ReconciliationRequest {
  domain::Invoice invoice;

  // Explicit candidates. Empty means infer candidates from the invoice PO number and vendor.
  std::vector<core::PurchaseOrderId> explicit_po_ids;  // NOLINT(readability-identifier-naming)

  // Reference date for lot-expiry checks; defaults to the clock's current date.
  std::optional<domain::CalendarDate> as_of;  // NOLINT(readability-identifier-naming)

  // Optional trace_id (if not provided, will be generated)
  std::optional<std::string> trace_id;  // NOLINT(readability-identifier-naming)

  matching::ReconciliationConfig config;
};

struct ReconciliationResponse {
  std::string trace_id;                              // NOLINT(readability-identifier-naming)
  domain::MatchResult match_result;                  // NOLINT(readability-identifier-naming)
  std::vector<core::PurchaseOrderId> candidate_ids;  // NOLINT(readability-identifier-naming)
  std::vector<core::PurchaseOrderId> missing_po_ids;  // NOLINT(readability-identifier-naming)
};

// Select candidates from services.purchase_orders, then reconcile.
// Emits audit events: RunStarted, CandidatesSelected, ReconciliationCompleted or
// InputRejected, RunCompleted. An invalid config or invoice is rejected before candidates
// are looked up; rejected input is returned as the error and still leaves a complete
// audit trail.
[[nodiscard]] core::Result<ReconciliationResponse, core::InputError> run_reconciliation_pipeline(
    const ReconciliationRequest& req, core::Services& services, core::IIdGenerator& id_gen,
    core::IClock& clock);

// ────────────────────────────────────────────────────────────────
// Audit Trace
// ────────────────────────────────────────────────────────────────

[[nodiscard]] std::vector<storage::AuditEvent> fetch_audit_trace(const std::string& trace_id,
                                                                 core::Services& services);

}  // namespace rxrecon::app
