#include "reconcile_logic.h"

#include "rxrecon/core/ids.h"
#include "rxrecon/domain/reconciliation_json.h"
#include "rxrecon/storage/audit_event.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

int run_reconcile(rxrecon::core::Services& services, rxrecon::core::IIdGenerator& id_gen,
                  rxrecon::core::IClock& clock,
                  const std::vector<rxrecon::domain::PurchaseOrder>& purchase_orders,
                  const rxrecon::app::ReconciliationRequest& request, const bool show_audit) {
  for (const auto& purchase_order : purchase_orders) {
    if (auto valid = purchase_order.validate(); !valid.has_value()) {
      std::cerr << "Rejected purchase order " << purchase_order.id.value << ": "
                << valid.error().message << "\n";
      return kExitInputError;
    }
    if (auto stored = services.purchase_orders.upsert(purchase_order); !stored.has_value()) {
      std::cerr << "Failed to store purchase order " << purchase_order.id.value << ": "
                << stored.error() << "\n";
      return kExitInputError;
    }
  }

  // The trace is fixed up front so a rejected run can still be printed.
  rxrecon::app::ReconciliationRequest traced = request;
  if (!traced.trace_id.has_value()) {
    traced.trace_id = rxrecon::core::new_trace_id(id_gen).value;
  }
  const std::string trace_id = *traced.trace_id;

  const auto outcome = rxrecon::app::run_reconciliation_pipeline(traced, services, id_gen, clock);

  int exit_code = kExitConfidentMatch;
  if (outcome.has_value()) {
    const auto& response = outcome.value();

    for (const auto& missing : response.missing_po_ids) {
      std::cerr << "Warning: purchase order not found: " << missing.value << "\n";
    }

    nlohmann::json out = rxrecon::domain::match_result_to_json(response.match_result);
    out["traceId"] = response.trace_id;
    out["requiresReview"] = response.match_result.requires_review();
    std::cout << out.dump(2) << "\n";

    if (response.match_result.requires_review()) {
      exit_code = kExitReviewRequired;
    }
  } else {
    std::cerr << "Input rejected: " << rxrecon::domain::input_error_to_json(outcome.error()).dump()
              << "\n";
    exit_code = kExitInputError;
  }

  if (show_audit) {
    std::cout << "\n--- Audit Trail (trace_id=" << trace_id << ") ---\n";
    for (const auto& event : rxrecon::app::fetch_audit_trace(trace_id, services)) {
      std::cout << event.created_at << " [" << event.event_type << "] " << event.payload << "\n";
    }
  }

  return exit_code;
}
