#pragma once

#include "rxrecon/app/app_service.h"
#include "rxrecon/core/clock.h"
#include "rxrecon/core/id_generator.h"
#include "rxrecon/core/services.h"
#include "rxrecon/domain/purchase_order.h"

#include <vector>

// Exit codes of the reconcile subcommand.
inline constexpr int kExitConfidentMatch = 0;
inline constexpr int kExitInputError = 1;
inline constexpr int kExitReviewRequired = 2;

// run_reconcile stores purchase_orders through services.purchase_orders, runs the pipeline
// and prints the MatchResult JSON (plus the audit trail when show_audit is set).
// Takes only interface types; no concrete storage headers may be included in this TU.
int run_reconcile(rxrecon::core::Services& services, rxrecon::core::IIdGenerator& id_gen,
                  rxrecon::core::IClock& clock,
                  const std::vector<rxrecon::domain::PurchaseOrder>& purchase_orders,
                  const rxrecon::app::ReconciliationRequest& request, bool show_audit);
