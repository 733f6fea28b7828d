#include "rxrecon/app/app_service.h"

#include "rxrecon/core/version.h"
#include "rxrecon/domain/reconciliation_json.h"
#include "rxrecon/matching/candidate_selector.h"
#include "rxrecon/matching/reconciler.h"
#include "rxrecon/normalize/date_normalizer.h"

#include <nlohmann/json.hpp>

namespace rxrecon::app {

namespace {

using json = nlohmann::json;
using R = core::Result<ReconciliationResponse, core::InputError>;

json id_list(const std::vector<core::PurchaseOrderId>& ids) {
  json list = json::array();
  for (const auto& id : ids) {
    list.push_back(id.value);
  }
  return list;
}

std::vector<std::string> po_refs(const std::vector<core::PurchaseOrderId>& ids) {
  std::vector<std::string> refs;
  refs.reserve(ids.size());
  for (const auto& id : ids) {
    refs.push_back("po:" + id.value);
  }
  return refs;
}

// Records the rejection and closes the run.
R reject(const core::InputError& error, const std::string& trace_id, core::Services& services,
         core::IIdGenerator& id_gen, core::IClock& clock) {
  services.audit_log.append({id_gen.next("evt"),
                             trace_id,
                             "InputRejected",
                             domain::input_error_to_json(error).dump(),
                             clock.now_iso8601(),
                             {}});
  services.audit_log.append({id_gen.next("evt"),
                             trace_id,
                             "RunCompleted",
                             R"({"status":"rejected"})",
                             clock.now_iso8601(),
                             {}});
  return R::err(error);
}

}  // namespace

R run_reconciliation_pipeline(const ReconciliationRequest& req, core::Services& services,
                              core::IIdGenerator& id_gen, core::IClock& clock) {
  const std::string trace_id =
      req.trace_id ? *req.trace_id : core::new_trace_id(id_gen).value;
  const std::string invoice_ref = "invoice:" + req.invoice.invoice_number;

  json started;
  started["operation"] = "reconcile";
  started["build_version"] = core::kBuildVersion;
  started["invoice_number"] = req.invoice.invoice_number;
  started["explicit_po_ids"] = id_list(req.explicit_po_ids);
  started["config"] = json::parse(matching::config_to_json(req.config));
  services.audit_log.append(
      {id_gen.next("evt"), trace_id, "RunStarted", started.dump(), clock.now_iso8601(), {invoice_ref}});

  if (auto valid = req.config.validate(); !valid.has_value()) {
    return reject(core::InputError{.code = core::InputErrorCode::kInvalidConfig,
                                   .message = valid.error()},
                  trace_id, services, id_gen, clock);
  }

  // A malformed invoice is rejected before any repository lookup.
  if (auto valid = req.invoice.validate(); !valid.has_value()) {
    return reject(valid.error(), trace_id, services, id_gen, clock);
  }

  std::optional<domain::CalendarDate> as_of = req.as_of;
  if (!as_of) {
    as_of = normalize::normalize_date(clock.today_iso());
  }
  if (!as_of) {
    return reject(core::InputError{.code = core::InputErrorCode::kInvalidConfig,
                                   .message = "clock returned an unreadable date: " +
                                              clock.now_iso8601()},
                  trace_id, services, id_gen, clock);
  }

  const matching::CandidateSelector selector(services.purchase_orders, req.config);
  auto selection = selector.select(req.invoice, req.explicit_po_ids);

  ReconciliationResponse response;
  response.trace_id = trace_id;
  response.missing_po_ids = selection.missing_ids;
  for (const auto& candidate : selection.candidates) {
    response.candidate_ids.push_back(candidate.id);
  }

  json selected;
  selected["mode"] = req.explicit_po_ids.empty() ? "inferred" : "explicit";
  selected["candidate_ids"] = id_list(response.candidate_ids);
  selected["missing_ids"] = id_list(response.missing_po_ids);
  services.audit_log.append({id_gen.next("evt"), trace_id, "CandidatesSelected", selected.dump(),
                             clock.now_iso8601(), po_refs(response.candidate_ids)});

  const matching::Reconciler reconciler(req.config);
  auto outcome = reconciler.reconcile(req.invoice, selection.candidates, *as_of);
  if (!outcome.has_value()) {
    return reject(outcome.error(), trace_id, services, id_gen, clock);
  }
  response.match_result = outcome.value();

  const auto& result = response.match_result;
  json completed;
  completed["as_of"] = as_of->to_iso();
  completed["matched_purchase_order_id"] =
      result.matched_purchase_order_id ? json(result.matched_purchase_order_id->value) : json();
  completed["match_score"] = result.match_score;
  completed["issue_count"] = result.issues.size();
  completed["requires_review"] = result.requires_review();

  std::vector<std::string> refs{invoice_ref};
  if (result.best_candidate_id) {
    refs.push_back("po:" + result.best_candidate_id->value);
  }
  services.audit_log.append({id_gen.next("evt"), trace_id, "ReconciliationCompleted",
                             completed.dump(), clock.now_iso8601(), refs});

  services.audit_log.append({id_gen.next("evt"),
                             trace_id,
                             "RunCompleted",
                             R"({"status":"success"})",
                             clock.now_iso8601(),
                             {}});

  return R::ok(std::move(response));
}

std::vector<storage::AuditEvent> fetch_audit_trace(const std::string& trace_id,
                                                   core::Services& services) {
  return services.audit_log.query(trace_id);
}

}  // namespace rxrecon::app
