#include "rxrecon/app/app_service.h"
#include "rxrecon/core/clock.h"
#include "rxrecon/core/id_generator.h"
#include "rxrecon/storage/audit_log.h"
#include "rxrecon/storage/inmemory_purchase_order_repository.h"

#include <nlohmann/json.hpp>

#include <catch2/catch.hpp>

#include <algorithm>

using namespace rxrecon;

namespace {

domain::Invoice sample_invoice() {
  domain::Invoice invoice;
  invoice.invoice_number = "INV-2026-0042";
  invoice.po_number = "4500-123";
  invoice.vendor.name = "Eugia US LLC";

  domain::InvoiceLineItem item;
  item.line_number = 1;
  item.identifier = "55150-0188-10";
  item.description = "Cefazolin for Injection USP 1 g vial";
  item.lot_number = "LOT-7";
  item.expiry_date = domain::CalendarDate{2026, 2, 15};
  item.quantity = 48;
  item.unit_price = 23.79;
  item.total_price = 48 * 23.79;
  invoice.items.push_back(item);

  invoice.totals.subtotal = invoice.item_total_sum();
  invoice.totals.total = invoice.totals.subtotal;
  return invoice;
}

void seed(storage::IPurchaseOrderRepository& repo) {
  domain::PurchaseOrder matching_po;
  matching_po.id = core::PurchaseOrderId{"PO-1"};
  matching_po.po_number = "4500123";
  matching_po.vendor = "EUGIA US, LLC";
  matching_po.items = {{"55150-188-10", "Cefazolin 1 g", 48, 23.79, 1, "LOT-7"}};
  REQUIRE(repo.upsert(matching_po).has_value());

  domain::PurchaseOrder unrelated_po;
  unrelated_po.id = core::PurchaseOrderId{"PO-2"};
  unrelated_po.po_number = "9900-001";
  unrelated_po.vendor = "Cardinal Health";
  unrelated_po.items = {{"00409-4888-02", "Sodium Chloride", 200, 0.42, 1, std::nullopt}};
  REQUIRE(repo.upsert(unrelated_po).has_value());
}

std::vector<std::string> event_types(const std::vector<storage::AuditEvent>& events) {
  std::vector<std::string> types;
  types.reserve(events.size());
  for (const auto& event : events) {
    types.push_back(event.event_type);
  }
  return types;
}

// Counts repository reads so a test can assert that none happened.
class CountingPurchaseOrderRepository final : public storage::IPurchaseOrderRepository {
 public:
  explicit CountingPurchaseOrderRepository(storage::IPurchaseOrderRepository& inner)
      : inner_(inner) {}

  core::Result<bool, std::string> upsert(const domain::PurchaseOrder& purchase_order) override {
    return inner_.upsert(purchase_order);
  }
  [[nodiscard]] std::optional<domain::PurchaseOrder> get(
      const core::PurchaseOrderId& id) const override {
    ++reads_;
    return inner_.get(id);
  }
  [[nodiscard]] std::vector<domain::PurchaseOrder> load(
      const std::vector<core::PurchaseOrderId>& ids) const override {
    ++reads_;
    return inner_.load(ids);
  }
  [[nodiscard]] std::vector<domain::PurchaseOrder> find_by_number_or_vendor(
      const std::optional<std::string>& po_number, const std::string& vendor_name,
      double vendor_match_threshold) const override {
    ++reads_;
    return inner_.find_by_number_or_vendor(po_number, vendor_name, vendor_match_threshold);
  }
  [[nodiscard]] std::vector<domain::PurchaseOrder> list_all() const override {
    ++reads_;
    return inner_.list_all();
  }

  [[nodiscard]] int reads() const { return reads_; }

 private:
  storage::IPurchaseOrderRepository& inner_;
  mutable int reads_{0};
};

bool has_kind(const domain::MatchResult& result, const domain::DiscrepancyKind kind) {
  return std::any_of(result.issues.begin(), result.issues.end(),
                     [kind](const domain::Discrepancy& d) { return d.kind == kind; });
}

}  // namespace

TEST_CASE("app_service: run_reconciliation_pipeline infers candidates and audits the run",
          "[app_service][reconcile]") {
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-03-01T09:30:00Z");
  storage::InMemoryPurchaseOrderRepository po_repo;
  storage::InMemoryAuditLog audit_log;
  core::Services services{po_repo, audit_log};
  seed(po_repo);

  app::ReconciliationRequest request;
  request.invoice = sample_invoice();
  request.as_of = domain::CalendarDate{2026, 1, 1};

  auto outcome = app::run_reconciliation_pipeline(request, services, id_gen, clock);
  REQUIRE(outcome.has_value());
  const auto& response = outcome.value();

  CHECK(response.trace_id == "trace-0001");
  REQUIRE(response.candidate_ids.size() == 1);
  CHECK(response.candidate_ids[0].value == "PO-1");
  CHECK(response.missing_po_ids.empty());

  const auto& result = response.match_result;
  REQUIRE(result.matched_purchase_order_id.has_value());
  CHECK(result.matched_purchase_order_id->value == "PO-1");
  CHECK(result.match_score > 0.9);
  CHECK_FALSE(result.requires_review());

  auto events = app::fetch_audit_trace(response.trace_id, services);
  CHECK(event_types(events) == std::vector<std::string>{"RunStarted", "CandidatesSelected",
                                                         "ReconciliationCompleted",
                                                         "RunCompleted"});
  CHECK(events[0].event_id == "evt-0001");
  CHECK(events[0].created_at == "2026-03-01T09:30:00Z");
  CHECK(events[0].refs == std::vector<std::string>{"invoice:INV-2026-0042"});

  const auto started = nlohmann::json::parse(events[0].payload);
  CHECK(started.at("operation") == "reconcile");
  CHECK(started.at("invoice_number") == "INV-2026-0042");
  CHECK(started.at("config").contains("acceptance_threshold"));

  const auto selected = nlohmann::json::parse(events[1].payload);
  CHECK(selected.at("mode") == "inferred");
  CHECK(events[1].refs == std::vector<std::string>{"po:PO-1"});

  const auto completed = nlohmann::json::parse(events[2].payload);
  CHECK(completed.at("as_of") == "2026-01-01");
  CHECK(completed.at("matched_purchase_order_id") == "PO-1");
  CHECK(completed.at("requires_review") == false);

  CHECK(nlohmann::json::parse(events[3].payload).at("status") == "success");
}

TEST_CASE("app_service: as_of defaults to the clock date", "[app_service][reconcile]") {
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-03-01T09:30:00Z");
  storage::InMemoryPurchaseOrderRepository po_repo;
  storage::InMemoryAuditLog audit_log;
  core::Services services{po_repo, audit_log};
  seed(po_repo);

  app::ReconciliationRequest request;
  request.invoice = sample_invoice();

  auto outcome = app::run_reconciliation_pipeline(request, services, id_gen, clock);
  REQUIRE(outcome.has_value());

  // The lot expired on 2026-02-15, before the clock date.
  const auto& result = outcome.value().match_result;
  CHECK(has_kind(result, domain::DiscrepancyKind::kLotExpired));
  CHECK(result.requires_review());

  auto events = app::fetch_audit_trace(outcome.value().trace_id, services);
  REQUIRE(events.size() == 4);
  CHECK(nlohmann::json::parse(events[2].payload).at("as_of") == "2026-03-01");
}

TEST_CASE("app_service: explicit ids report missing orders", "[app_service][reconcile]") {
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-03-01T09:30:00Z");
  storage::InMemoryPurchaseOrderRepository po_repo;
  storage::InMemoryAuditLog audit_log;
  core::Services services{po_repo, audit_log};
  seed(po_repo);

  app::ReconciliationRequest request;
  request.invoice = sample_invoice();
  request.as_of = domain::CalendarDate{2026, 1, 1};
  request.trace_id = "trace-fixed";
  request.explicit_po_ids = {core::PurchaseOrderId{"PO-2"}, core::PurchaseOrderId{"PO-9"}};

  auto outcome = app::run_reconciliation_pipeline(request, services, id_gen, clock);
  REQUIRE(outcome.has_value());
  const auto& response = outcome.value();

  CHECK(response.trace_id == "trace-fixed");
  REQUIRE(response.candidate_ids.size() == 1);
  CHECK(response.candidate_ids[0].value == "PO-2");
  REQUIRE(response.missing_po_ids.size() == 1);
  CHECK(response.missing_po_ids[0].value == "PO-9");

  // Only the unrelated order was offered, so nothing is accepted.
  CHECK_FALSE(response.match_result.matched_purchase_order_id.has_value());
  CHECK(response.match_result.requires_review());

  auto events = app::fetch_audit_trace("trace-fixed", services);
  REQUIRE(events.size() == 4);
  const auto selected = nlohmann::json::parse(events[1].payload);
  CHECK(selected.at("mode") == "explicit");
  CHECK(selected.at("missing_ids") == nlohmann::json::array({"PO-9"}));

  // A supplied trace id does not consume a generated one.
  CHECK(events[0].event_id == "evt-0001");
  CHECK(id_gen.next("trace") == "trace-0001");
}

TEST_CASE("app_service: invalid config is rejected with a complete trail",
          "[app_service][reconcile]") {
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-03-01T09:30:00Z");
  storage::InMemoryPurchaseOrderRepository po_repo;
  storage::InMemoryAuditLog audit_log;
  core::Services services{po_repo, audit_log};
  seed(po_repo);

  app::ReconciliationRequest request;
  request.invoice = sample_invoice();
  request.config.field_weights.quantity = -1.0;

  auto outcome = app::run_reconciliation_pipeline(request, services, id_gen, clock);
  REQUIRE_FALSE(outcome.has_value());
  CHECK(outcome.error().code == core::InputErrorCode::kInvalidConfig);

  auto events = app::fetch_audit_trace("trace-0001", services);
  CHECK(event_types(events) ==
        std::vector<std::string>{"RunStarted", "InputRejected", "RunCompleted"});
  CHECK(nlohmann::json::parse(events[2].payload).at("status") == "rejected");
}

TEST_CASE("app_service: invalid invoice is rejected before candidate lookup",
          "[app_service][reconcile]") {
  core::DeterministicIdGenerator id_gen;
  core::FixedClock clock("2026-03-01T09:30:00Z");
  storage::InMemoryPurchaseOrderRepository backing_repo;
  seed(backing_repo);
  CountingPurchaseOrderRepository po_repo(backing_repo);
  storage::InMemoryAuditLog audit_log;
  core::Services services{po_repo, audit_log};

  app::ReconciliationRequest request;
  request.invoice = sample_invoice();
  request.invoice.items[0].quantity = -1;

  auto outcome = app::run_reconciliation_pipeline(request, services, id_gen, clock);
  REQUIRE_FALSE(outcome.has_value());
  CHECK(outcome.error().code == core::InputErrorCode::kNegativeQuantity);
  CHECK(po_repo.reads() == 0);

  auto events = app::fetch_audit_trace("trace-0001", services);
  CHECK(event_types(events) ==
        std::vector<std::string>{"RunStarted", "InputRejected", "RunCompleted"});
}
