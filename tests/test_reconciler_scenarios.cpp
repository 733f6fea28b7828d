#include "rxrecon/domain/calendar_date.h"
#include "rxrecon/domain/invoice.h"
#include "rxrecon/domain/match_result.h"
#include "rxrecon/domain/purchase_order.h"
#include "rxrecon/domain/reconciliation_json.h"
#include "rxrecon/matching/reconciler.h"

#include <catch2/catch.hpp>

#include <algorithm>

using namespace rxrecon;
using Catch::Matchers::WithinAbs;
using domain::DiscrepancyKind;
using domain::Severity;

namespace {

const domain::CalendarDate kAsOf{2026, 3, 1};

domain::InvoiceLineItem cefazolin_line(const int number, const std::int64_t quantity) {
  domain::InvoiceLineItem item;
  item.line_number = number;
  item.identifier = "55150-0188-10";
  item.description = "Cefazolin for Injection USP 1 g vial";
  item.quantity = quantity;
  item.unit_price = 23.79;
  item.total_price = static_cast<double>(quantity) * 23.79;
  return item;
}

domain::Invoice invoice_with(std::vector<domain::InvoiceLineItem> items) {
  domain::Invoice invoice;
  invoice.invoice_number = "INV-2026-0042";
  invoice.po_number = "4500-123";
  invoice.vendor.name = "Eugia US LLC";
  invoice.items = std::move(items);
  invoice.totals.subtotal = invoice.item_total_sum();
  invoice.totals.total = invoice.totals.subtotal;
  return invoice;
}

domain::PurchaseOrderLineItem cefazolin_po_line(const int number) {
  return domain::PurchaseOrderLineItem{"55150-188-10", "Cefazolin 1 g", 48, 23.79, number,
                                       std::nullopt};
}

domain::PurchaseOrderLineItem saline_po_line(const int number) {
  return domain::PurchaseOrderLineItem{"00409-4888-02", "Sodium Chloride 0.9% 10 mL", 200, 0.42,
                                       number, std::nullopt};
}

domain::PurchaseOrder order(std::string id, std::vector<domain::PurchaseOrderLineItem> items,
                            std::string po_number = "4500-123") {
  domain::PurchaseOrder purchase_order;
  purchase_order.id = core::PurchaseOrderId{std::move(id)};
  purchase_order.po_number = std::move(po_number);
  purchase_order.vendor = "EUGIA US, LLC";
  purchase_order.items = std::move(items);
  return purchase_order;
}

std::size_t count_kind(const domain::MatchResult& result, const DiscrepancyKind kind) {
  return static_cast<std::size_t>(
      std::count_if(result.issues.begin(), result.issues.end(),
                    [kind](const domain::Discrepancy& d) { return d.kind == kind; }));
}

domain::MatchResult reconcile_ok(const domain::Invoice& invoice,
                                 const std::vector<domain::PurchaseOrder>& candidates,
                                 const matching::ReconciliationConfig& config = {}) {
  const matching::Reconciler reconciler(config);
  auto outcome = reconciler.reconcile(invoice, candidates, kAsOf);
  REQUIRE(outcome.has_value());
  return outcome.value();
}

}  // namespace

TEST_CASE("Identical single line is a confident match", "[reconciler][scenario]") {
  const auto result =
      reconcile_ok(invoice_with({cefazolin_line(1, 48)}), {order("PO-7", {cefazolin_po_line(1)})});

  REQUIRE(result.matched_purchase_order_id.has_value());
  CHECK(result.matched_purchase_order_id->value == "PO-7");
  CHECK(result.match_score >= 0.95);
  CHECK(std::none_of(result.issues.begin(), result.issues.end(),
                     [](const domain::Discrepancy& d) { return d.severity != Severity::kInfo; }));
  CHECK_FALSE(result.requires_review());
  REQUIRE(result.line_item_matches.size() == 1);
  CHECK(result.line_item_matches[0].is_pair());
}

TEST_CASE("Quantity 50 against 48 is a warning on a matched pair", "[reconciler][scenario]") {
  const auto result =
      reconcile_ok(invoice_with({cefazolin_line(1, 50)}), {order("PO-7", {cefazolin_po_line(1)})});

  REQUIRE(result.matched_purchase_order_id.has_value());
  REQUIRE(result.line_item_matches.size() == 1);
  const auto& match = result.line_item_matches[0];
  CHECK(match.is_pair());
  CHECK(match.issues == std::vector{DiscrepancyKind::kQuantityMismatch});

  REQUIRE(count_kind(result, DiscrepancyKind::kQuantityMismatch) == 1);
  const auto it = std::find_if(result.issues.begin(), result.issues.end(), [](const auto& d) {
    return d.kind == DiscrepancyKind::kQuantityMismatch;
  });
  CHECK(it->severity == Severity::kWarning);
}

TEST_CASE("No candidates yields no-confident-match and no line matches",
          "[reconciler][scenario]") {
  auto item = cefazolin_line(1, 48);
  item.identifier.reset();
  const auto result = reconcile_ok(invoice_with({item}), {});

  CHECK_FALSE(result.matched_purchase_order_id.has_value());
  CHECK_FALSE(result.best_candidate_id.has_value());
  CHECK(result.line_item_matches.empty());
  CHECK_THAT(result.match_score, WithinAbs(0.0, 1e-12));
  REQUIRE_FALSE(result.issues.empty());
  CHECK(result.issues[0].kind == DiscrepancyKind::kNoConfidentMatch);
  CHECK(count_kind(result, DiscrepancyKind::kUnmatchedInvoiceLine) == 0);
  CHECK(result.requires_review());
}

TEST_CASE("Extra PO line is reported as unmatched", "[reconciler][scenario]") {
  const auto result = reconcile_ok(invoice_with({cefazolin_line(1, 48)}),
                                   {order("PO-7", {cefazolin_po_line(1), saline_po_line(2)})});

  REQUIRE(result.matched_purchase_order_id.has_value());
  REQUIRE(result.line_item_matches.size() == 2);
  CHECK(result.line_item_matches[0].is_pair());
  CHECK_FALSE(result.line_item_matches[1].invoice_line.has_value());
  CHECK(result.line_item_matches[1].po_line == 2);
  CHECK(result.line_item_matches[1].issues == std::vector{DiscrepancyKind::kUnmatchedPoLine});
  CHECK(count_kind(result, DiscrepancyKind::kUnmatchedPoLine) == 1);
  CHECK(count_kind(result, DiscrepancyKind::kUnmatchedInvoiceLine) == 0);
}

TEST_CASE("Invoice line with no counterpart is reported as unmatched", "[reconciler]") {
  auto saline = cefazolin_line(2, 10);
  saline.identifier = "63323-0262-01";
  saline.description = "Heparin Sodium 1000 units/mL";
  saline.unit_price = 3.15;
  saline.total_price = 31.50;

  const auto result = reconcile_ok(invoice_with({cefazolin_line(1, 48), saline}),
                                   {order("PO-7", {cefazolin_po_line(1)})});

  CHECK(count_kind(result, DiscrepancyKind::kUnmatchedInvoiceLine) == 1);
  REQUIRE(result.line_item_matches.size() == 2);
  CHECK(result.line_item_matches[1].invoice_line == 2);
  CHECK_FALSE(result.line_item_matches[1].po_line.has_value());
  CHECK(result.requires_review());
}

TEST_CASE("Expired lot is an error whatever the match outcome", "[reconciler][scenario]") {
  auto item = cefazolin_line(1, 48);
  item.lot_number = "CZ2201";
  item.expiry_date = domain::CalendarDate{2026, 2, 1};
  const auto invoice = invoice_with({item});

  SECTION("with a confident match") {
    const auto result = reconcile_ok(invoice, {order("PO-7", {cefazolin_po_line(1)})});
    REQUIRE(result.matched_purchase_order_id.has_value());
    REQUIRE(count_kind(result, DiscrepancyKind::kLotExpired) == 1);
    CHECK(result.requires_review());
    const auto& match = result.line_item_matches[0];
    CHECK(std::find(match.issues.begin(), match.issues.end(), DiscrepancyKind::kLotExpired) !=
          match.issues.end());
  }

  SECTION("with no candidates") {
    const auto result = reconcile_ok(invoice, {});
    REQUIRE(count_kind(result, DiscrepancyKind::kLotExpired) == 1);
    const auto it = std::find_if(result.issues.begin(), result.issues.end(), [](const auto& d) {
      return d.kind == DiscrepancyKind::kLotExpired;
    });
    CHECK(it->severity == Severity::kError);
  }
}

TEST_CASE("Best candidate wins and every score is reported", "[reconciler]") {
  const auto invoice = invoice_with({cefazolin_line(1, 48)});
  const auto result = reconcile_ok(invoice, {order("PO-9", {saline_po_line(1)}, "4500-999"),
                                             order("PO-7", {cefazolin_po_line(1)})});

  REQUIRE(result.matched_purchase_order_id.has_value());
  CHECK(result.matched_purchase_order_id->value == "PO-7");
  CHECK(result.best_candidate_id->value == "PO-7");
  REQUIRE(result.candidate_scores.size() == 2);
  CHECK(result.candidate_scores[0].id.value == "PO-9");
  CHECK(result.candidate_scores[1].id.value == "PO-7");
  CHECK(result.candidate_scores[1].overall > result.candidate_scores[0].overall);
  CHECK_THAT(result.match_score, WithinAbs(result.candidate_scores[1].overall, 1e-12));
}

TEST_CASE("Best attempt below the threshold is returned without a match", "[reconciler]") {
  const auto invoice = invoice_with({cefazolin_line(1, 48)});
  const auto result = reconcile_ok(invoice, {order("PO-9", {saline_po_line(1)}, "4500-999")});

  CHECK_FALSE(result.matched_purchase_order_id.has_value());
  REQUIRE(result.best_candidate_id.has_value());
  CHECK(result.best_candidate_id->value == "PO-9");
  CHECK(result.match_score < 0.5);
  CHECK_THAT(result.match_score, WithinAbs(result.candidate_scores[0].overall, 1e-12));
  REQUIRE_FALSE(result.issues.empty());
  CHECK(result.issues[0].kind == DiscrepancyKind::kNoConfidentMatch);
  CHECK(result.requires_review());
}

TEST_CASE("Raising the acceptance threshold rejects a good match", "[reconciler][config]") {
  matching::ReconciliationConfig config;
  config.acceptance_threshold = 1.0;
  const auto result = reconcile_ok(invoice_with({cefazolin_line(1, 50)}),
                                   {order("PO-7", {cefazolin_po_line(1)})}, config);

  CHECK_FALSE(result.matched_purchase_order_id.has_value());
  CHECK(result.best_candidate_id->value == "PO-7");
  CHECK(result.line_item_matches.size() == 1);
}

TEST_CASE("Invalid input is rejected before matching", "[reconciler][validation]") {
  const matching::Reconciler reconciler;

  SECTION("invoice") {
    auto invoice = invoice_with({cefazolin_line(1, 48)});
    invoice.invoice_number.clear();
    auto outcome = reconciler.reconcile(invoice, {}, kAsOf);
    REQUIRE_FALSE(outcome.has_value());
    CHECK(outcome.error().code == core::InputErrorCode::kMissingInvoiceNumber);
  }

  SECTION("candidate") {
    auto bad = order("PO-7", {cefazolin_po_line(1), cefazolin_po_line(1)});
    auto outcome = reconciler.reconcile(invoice_with({cefazolin_line(1, 48)}), {bad}, kAsOf);
    REQUIRE_FALSE(outcome.has_value());
    CHECK(outcome.error().code == core::InputErrorCode::kInvalidPurchaseOrder);
  }

  SECTION("config") {
    matching::ReconciliationConfig config;
    config.line_match_floor = -1.0;
    const matching::Reconciler misconfigured(config);
    auto outcome = misconfigured.reconcile(invoice_with({cefazolin_line(1, 48)}), {}, kAsOf);
    REQUIRE_FALSE(outcome.has_value());
    CHECK(outcome.error().code == core::InputErrorCode::kInvalidConfig);
  }
}

TEST_CASE("Reconciliation is deterministic", "[reconciler][determinism]") {
  auto odd = cefazolin_line(2, 12);
  odd.identifier = "CEF-2G";
  const auto invoice = invoice_with({cefazolin_line(1, 50), odd});
  const std::vector<domain::PurchaseOrder> candidates = {
      order("PO-7", {cefazolin_po_line(1), saline_po_line(2)}),
      order("PO-8", {cefazolin_po_line(1)}, "4500-888")};

  const auto first = reconcile_ok(invoice, candidates);
  const auto second = reconcile_ok(invoice, candidates);

  CHECK(first.matched_purchase_order_id == second.matched_purchase_order_id);
  CHECK(first.match_score == second.match_score);
  CHECK(domain::match_result_to_json(first).dump() ==
        domain::match_result_to_json(second).dump());

  // Candidate order does not change the outcome.
  const std::vector<domain::PurchaseOrder> reversed(candidates.rbegin(), candidates.rend());
  const auto swapped = reconcile_ok(invoice, reversed);
  CHECK(swapped.matched_purchase_order_id == first.matched_purchase_order_id);
  CHECK(swapped.best_candidate_id == first.best_candidate_id);
  CHECK(swapped.match_score == first.match_score);
  CHECK(domain::match_result_to_json(swapped).at("issues") ==
        domain::match_result_to_json(first).at("issues"));
  CHECK(domain::match_result_to_json(swapped).at("lineItemMatches") ==
        domain::match_result_to_json(first).at("lineItemMatches"));
}

TEST_CASE("Matched pairs never exceed the shorter document", "[reconciler][coverage]") {
  const auto invoice =
      invoice_with({cefazolin_line(1, 48), cefazolin_line(2, 48), cefazolin_line(3, 50)});
  const std::vector<domain::PurchaseOrder> candidates = {
      order("PO-7", {cefazolin_po_line(1), cefazolin_po_line(2)}),
      order("PO-8", {cefazolin_po_line(1), cefazolin_po_line(2), cefazolin_po_line(3),
                     saline_po_line(4)})};

  const auto result = reconcile_ok(invoice, candidates);

  REQUIRE(result.candidate_scores.size() == 2);
  CHECK(result.candidate_scores[0].matched_lines <= 2);
  CHECK(result.candidate_scores[1].matched_lines <= 3);

  const auto pairs = std::count_if(result.line_item_matches.begin(),
                                   result.line_item_matches.end(),
                                   [](const domain::LineItemMatch& m) { return m.is_pair(); });
  REQUIRE(result.best_candidate_id.has_value());
  const std::size_t po_lines = result.best_candidate_id->value == "PO-7" ? 2 : 4;
  CHECK(static_cast<std::size_t>(pairs) <= std::min<std::size_t>(3, po_lines));

  // Each line appears in at most one pair.
  std::vector<int> invoice_lines;
  std::vector<int> po_line_refs;
  for (const auto& m : result.line_item_matches) {
    if (m.is_pair()) {
      invoice_lines.push_back(*m.invoice_line);
      po_line_refs.push_back(*m.po_line);
    }
  }
  std::sort(invoice_lines.begin(), invoice_lines.end());
  std::sort(po_line_refs.begin(), po_line_refs.end());
  CHECK(std::adjacent_find(invoice_lines.begin(), invoice_lines.end()) == invoice_lines.end());
  CHECK(std::adjacent_find(po_line_refs.begin(), po_line_refs.end()) == po_line_refs.end());
}
