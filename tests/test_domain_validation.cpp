#include "rxrecon/core/result.h"
#include "rxrecon/domain/discrepancy.h"
#include "rxrecon/domain/invoice.h"
#include "rxrecon/domain/match_result.h"
#include "rxrecon/domain/purchase_order.h"

#include <catch2/catch.hpp>

#include <string>

using namespace rxrecon;

namespace {

domain::InvoiceLineItem line(const int number, const std::int64_t quantity, const double price) {
  domain::InvoiceLineItem item;
  item.line_number = number;
  item.description = "Cefazolin for Injection USP 1 g";
  item.quantity = quantity;
  item.unit_price = price;
  item.total_price = static_cast<double>(quantity) * price;
  return item;
}

domain::Invoice valid_invoice() {
  domain::Invoice invoice;
  invoice.invoice_number = "INV-1001";
  invoice.items = {line(1, 48, 23.79), line(2, 10, 5.00)};
  invoice.totals.subtotal = invoice.item_total_sum();
  invoice.totals.total = invoice.totals.subtotal;
  return invoice;
}

}  // namespace

TEST_CASE("Invoice::validate accepts a well-formed invoice", "[domain][validation]") {
  auto result = valid_invoice().validate();
  REQUIRE(result.has_value());
  CHECK_THAT(valid_invoice().item_total_sum(), Catch::Matchers::WithinAbs(1191.92, 1e-9));
}

TEST_CASE("Invoice::validate rejects bad input", "[domain][validation]") {
  auto invoice = valid_invoice();

  SECTION("blank invoice number") {
    invoice.invoice_number = "   ";
    auto result = invoice.validate();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == core::InputErrorCode::kMissingInvoiceNumber);
    CHECK_FALSE(result.error().line_number.has_value());
  }

  SECTION("negative quantity names the line") {
    invoice.items[1].quantity = -1;
    auto result = invoice.validate();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == core::InputErrorCode::kNegativeQuantity);
    CHECK(result.error().line_number == 2);
  }

  SECTION("negative unit price") {
    invoice.items[0].unit_price = -0.01;
    auto result = invoice.validate();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == core::InputErrorCode::kNegativePrice);
    CHECK(result.error().line_number == 1);
  }

  SECTION("negative line total") {
    invoice.items[0].total_price = -5.0;
    auto result = invoice.validate();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == core::InputErrorCode::kNegativeTotal);
  }

  SECTION("negative subtotal") {
    invoice.totals.subtotal = -1.0;
    auto result = invoice.validate();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == core::InputErrorCode::kNegativeTotal);
  }

  SECTION("duplicate line numbers") {
    invoice.items[1].line_number = 1;
    auto result = invoice.validate();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == core::InputErrorCode::kDuplicateLineNumber);
    CHECK(result.error().line_number == 1);
  }
}

TEST_CASE("PurchaseOrder::validate", "[domain][validation]") {
  domain::PurchaseOrder purchase_order;
  purchase_order.id = core::PurchaseOrderId{"PO-7"};
  purchase_order.items = {{"55150-188-10", "Cefazolin 1 g", 48, 23.79, 1, std::nullopt},
                          {"55150-0189-10", "Cefazolin 2 g", 12, 31.10, 2, std::string("L1")}};

  SECTION("valid order") {
    CHECK(purchase_order.validate().has_value());
  }

  SECTION("empty id") {
    purchase_order.id.value.clear();
    auto result = purchase_order.validate();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == core::InputErrorCode::kInvalidPurchaseOrder);
  }

  SECTION("negative quantity") {
    purchase_order.items[0].quantity = -2;
    auto result = purchase_order.validate();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == core::InputErrorCode::kInvalidPurchaseOrder);
    CHECK(result.error().line_number == 1);
  }

  SECTION("duplicate line") {
    purchase_order.items[1].line_number = 1;
    auto result = purchase_order.validate();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().message.find("PO-7") != std::string::npos);
  }
}

TEST_CASE("MatchResult::requires_review", "[domain][match_result]") {
  domain::MatchResult result;
  CHECK(result.requires_review());

  result.matched_purchase_order_id = core::PurchaseOrderId{"PO-7"};
  CHECK_FALSE(result.requires_review());

  result.issues.push_back(domain::Discrepancy{.kind = domain::DiscrepancyKind::kPriceVariance,
                                              .severity = domain::Severity::kWarning});
  CHECK_FALSE(result.requires_review());

  result.issues.push_back(domain::Discrepancy{.kind = domain::DiscrepancyKind::kLotExpired,
                                              .severity = domain::Severity::kError});
  CHECK(result.requires_review());
}

TEST_CASE("Discrepancy names are stable", "[domain][discrepancy]") {
  CHECK(std::string(domain::discrepancy_kind_to_string(
            domain::DiscrepancyKind::kLowConfidenceIdentifier)) == "low-confidence-identifier");
  CHECK(std::string(domain::discrepancy_kind_to_string(
            domain::DiscrepancyKind::kUnmatchedPoLine)) == "unmatched-po-line");
  CHECK(std::string(domain::severity_to_string(domain::Severity::kWarning)) == "warning");
  CHECK(std::string(core::input_error_code_to_string(
            core::InputErrorCode::kDuplicateLineNumber)) == "duplicate-line-number");

  CHECK(domain::is_header_kind(domain::DiscrepancyKind::kSubtotalMismatch));
  CHECK_FALSE(domain::is_header_kind(domain::DiscrepancyKind::kLotMismatch));
}
