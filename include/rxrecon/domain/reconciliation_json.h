#pragma once

#include "rxrecon/core/result.h"
#include "rxrecon/domain/identifier.h"
#include "rxrecon/domain/invoice.h"
#include "rxrecon/domain/match_result.h"
#include "rxrecon/domain/purchase_order.h"

#include <nlohmann/json.hpp>

#include <vector>

namespace rxrecon::domain {

// JSON adapters for the extraction format (camelCase keys) and the MatchResult report.
// Readers throw std::runtime_error naming the offending field, or nlohmann::json::exception
// for type errors. Amounts and quantities may be JSON numbers or strings like "$1,141.92".
// Dates use the formats normalize_date accepts; unreadable dates become absent.

// invoice_from_json reads invoiceNumber, invoiceDate, poNumber, vendor, customer, shipment,
// items (or products), totals, paymentTerms, dueDate. Item identifiers come from
// "identifier", "ndc" or "gtin", first non-empty wins. A missing lineNumber defaults to the
// 1-based position.
[[nodiscard]] Invoice invoice_from_json(const nlohmann::json& j);

// purchase_order_from_json reads id, poNumber, vendor (string or {name}) and items with
// lineNumber, identifier/ndc/gtin, description (or productName), quantity, unitPrice, lotNumber.
[[nodiscard]] PurchaseOrder purchase_order_from_json(const nlohmann::json& j);

// purchase_orders_from_json accepts an array, {"purchaseOrders": [...]} or a single order.
[[nodiscard]] std::vector<PurchaseOrder> purchase_orders_from_json(const nlohmann::json& j);

[[nodiscard]] nlohmann::json purchase_order_to_json(const PurchaseOrder& purchase_order);

[[nodiscard]] nlohmann::json canonical_identifier_to_json(const CanonicalIdentifier& identifier);

[[nodiscard]] nlohmann::json discrepancy_to_json(const Discrepancy& discrepancy);

// match_result_to_json emits matchedPurchaseOrderId, matchScore, lineItemMatches, issues,
// bestCandidateId and candidateScores. Absent optionals are null.
[[nodiscard]] nlohmann::json match_result_to_json(const MatchResult& result);

[[nodiscard]] nlohmann::json input_error_to_json(const core::InputError& error);

}  // namespace rxrecon::domain
