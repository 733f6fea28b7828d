#include "rxrecon/domain/reconciliation_json.h"

#include "rxrecon/core/normalization.h"
#include "rxrecon/normalize/date_normalizer.h"
#include "rxrecon/normalize/numeric_parser.h"

#include <stdexcept>
#include <type_traits>

namespace rxrecon::domain {

namespace {

using json = nlohmann::json;

std::optional<std::string> optional_string(const json& j, const char* key) {
  if (!j.contains(key) || j.at(key).is_null()) {
    return std::nullopt;
  }
  const json& value = j.at(key);
  if (value.is_number_integer()) {
    return std::to_string(value.get<long long>());
  }
  return value.get<std::string>();
}

std::string string_or_empty(const json& j, const char* key) {
  return optional_string(j, key).value_or("");
}

std::optional<CalendarDate> optional_date(const json& j, const char* key) {
  const auto text = optional_string(j, key);
  if (!text) {
    return std::nullopt;
  }
  return normalize::normalize_date(*text);
}

std::optional<double> optional_amount(const json& j, const char* key, const std::string& where) {
  if (!j.contains(key) || j.at(key).is_null()) {
    return std::nullopt;
  }
  const json& value = j.at(key);
  if (value.is_number()) {
    return value.get<double>();
  }
  const auto parsed = normalize::parse_decimal(value.get<std::string>());
  if (!parsed) {
    throw std::runtime_error(where + "." + key + ": not a number: " + value.dump());
  }
  return parsed;
}

double amount_or_zero(const json& j, const char* key, const std::string& where) {
  return optional_amount(j, key, where).value_or(0.0);
}

std::int64_t quantity_or_zero(const json& j, const char* key, const std::string& where) {
  if (!j.contains(key) || j.at(key).is_null()) {
    return 0;
  }
  const json& value = j.at(key);
  std::optional<std::int64_t> parsed;
  if (value.is_number_integer()) {
    parsed = value.get<std::int64_t>();
  } else if (value.is_number()) {
    parsed = normalize::parse_quantity(value.dump());
  } else {
    parsed = normalize::parse_quantity(value.get<std::string>());
  }
  if (!parsed) {
    throw std::runtime_error(where + "." + key + ": not a whole number: " + value.dump());
  }
  return *parsed;
}

std::optional<std::string> first_identifier(const json& j) {
  for (const char* key : {"identifier", "ndc", "gtin"}) {
    auto value = optional_string(j, key);
    if (value && !core::trim(*value).empty()) {
      return value;
    }
  }
  return std::nullopt;
}

Party party_from_json(const json& j) {
  Party party;
  if (j.is_string()) {
    party.name = j.get<std::string>();
    return party;
  }
  party.name = string_or_empty(j, "name");
  party.address = string_or_empty(j, "address");
  party.license_number = optional_string(j, "licenseNumber");
  party.license_expiry = optional_date(j, "licenseExpiry");
  return party;
}

template <typename T>
json optional_to_json(const std::optional<T>& value) {
  if (!value) {
    return nullptr;
  }
  if constexpr (std::is_same_v<T, core::PurchaseOrderId>) {
    return value->value;
  } else {
    return *value;
  }
}

}  // namespace

Invoice invoice_from_json(const json& j) {
  Invoice invoice;
  invoice.invoice_number = string_or_empty(j, "invoiceNumber");
  invoice.invoice_date = optional_date(j, "invoiceDate");
  invoice.po_number = optional_string(j, "poNumber");
  if (j.contains("vendor")) {
    invoice.vendor = party_from_json(j.at("vendor"));
  }
  if (j.contains("customer")) {
    invoice.customer = party_from_json(j.at("customer"));
  }
  if (j.contains("shipment")) {
    const json& shipment = j.at("shipment");
    invoice.shipment.date_shipped = optional_date(shipment, "dateShipped");
    invoice.shipment.carrier = optional_string(shipment, "carrier");
    invoice.shipment.tracking_number = optional_string(shipment, "trackingNumber");
  }

  const char* items_key = j.contains("items") ? "items" : "products";
  if (j.contains(items_key)) {
    const json& items = j.at(items_key);
    for (std::size_t i = 0; i < items.size(); ++i) {
      const json& item_json = items.at(i);
      const std::string where = std::string(items_key) + "[" + std::to_string(i) + "]";

      InvoiceLineItem item;
      item.description = string_or_empty(item_json, "description");
      item.identifier = first_identifier(item_json);
      item.lot_number = optional_string(item_json, "lotNumber");
      item.expiry_date = optional_date(item_json, "expiryDate");
      item.quantity = quantity_or_zero(item_json, "quantity", where);
      item.unit_price = amount_or_zero(item_json, "unitPrice", where);
      item.total_price = amount_or_zero(item_json, "totalPrice", where);
      item.line_number = item_json.value("lineNumber", static_cast<int>(i) + 1);
      invoice.items.push_back(std::move(item));
    }
  }

  if (j.contains("totals")) {
    const json& totals = j.at("totals");
    invoice.totals.subtotal = amount_or_zero(totals, "subtotal", "totals");
    invoice.totals.total = amount_or_zero(totals, "total", "totals");
    invoice.totals.tax = optional_amount(totals, "tax", "totals");
    invoice.totals.shipping = optional_amount(totals, "shipping", "totals");
    invoice.totals.discount = optional_amount(totals, "discount", "totals");
  }

  invoice.payment_terms = optional_string(j, "paymentTerms");
  invoice.due_date = optional_date(j, "dueDate");
  return invoice;
}

PurchaseOrder purchase_order_from_json(const json& j) {
  PurchaseOrder purchase_order;
  purchase_order.id = core::PurchaseOrderId{string_or_empty(j, "id")};
  purchase_order.po_number = string_or_empty(j, "poNumber");
  if (j.contains("vendor")) {
    purchase_order.vendor = party_from_json(j.at("vendor")).name;
  }

  if (j.contains("items")) {
    const json& items = j.at("items");
    for (std::size_t i = 0; i < items.size(); ++i) {
      const json& item_json = items.at(i);
      const std::string where =
          "purchase order '" + purchase_order.id.value + "' items[" + std::to_string(i) + "]";

      PurchaseOrderLineItem item;
      item.identifier = first_identifier(item_json).value_or("");
      item.description = item_json.contains("description")
                             ? string_or_empty(item_json, "description")
                             : string_or_empty(item_json, "productName");
      item.quantity = quantity_or_zero(item_json, "quantity", where);
      item.unit_price = amount_or_zero(item_json, "unitPrice", where);
      item.line_number = item_json.value("lineNumber", static_cast<int>(i) + 1);
      item.lot_number = optional_string(item_json, "lotNumber");
      purchase_order.items.push_back(std::move(item));
    }
  }
  return purchase_order;
}

std::vector<PurchaseOrder> purchase_orders_from_json(const json& j) {
  const json* list = &j;
  if (j.is_object() && j.contains("purchaseOrders")) {
    list = &j.at("purchaseOrders");
  } else if (j.is_object()) {
    return {purchase_order_from_json(j)};
  }
  if (!list->is_array()) {
    throw std::runtime_error("purchase orders: expected an array");
  }

  std::vector<PurchaseOrder> result;
  result.reserve(list->size());
  for (const auto& entry : *list) {
    result.push_back(purchase_order_from_json(entry));
  }
  return result;
}

json purchase_order_to_json(const PurchaseOrder& purchase_order) {
  json items = json::array();
  for (const auto& item : purchase_order.items) {
    items.push_back({{"lineNumber", item.line_number},
                     {"identifier", item.identifier},
                     {"description", item.description},
                     {"quantity", item.quantity},
                     {"unitPrice", item.unit_price},
                     {"lotNumber", optional_to_json(item.lot_number)}});
  }
  return {{"id", purchase_order.id.value},
          {"poNumber", purchase_order.po_number},
          {"vendor", purchase_order.vendor},
          {"items", items}};
}

json canonical_identifier_to_json(const CanonicalIdentifier& identifier) {
  json j;
  j["kind"] = identifier.kind_name();
  j["key"] = identifier.key();
  j["lowConfidence"] = identifier.low_confidence;
  if (const auto* gtin = std::get_if<Gtin>(&identifier.value)) {
    j["gtin"] = gtin->digits;
  }
  return j;
}

json discrepancy_to_json(const Discrepancy& discrepancy) {
  return {{"kind", discrepancy_kind_to_string(discrepancy.kind)},
          {"severity", severity_to_string(discrepancy.severity)},
          {"invoiceLine", optional_to_json(discrepancy.invoice_line)},
          {"poLine", optional_to_json(discrepancy.po_line)},
          {"detail", discrepancy.detail}};
}

json match_result_to_json(const MatchResult& result) {
  json line_matches = json::array();
  for (const auto& match : result.line_item_matches) {
    json issues = json::array();
    for (const auto kind : match.issues) {
      issues.push_back(discrepancy_kind_to_string(kind));
    }
    const FieldScores& b = match.breakdown;
    line_matches.push_back({{"invoiceLineRef", optional_to_json(match.invoice_line)},
                            {"poLineRef", optional_to_json(match.po_line)},
                            {"similarity", match.similarity},
                            {"breakdown",
                             {{"identifier", b.identifier},
                              {"lot", optional_to_json(b.lot)},
                              {"quantity", b.quantity},
                              {"price", b.price},
                              {"description", b.description}}},
                            {"issues", issues}});
  }

  json issues = json::array();
  for (const auto& issue : result.issues) {
    issues.push_back(discrepancy_to_json(issue));
  }

  json scores = json::array();
  for (const auto& score : result.candidate_scores) {
    scores.push_back({{"id", score.id.value},
                      {"overall", score.overall},
                      {"meanSimilarity", score.mean_similarity},
                      {"headerAgreement", score.header_agreement},
                      {"coverage", score.coverage},
                      {"matchedLines", score.matched_lines}});
  }

  json j;
  j["matchedPurchaseOrderId"] = optional_to_json(result.matched_purchase_order_id);
  j["matchScore"] = result.match_score;
  j["lineItemMatches"] = line_matches;
  j["issues"] = issues;
  j["bestCandidateId"] = optional_to_json(result.best_candidate_id);
  j["candidateScores"] = scores;
  return j;
}

json input_error_to_json(const core::InputError& error) {
  return {{"code", core::input_error_code_to_string(error.code)},
          {"message", error.message},
          {"lineNumber", optional_to_json(error.line_number)}};
}

}  // namespace rxrecon::domain
