#pragma once

#include "rxrecon/core/result.h"
#include "rxrecon/domain/calendar_date.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rxrecon::domain {

// Party is a trading partner as printed on a document (seller, buyer, ship-to).
struct Party {
  std::string name;
  std::string address;
  std::optional<std::string> license_number;
  std::optional<CalendarDate> license_expiry;
};

// Shipment details are informational; reconciliation does not score them.
struct Shipment {
  std::optional<CalendarDate> date_shipped;
  std::optional<std::string> carrier;
  std::optional<std::string> tracking_number;
};

struct InvoiceLineItem {
  std::string description;
  std::optional<std::string> identifier;  // NDC or GTIN as extracted
  std::optional<std::string> lot_number;
  std::optional<CalendarDate> expiry_date;
  std::int64_t quantity{0};
  double unit_price{0.0};
  double total_price{0.0};
  int line_number{0};
};

struct InvoiceTotals {
  double subtotal{0.0};
  double total{0.0};
  std::optional<double> tax;
  std::optional<double> shipping;
  std::optional<double> discount;
};

// Invoice is the structured extraction of one vendor invoice.
// Items keep their document order; line numbers are unique within the invoice.
// po_number is a hint printed on the invoice, not a guarantee.
struct Invoice {
  std::string invoice_number;
  std::optional<CalendarDate> invoice_date;
  std::optional<std::string> po_number;
  Party vendor;
  Party customer;
  Shipment shipment;
  std::vector<InvoiceLineItem> items;
  InvoiceTotals totals;
  std::optional<std::string> payment_terms;
  std::optional<CalendarDate> due_date;

  // validate rejects input the engine cannot reason about:
  // - invoice_number blank
  // - negative quantity, unit price or line total
  // - negative subtotal or total
  // - duplicate line numbers
  // The first violation found is returned; items are checked in order.
  [[nodiscard]] core::Result<bool, core::InputError> validate() const;

  // item_total_sum adds up total_price over all items.
  [[nodiscard]] double item_total_sum() const;
};

}  // namespace rxrecon::domain
