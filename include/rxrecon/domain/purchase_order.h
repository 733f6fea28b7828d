#pragma once

#include "rxrecon/core/ids.h"
#include "rxrecon/core/result.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rxrecon::domain {

struct PurchaseOrderLineItem {
  std::string identifier;  // NDC or GTIN as recorded on the order
  std::string description;
  std::int64_t quantity{0};  // ordered quantity
  double unit_price{0.0};
  int line_number{0};
  std::optional<std::string> lot_number;
};

// PurchaseOrder is a candidate the invoice may be billing against.
// The id belongs to whatever system stores the order; the engine never interprets it.
struct PurchaseOrder {
  core::PurchaseOrderId id;
  std::string po_number;
  std::string vendor;
  std::vector<PurchaseOrderLineItem> items;

  // validate reports kInvalidPurchaseOrder for an empty id, a negative quantity or price,
  // or a repeated line number. line_number on the error names the PO line.
  [[nodiscard]] core::Result<bool, core::InputError> validate() const;
};

}  // namespace rxrecon::domain
