#pragma once

#include "rxrecon/core/result.h"
#include "rxrecon/domain/purchase_order.h"

#include <optional>
#include <string>
#include <vector>

namespace rxrecon::storage {

// IPurchaseOrderRepository is the candidate source the engine reads from.
// Implementations return items ordered by line number.
class IPurchaseOrderRepository {
 public:
  virtual ~IPurchaseOrderRepository() = default;
  // upsert replaces the header and every item of an order with the same id.
  virtual core::Result<bool, std::string> upsert(const domain::PurchaseOrder& purchase_order) = 0;
  [[nodiscard]] virtual std::optional<domain::PurchaseOrder> get(
      const core::PurchaseOrderId& id) const = 0;

  // load returns the known orders among ids, in the order given. Unknown ids are skipped.
  [[nodiscard]] virtual std::vector<domain::PurchaseOrder> load(
      const std::vector<core::PurchaseOrderId>& ids) const = 0;

  // find_by_number_or_vendor returns orders whose PO number equals po_number (ignoring case
  // and punctuation) or whose vendor name matches vendor_name at vendor_match_threshold.
  // Results are ordered by id.
  [[nodiscard]] virtual std::vector<domain::PurchaseOrder> find_by_number_or_vendor(
      const std::optional<std::string>& po_number, const std::string& vendor_name,
      double vendor_match_threshold) const = 0;

  [[nodiscard]] virtual std::vector<domain::PurchaseOrder> list_all() const = 0;
};

// is_number_or_vendor_hit is the filter shared by repository implementations.
[[nodiscard]] bool is_number_or_vendor_hit(const domain::PurchaseOrder& purchase_order,
                                           const std::optional<std::string>& po_number,
                                           const std::string& vendor_name,
                                           double vendor_match_threshold);

}  // namespace rxrecon::storage
