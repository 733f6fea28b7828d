#pragma once

#include "rxrecon/storage/repositories.h"

#include <map>

namespace rxrecon::storage {

// InMemoryPurchaseOrderRepository keeps purchase orders in a std::map keyed by id,
// so list_all and find_by_number_or_vendor iterate in id order.
class InMemoryPurchaseOrderRepository final : public IPurchaseOrderRepository {
 public:
  core::Result<bool, std::string> upsert(const domain::PurchaseOrder& purchase_order) override;
  [[nodiscard]] std::optional<domain::PurchaseOrder> get(
      const core::PurchaseOrderId& id) const override;
  [[nodiscard]] std::vector<domain::PurchaseOrder> load(
      const std::vector<core::PurchaseOrderId>& ids) const override;
  [[nodiscard]] std::vector<domain::PurchaseOrder> find_by_number_or_vendor(
      const std::optional<std::string>& po_number, const std::string& vendor_name,
      double vendor_match_threshold) const override;
  [[nodiscard]] std::vector<domain::PurchaseOrder> list_all() const override;

 private:
  std::map<core::PurchaseOrderId, domain::PurchaseOrder> purchase_orders_;
};

}  // namespace rxrecon::storage
