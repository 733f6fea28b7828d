#include "rxrecon/storage/inmemory_purchase_order_repository.h"

#include <algorithm>

namespace rxrecon::storage {

core::Result<bool, std::string> InMemoryPurchaseOrderRepository::upsert(
    const domain::PurchaseOrder& purchase_order) {
  domain::PurchaseOrder stored = purchase_order;
  std::stable_sort(stored.items.begin(), stored.items.end(),
                   [](const auto& a, const auto& b) { return a.line_number < b.line_number; });
  purchase_orders_[stored.id] = std::move(stored);
  return core::Result<bool, std::string>::ok(true);
}

std::optional<domain::PurchaseOrder> InMemoryPurchaseOrderRepository::get(
    const core::PurchaseOrderId& id) const {
  auto it = purchase_orders_.find(id);
  if (it != purchase_orders_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::vector<domain::PurchaseOrder> InMemoryPurchaseOrderRepository::load(
    const std::vector<core::PurchaseOrderId>& ids) const {
  std::vector<domain::PurchaseOrder> result;
  result.reserve(ids.size());
  for (const auto& id : ids) {
    auto it = purchase_orders_.find(id);
    if (it != purchase_orders_.end()) {
      result.push_back(it->second);
    }
  }
  return result;
}

std::vector<domain::PurchaseOrder> InMemoryPurchaseOrderRepository::find_by_number_or_vendor(
    const std::optional<std::string>& po_number, const std::string& vendor_name,
    const double vendor_match_threshold) const {
  std::vector<domain::PurchaseOrder> result;
  for (const auto& [id, purchase_order] : purchase_orders_) {
    if (is_number_or_vendor_hit(purchase_order, po_number, vendor_name, vendor_match_threshold)) {
      result.push_back(purchase_order);
    }
  }
  return result;
}

std::vector<domain::PurchaseOrder> InMemoryPurchaseOrderRepository::list_all() const {
  std::vector<domain::PurchaseOrder> result;
  result.reserve(purchase_orders_.size());
  for (const auto& [id, purchase_order] : purchase_orders_) {
    result.push_back(purchase_order);
  }
  return result;
}

}  // namespace rxrecon::storage
