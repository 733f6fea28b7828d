#pragma once

#ifdef RXRECON_INTERFACE_ONLY_GUARD
#error "Concrete storage header included in a guarded translation unit; use interfaces only."
#endif

#include "rxrecon/storage/repositories.h"
#include "rxrecon/storage/sqlite/sqlite_db.h"

#include <memory>

namespace rxrecon::storage::sqlite {

// SqlitePurchaseOrderRepository implements IPurchaseOrderRepository with SQLite backend.
// Headers live in purchase_orders, items in purchase_order_items keyed by line_number.
// The vendor filter is fuzzy, so find_by_number_or_vendor scans headers and filters in C++.
class SqlitePurchaseOrderRepository final : public IPurchaseOrderRepository {
 public:
  explicit SqlitePurchaseOrderRepository(std::shared_ptr<SqliteDb> db);

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
  std::shared_ptr<SqliteDb> db_;

  [[nodiscard]] core::Result<bool, std::string> write(const domain::PurchaseOrder& purchase_order);

  // Header rows only (items left empty), ordered by po_id.
  [[nodiscard]] std::vector<domain::PurchaseOrder> list_headers() const;

  [[nodiscard]] std::vector<domain::PurchaseOrderLineItem> load_items(
      const core::PurchaseOrderId& id) const;
};

}  // namespace rxrecon::storage::sqlite
