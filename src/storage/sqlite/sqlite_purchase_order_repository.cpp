#include "rxrecon/storage/sqlite/sqlite_purchase_order_repository.h"

#include <sqlite3.h>

namespace rxrecon::storage::sqlite {

SqlitePurchaseOrderRepository::SqlitePurchaseOrderRepository(std::shared_ptr<SqliteDb> db)
    : db_(std::move(db)) {}

core::Result<bool, std::string> SqlitePurchaseOrderRepository::upsert(
    const domain::PurchaseOrder& purchase_order) {
  auto begun = db_->exec("BEGIN TRANSACTION");
  if (!begun.has_value()) {
    return begun;
  }

  auto written = write(purchase_order);
  if (!written.has_value()) {
    auto rolled_back = db_->exec("ROLLBACK");
    if (!rolled_back.has_value()) {
      return core::Result<bool, std::string>::err(written.error() + "; " + rolled_back.error());
    }
    return written;
  }

  return db_->exec("COMMIT");
}

core::Result<bool, std::string> SqlitePurchaseOrderRepository::write(
    const domain::PurchaseOrder& purchase_order) {
  using R = core::Result<bool, std::string>;
  const std::string context = "purchase order '" + purchase_order.id.value + "': ";

  const char* header_sql = R"(
    INSERT INTO purchase_orders (po_id, po_number, vendor)
    VALUES (?, ?, ?)
    ON CONFLICT(po_id) DO UPDATE SET
      po_number = excluded.po_number,
      vendor = excluded.vendor
  )";

  PreparedStatement header_stmt(db_->connection(), header_sql);
  if (!header_stmt.is_valid()) {
    return R::err(context + header_stmt.error());
  }
  sqlite3_bind_text(header_stmt.get(), 1, purchase_order.id.value.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(header_stmt.get(), 2, purchase_order.po_number.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(header_stmt.get(), 3, purchase_order.vendor.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(header_stmt.get()) != SQLITE_DONE) {
    return R::err(context + db_->last_error());
  }

  PreparedStatement delete_stmt(db_->connection(),
                                "DELETE FROM purchase_order_items WHERE po_id = ?");
  if (!delete_stmt.is_valid()) {
    return R::err(context + delete_stmt.error());
  }
  sqlite3_bind_text(delete_stmt.get(), 1, purchase_order.id.value.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(delete_stmt.get()) != SQLITE_DONE) {
    return R::err(context + db_->last_error());
  }

  const char* item_sql = R"(
    INSERT INTO purchase_order_items
      (po_id, line_number, identifier, description, quantity, unit_price, lot_number)
    VALUES (?, ?, ?, ?, ?, ?, ?)
  )";

  PreparedStatement item_stmt(db_->connection(), item_sql);
  if (!item_stmt.is_valid()) {
    return R::err(context + item_stmt.error());
  }

  for (const auto& item : purchase_order.items) {
    sqlite3_bind_text(item_stmt.get(), 1, purchase_order.id.value.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(item_stmt.get(), 2, item.line_number);
    sqlite3_bind_text(item_stmt.get(), 3, item.identifier.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(item_stmt.get(), 4, item.description.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(item_stmt.get(), 5, item.quantity);
    sqlite3_bind_double(item_stmt.get(), 6, item.unit_price);
    if (item.lot_number) {
      sqlite3_bind_text(item_stmt.get(), 7, item.lot_number->c_str(), -1, SQLITE_TRANSIENT);
    } else {
      sqlite3_bind_null(item_stmt.get(), 7);
    }

    if (sqlite3_step(item_stmt.get()) != SQLITE_DONE) {
      return R::err(context + "line " + std::to_string(item.line_number) + ": " +
                    db_->last_error());
    }
    item_stmt.reset();
  }

  return R::ok(true);
}

std::optional<domain::PurchaseOrder> SqlitePurchaseOrderRepository::get(
    const core::PurchaseOrderId& id) const {
  PreparedStatement stmt(db_->connection(),
                         "SELECT po_id, po_number, vendor FROM purchase_orders WHERE po_id = ?");
  if (!stmt.is_valid()) {
    return std::nullopt;
  }

  sqlite3_bind_text(stmt.get(), 1, id.value.c_str(), -1, SQLITE_TRANSIENT);

  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return std::nullopt;
  }

  domain::PurchaseOrder purchase_order;
  purchase_order.id = core::PurchaseOrderId{column_text(stmt.get(), 0)};
  purchase_order.po_number = column_text(stmt.get(), 1);
  purchase_order.vendor = column_text(stmt.get(), 2);
  purchase_order.items = load_items(purchase_order.id);
  return purchase_order;
}

std::vector<domain::PurchaseOrder> SqlitePurchaseOrderRepository::load(
    const std::vector<core::PurchaseOrderId>& ids) const {
  std::vector<domain::PurchaseOrder> result;
  result.reserve(ids.size());
  for (const auto& id : ids) {
    if (auto purchase_order = get(id)) {
      result.push_back(std::move(*purchase_order));
    }
  }
  return result;
}

std::vector<domain::PurchaseOrder> SqlitePurchaseOrderRepository::find_by_number_or_vendor(
    const std::optional<std::string>& po_number, const std::string& vendor_name,
    const double vendor_match_threshold) const {
  std::vector<domain::PurchaseOrder> result;
  for (auto& header : list_headers()) {
    if (is_number_or_vendor_hit(header, po_number, vendor_name, vendor_match_threshold)) {
      header.items = load_items(header.id);
      result.push_back(std::move(header));
    }
  }
  return result;
}

std::vector<domain::PurchaseOrder> SqlitePurchaseOrderRepository::list_all() const {
  auto result = list_headers();
  for (auto& purchase_order : result) {
    purchase_order.items = load_items(purchase_order.id);
  }
  return result;
}

std::vector<domain::PurchaseOrder> SqlitePurchaseOrderRepository::list_headers() const {
  PreparedStatement stmt(db_->connection(),
                         "SELECT po_id, po_number, vendor FROM purchase_orders ORDER BY po_id");
  if (!stmt.is_valid()) {
    return {};
  }

  std::vector<domain::PurchaseOrder> headers;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    domain::PurchaseOrder header;
    header.id = core::PurchaseOrderId{column_text(stmt.get(), 0)};
    header.po_number = column_text(stmt.get(), 1);
    header.vendor = column_text(stmt.get(), 2);
    headers.push_back(std::move(header));
  }
  return headers;
}

std::vector<domain::PurchaseOrderLineItem> SqlitePurchaseOrderRepository::load_items(
    const core::PurchaseOrderId& id) const {
  const char* sql = R"(
    SELECT line_number, identifier, description, quantity, unit_price, lot_number
      FROM purchase_order_items WHERE po_id = ? ORDER BY line_number
  )";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return {};
  }

  sqlite3_bind_text(stmt.get(), 1, id.value.c_str(), -1, SQLITE_TRANSIENT);

  std::vector<domain::PurchaseOrderLineItem> items;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    domain::PurchaseOrderLineItem item;
    item.line_number = sqlite3_column_int(stmt.get(), 0);
    item.identifier = column_text(stmt.get(), 1);
    item.description = column_text(stmt.get(), 2);
    item.quantity = sqlite3_column_int64(stmt.get(), 3);
    item.unit_price = sqlite3_column_double(stmt.get(), 4);
    if (sqlite3_column_type(stmt.get(), 5) != SQLITE_NULL) {
      item.lot_number = column_text(stmt.get(), 5);
    }
    items.push_back(std::move(item));
  }
  return items;
}

}  // namespace rxrecon::storage::sqlite
