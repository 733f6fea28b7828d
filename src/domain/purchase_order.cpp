#include "rxrecon/domain/purchase_order.h"

#include <set>

namespace rxrecon::domain {

core::Result<bool, core::InputError> PurchaseOrder::validate() const {
  const auto invalid = [this](const std::string& what, const std::optional<int> line_number) {
    return core::Result<bool, core::InputError>::err(
        core::InputError{.code = core::InputErrorCode::kInvalidPurchaseOrder,
                         .message = "purchase order '" + id.value + "': " + what,
                         .line_number = line_number});
  };

  if (id.value.empty()) {
    return invalid("id must not be empty", std::nullopt);
  }

  std::set<int> seen_lines;
  for (const auto& item : items) {
    const std::string where = "line " + std::to_string(item.line_number);
    if (item.quantity < 0) {
      return invalid(where + " has a negative quantity", item.line_number);
    }
    if (item.unit_price < 0.0) {
      return invalid(where + " has a negative unit price", item.line_number);
    }
    if (!seen_lines.insert(item.line_number).second) {
      return invalid(where + " appears more than once", item.line_number);
    }
  }

  return core::Result<bool, core::InputError>::ok(true);
}

}  // namespace rxrecon::domain
