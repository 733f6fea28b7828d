#include "rxrecon/domain/invoice.h"

#include "rxrecon/core/normalization.h"

#include <set>

namespace rxrecon::domain {

namespace {

core::Result<bool, core::InputError> reject(const core::InputErrorCode code, std::string message,
                                            const std::optional<int> line_number = std::nullopt) {
  return core::Result<bool, core::InputError>::err(
      core::InputError{.code = code, .message = std::move(message), .line_number = line_number});
}

}  // namespace

core::Result<bool, core::InputError> Invoice::validate() const {
  if (core::trim(invoice_number).empty()) {
    return reject(core::InputErrorCode::kMissingInvoiceNumber, "invoice_number must not be empty");
  }

  if (totals.subtotal < 0.0 || totals.total < 0.0) {
    return reject(core::InputErrorCode::kNegativeTotal, "invoice totals must not be negative");
  }

  std::set<int> seen_lines;
  for (const auto& item : items) {
    const std::string where = "line " + std::to_string(item.line_number);
    if (item.quantity < 0) {
      return reject(core::InputErrorCode::kNegativeQuantity, where + ": quantity is negative",
                    item.line_number);
    }
    if (item.unit_price < 0.0) {
      return reject(core::InputErrorCode::kNegativePrice, where + ": unit price is negative",
                    item.line_number);
    }
    if (item.total_price < 0.0) {
      return reject(core::InputErrorCode::kNegativeTotal, where + ": line total is negative",
                    item.line_number);
    }
    if (!seen_lines.insert(item.line_number).second) {
      return reject(core::InputErrorCode::kDuplicateLineNumber,
                    where + ": line number appears more than once", item.line_number);
    }
  }

  return core::Result<bool, core::InputError>::ok(true);
}

double Invoice::item_total_sum() const {
  double sum = 0.0;
  for (const auto& item : items) {
    sum += item.total_price;
  }
  return sum;
}

}  // namespace rxrecon::domain
