#include "rxrecon/storage/repositories.h"

#include "rxrecon/core/normalization.h"
#include "rxrecon/core/similarity.h"

namespace rxrecon::storage {

bool is_number_or_vendor_hit(const domain::PurchaseOrder& purchase_order,
                             const std::optional<std::string>& po_number,
                             const std::string& vendor_name, const double vendor_match_threshold) {
  if (po_number) {
    const std::string wanted = core::alnum_key(*po_number);
    if (!wanted.empty() && wanted == core::alnum_key(purchase_order.po_number)) {
      return true;
    }
  }
  return core::names_match(purchase_order.vendor, vendor_name, vendor_match_threshold);
}

}  // namespace rxrecon::storage
