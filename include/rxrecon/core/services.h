#pragma once

#include "rxrecon/storage/audit_log.h"
#include "rxrecon/storage/repositories.h"

namespace rxrecon::core {

// Services is the composition root handed to the application layer.
// It holds references to the purchase-order source and the audit log; the CLI or
// test that builds it owns the concrete instances and keeps them alive.
struct Services {
  storage::IPurchaseOrderRepository& purchase_orders;  // NOLINT(readability-identifier-naming)
  storage::IAuditLog& audit_log;                       // NOLINT(readability-identifier-naming)

  Services(storage::IPurchaseOrderRepository& purchase_orders, storage::IAuditLog& audit_log)
      : purchase_orders(purchase_orders), audit_log(audit_log) {}

  ~Services() = default;

  Services(const Services&) = delete;
  Services& operator=(const Services&) = delete;
  Services(Services&&) = delete;
  Services& operator=(Services&&) = delete;
};

}  // namespace rxrecon::core
