#pragma once

#include "rxrecon/core/id_generator.h"

#include <string>

namespace rxrecon::core {

// Strong ID types following C++ Core Guidelines C.11 (Make concrete types regular).
// These are "vocabulary types" that prevent ID confusion and enable type-safe APIs.

// PurchaseOrderId is owned by the persistence collaborator; the engine treats it as opaque.
struct PurchaseOrderId {
  std::string value;
  auto operator<=>(const PurchaseOrderId&) const = default;
};

struct TraceId {
  std::string value;
  auto operator<=>(const TraceId&) const = default;
};

inline TraceId new_trace_id(IIdGenerator& id_gen) {
  return TraceId{id_gen.next("trace")};
}

}  // namespace rxrecon::core
