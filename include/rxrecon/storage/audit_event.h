#pragma once

#include <string>
#include <vector>

namespace rxrecon::storage {

// AuditEvent is one step of a reconciliation run.
// payload is a JSON object serialized with nlohmann::json; refs name the documents involved
// ("invoice:INV-1", "po:PO-7").
struct AuditEvent {
  std::string event_id;
  std::string trace_id;
  std::string event_type;
  std::string payload;
  std::string created_at;
  std::vector<std::string> refs;
};

}  // namespace rxrecon::storage
