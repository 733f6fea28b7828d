#pragma once

#include "rxrecon/storage/audit_event.h"

#include <set>
#include <string>
#include <vector>

namespace rxrecon::storage {

class IAuditLog {
 public:
  virtual ~IAuditLog() = default;
  virtual void append(const AuditEvent& event) = 0;
  // Events of one trace in append order. An empty trace_id returns every event.
  [[nodiscard]] virtual std::vector<AuditEvent> query(const std::string& trace_id) const = 0;
  // Distinct trace IDs, sorted.
  [[nodiscard]] virtual std::vector<std::string> list_trace_ids() const = 0;
};

class InMemoryAuditLog final : public IAuditLog {
 public:
  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

 private:
  std::vector<AuditEvent> events_;
  std::set<std::string> trace_ids_;
};

}  // namespace rxrecon::storage
