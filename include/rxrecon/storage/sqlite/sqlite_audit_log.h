#pragma once

#ifdef RXRECON_INTERFACE_ONLY_GUARD
#error "Concrete storage header included in a guarded translation unit; use interfaces only."
#endif

#include "rxrecon/storage/audit_log.h"
#include "rxrecon/storage/sqlite/sqlite_db.h"

#include <map>
#include <memory>
#include <mutex>

namespace rxrecon::storage::sqlite {

// SqliteAuditLog implements IAuditLog with SQLite backend.
// Append-only; events of one trace are ordered by the idx column.
// append throws std::runtime_error when the insert fails, so a run never reports
// success with a missing audit record.
class SqliteAuditLog final : public IAuditLog {
 public:
  explicit SqliteAuditLog(std::shared_ptr<SqliteDb> db);

  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

 private:
  std::shared_ptr<SqliteDb> db_;

  // Next idx per trace, seeded from the table the first time a trace is seen.
  std::mutex mutex_;
  std::map<std::string, int> next_index_;

  int reserve_index(const std::string& trace_id);
};

}  // namespace rxrecon::storage::sqlite
