#pragma once

#include "rxrecon/core/result.h"

#include <memory>
#include <string>

// Forward declare sqlite3 to avoid exposing SQLite header in public API
struct sqlite3;
struct sqlite3_stmt;

namespace rxrecon::storage::sqlite {

// SqliteDb owns one SQLite connection and applies the schema.
// - RAII: connection managed via unique_ptr with custom deleter
// - Errors are returned as Result<T, std::string>
// - One connection per instance; not shared across threads
class SqliteDb {
 public:
  // Open or create database at path. ":memory:" opens a private in-memory database.
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path);

  ~SqliteDb() = default;

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;

  // 0 if no schema applied
  [[nodiscard]] int get_schema_version() const;

  // Schema v1: purchase_orders, purchase_order_items, audit_events.
  [[nodiscard]] core::Result<bool, std::string> ensure_schema_v1();

  [[nodiscard]] core::Result<bool, std::string> exec(const std::string& sql);

  // Should be used only by repository implementations
  [[nodiscard]] sqlite3* connection() const { return db_.get(); }

  // Last error message reported by the connection.
  [[nodiscard]] std::string last_error() const;

 private:
  struct SqliteDeleter {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  std::unique_ptr<sqlite3, SqliteDeleter> db_;
};

// RAII wrapper for prepared statements
class PreparedStatement {
 public:
  PreparedStatement(sqlite3* db, const std::string& sql);
  ~PreparedStatement() = default;

  PreparedStatement(const PreparedStatement&) = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;
  PreparedStatement(PreparedStatement&&) = delete;
  PreparedStatement& operator=(PreparedStatement&&) = delete;

  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }
  [[nodiscard]] std::string error() const { return error_; }
  [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }

  // Reset statement and clear bindings for reuse
  void reset();

 private:
  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };

  std::unique_ptr<sqlite3_stmt, StmtDeleter> stmt_;
  std::string error_;
};

// column_text returns "" for NULL columns.
[[nodiscard]] std::string column_text(sqlite3_stmt* stmt, int column);

}  // namespace rxrecon::storage::sqlite
