#pragma once

#include "docvec/core/result.h"

#include <memory>
#include <string>
#include <string_view>

// The SQLite header stays out of the public API.
struct sqlite3;
struct sqlite3_stmt;

namespace docvec::storage::sqlite {

// SqliteDb owns one connection to the audit database and its schema.
//
// Several docvec_cli processes may write the same audit.db, so every connection
// waits up to kBusyTimeoutMs on a locked database before a statement fails.
// Not synchronised; callers sharing one SqliteDb serialise access themselves.
class SqliteDb {
 public:
  static constexpr int kBusyTimeoutMs = 5000;

  // ":memory:" opens a private in-memory database.
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path);

  ~SqliteDb() = default;

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;

  // 0 when no schema has been applied.
  [[nodiscard]] int get_schema_version() const;

  // Creates schema_version and document_audit. A no-op once version 1 is recorded.
  [[nodiscard]] core::Result<bool, std::string> ensure_schema_v1();

  [[nodiscard]] sqlite3* connection() const { return db_.get(); }

 private:
  struct SqliteDeleter {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  std::unique_ptr<sqlite3, SqliteDeleter> db_;
};

enum class StepResult { kRow, kDone, kError };

// PreparedStatement finalises its statement on destruction. Parameter indices
// are 1-based and column indices 0-based, as in the SQLite C API.
class PreparedStatement {
 public:
  PreparedStatement(const SqliteDb& db, std::string_view sql);
  ~PreparedStatement() = default;

  PreparedStatement(const PreparedStatement&) = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;
  PreparedStatement(PreparedStatement&&) = delete;
  PreparedStatement& operator=(PreparedStatement&&) = delete;

  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }

  // Prepare error, or the connection's message after a failed bind or step.
  [[nodiscard]] const std::string& error() const { return error_; }

  // Copies value. Returns false and records error() on failure.
  bool bind_text(int index, std::string_view value);

  [[nodiscard]] StepResult step();

  // NULL reads as 0.
  [[nodiscard]] int column_int(int column) const;

  // NULL reads as an empty string.
  [[nodiscard]] std::string column_text(int column) const;

 private:
  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };

  sqlite3* db_;
  std::unique_ptr<sqlite3_stmt, StmtDeleter> stmt_;
  std::string error_;
};

}  // namespace docvec::storage::sqlite
