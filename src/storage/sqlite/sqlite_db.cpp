#include "docvec/storage/sqlite/sqlite_db.h"

#include <sqlite3.h>

#include <utility>

namespace docvec::storage::sqlite {

namespace {

constexpr const char* kSchemaV1 = R"(
BEGIN;

CREATE TABLE IF NOT EXISTS schema_version (
  version INTEGER PRIMARY KEY,
  applied_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS document_audit (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  document_id TEXT NOT NULL,
  editor_id TEXT NOT NULL,
  created_at TEXT NOT NULL,
  description TEXT NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_document_audit_document ON document_audit(document_id, id);

INSERT OR IGNORE INTO schema_version (version, applied_at) VALUES (1, datetime('now'));

COMMIT;
)";

}  // namespace

void SqliteDb::SqliteDeleter::operator()(sqlite3* db) const {
  if (db != nullptr) {
    sqlite3_close(db);
  }
}

SqliteDb::SqliteDb(sqlite3* db) : db_(db) {}

core::Result<std::shared_ptr<SqliteDb>, std::string> SqliteDb::open(const std::string& path) {
  using OpenResult = core::Result<std::shared_ptr<SqliteDb>, std::string>;

  sqlite3* raw = nullptr;
  const int rc = sqlite3_open_v2(path.c_str(), &raw, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                                 nullptr);
  // The handle is owned even when open fails; sqlite3_close accepts it either way.
  std::shared_ptr<SqliteDb> db(new SqliteDb(raw));
  if (rc != SQLITE_OK) {
    return OpenResult::err("Failed to open database " + path + ": " +
                           (raw != nullptr ? sqlite3_errmsg(raw) : "out of memory"));
  }

  sqlite3_busy_timeout(raw, kBusyTimeoutMs);
  return OpenResult::ok(std::move(db));
}

int SqliteDb::get_schema_version() const {
  PreparedStatement stmt(*this, "SELECT MAX(version) FROM schema_version");
  if (!stmt.is_valid()) {
    return 0;
  }
  if (stmt.step() != StepResult::kRow) {
    return 0;
  }
  return stmt.column_int(0);
}

core::Result<bool, std::string> SqliteDb::ensure_schema_v1() {
  if (get_schema_version() >= 1) {
    return core::Result<bool, std::string>::ok(true);
  }

  char* err_msg = nullptr;
  if (sqlite3_exec(db_.get(), kSchemaV1, nullptr, nullptr, &err_msg) != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "unknown error";
    sqlite3_free(err_msg);
    sqlite3_exec(db_.get(), "ROLLBACK", nullptr, nullptr, nullptr);
    return core::Result<bool, std::string>::err("Failed to apply schema v1: " + error);
  }
  return core::Result<bool, std::string>::ok(true);
}

void PreparedStatement::StmtDeleter::operator()(sqlite3_stmt* stmt) const {
  if (stmt != nullptr) {
    sqlite3_finalize(stmt);
  }
}

PreparedStatement::PreparedStatement(const SqliteDb& db, const std::string_view sql)
    : db_(db.connection()) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &raw, nullptr) !=
      SQLITE_OK) {
    error_ = sqlite3_errmsg(db_);
    sqlite3_finalize(raw);
    return;
  }
  stmt_.reset(raw);
}

bool PreparedStatement::bind_text(const int index, const std::string_view value) {
  if (!stmt_) {
    return false;
  }
  if (sqlite3_bind_text(stmt_.get(), index, value.data(), static_cast<int>(value.size()),
                        SQLITE_TRANSIENT) != SQLITE_OK) {
    error_ = sqlite3_errmsg(db_);
    return false;
  }
  return true;
}

StepResult PreparedStatement::step() {
  if (!stmt_) {
    return StepResult::kError;
  }
  switch (sqlite3_step(stmt_.get())) {
    case SQLITE_ROW:
      return StepResult::kRow;
    case SQLITE_DONE:
      return StepResult::kDone;
    default:
      error_ = sqlite3_errmsg(db_);
      return StepResult::kError;
  }
}

int PreparedStatement::column_int(const int column) const {
  return sqlite3_column_int(stmt_.get(), column);
}

std::string PreparedStatement::column_text(const int column) const {
  const auto* raw = sqlite3_column_text(stmt_.get(), column);
  if (raw == nullptr) {
    return {};
  }
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  return std::string(reinterpret_cast<const char*>(raw),
                     static_cast<std::size_t>(sqlite3_column_bytes(stmt_.get(), column)));
}

}  // namespace docvec::storage::sqlite
