#include "docvec/storage/sqlite/sqlite_document_audit_log.h"

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace docvec::storage::sqlite {

namespace {

constexpr std::string_view kInsertSql =
    "INSERT INTO document_audit (document_id, editor_id, created_at, description)"
    " VALUES (?, ?, ?, ?)";

constexpr std::string_view kSelectByDocumentSql =
    "SELECT document_id, editor_id, created_at, description"
    "  FROM document_audit WHERE document_id = ? ORDER BY id";

constexpr std::string_view kSelectAllSql =
    "SELECT document_id, editor_id, created_at, description FROM document_audit ORDER BY id";

[[noreturn]] void fail(const char* what, const PreparedStatement& stmt) {
  throw std::runtime_error(std::string("document_audit ") + what + ": " + stmt.error());
}

std::vector<DocumentAuditRecord> read_rows(PreparedStatement& stmt) {
  std::vector<DocumentAuditRecord> result;
  StepResult step = StepResult::kRow;
  while ((step = stmt.step()) == StepResult::kRow) {
    result.push_back(DocumentAuditRecord{stmt.column_text(0), stmt.column_text(1),
                                         stmt.column_text(2), stmt.column_text(3)});
  }
  if (step == StepResult::kError) {
    fail("read failed", stmt);
  }
  return result;
}

}  // namespace

SqliteDocumentAuditLog::SqliteDocumentAuditLog(std::shared_ptr<SqliteDb> db)
    : db_(std::move(db)) {}

void SqliteDocumentAuditLog::append(const DocumentAuditRecord& record) {
  std::lock_guard<std::mutex> lock(mutex_);
  PreparedStatement stmt(*db_, kInsertSql);
  if (!stmt.is_valid()) {
    fail("insert", stmt);
  }

  const bool bound = stmt.bind_text(1, record.document_id) && stmt.bind_text(2, record.editor_id) &&
                     stmt.bind_text(3, record.created_at) && stmt.bind_text(4, record.description);
  if (!bound || stmt.step() != StepResult::kDone) {
    fail("insert failed", stmt);
  }
}

std::vector<DocumentAuditRecord> SqliteDocumentAuditLog::query_by_document(
    const std::string& document_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  PreparedStatement stmt(*db_, kSelectByDocumentSql);
  if (!stmt.is_valid() || !stmt.bind_text(1, document_id)) {
    fail("query", stmt);
  }
  return read_rows(stmt);
}

std::vector<DocumentAuditRecord> SqliteDocumentAuditLog::list_all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  PreparedStatement stmt(*db_, kSelectAllSql);
  if (!stmt.is_valid()) {
    fail("query", stmt);
  }
  return read_rows(stmt);
}

}  // namespace docvec::storage::sqlite
