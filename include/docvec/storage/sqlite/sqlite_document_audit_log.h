#pragma once

#include "docvec/storage/audit_log.h"
#include "docvec/storage/sqlite/sqlite_db.h"

#include <memory>
#include <mutex>

namespace docvec::storage::sqlite {

// SqliteDocumentAuditLog implements IDocumentAuditLog on the document_audit table.
// Requires schema v1. Rows are read back in rowid (append) order.
// One connection is shared by every caller; mutex_ serialises each statement.
class SqliteDocumentAuditLog final : public IDocumentAuditLog {
 public:
  explicit SqliteDocumentAuditLog(std::shared_ptr<SqliteDb> db);

  void append(const DocumentAuditRecord& record) override;
  [[nodiscard]] std::vector<DocumentAuditRecord> query_by_document(
      const std::string& document_id) const override;
  [[nodiscard]] std::vector<DocumentAuditRecord> list_all() const override;

 private:
  std::shared_ptr<SqliteDb> db_;
  mutable std::mutex mutex_;
};

}  // namespace docvec::storage::sqlite
