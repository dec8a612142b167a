#include "docvec/storage/audit_log.h"

namespace docvec::storage {

void InMemoryDocumentAuditLog::append(const DocumentAuditRecord& record) {
  std::lock_guard<std::mutex> lock(mutex_);
  records_.push_back(record);
}

std::vector<DocumentAuditRecord> InMemoryDocumentAuditLog::query_by_document(
    const std::string& document_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<DocumentAuditRecord> result;
  for (const auto& record : records_) {
    if (record.document_id == document_id) {
      result.push_back(record);
    }
  }
  return result;
}

std::vector<DocumentAuditRecord> InMemoryDocumentAuditLog::list_all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_;
}

}  // namespace docvec::storage
