#pragma once

#include "docvec/storage/audit_record.h"

#include <mutex>
#include <string>
#include <vector>

namespace docvec::storage {

// IDocumentAuditLog is an append-only record of document edits.
// Implementations are safe to call from several threads.
// append() throws std::runtime_error when the record cannot be stored.
class IDocumentAuditLog {
 public:
  virtual ~IDocumentAuditLog() = default;
  virtual void append(const DocumentAuditRecord& record) = 0;
  // Records for one document, in append order.
  [[nodiscard]] virtual std::vector<DocumentAuditRecord> query_by_document(
      const std::string& document_id) const = 0;
  [[nodiscard]] virtual std::vector<DocumentAuditRecord> list_all() const = 0;

 protected:
  IDocumentAuditLog() = default;
  IDocumentAuditLog(const IDocumentAuditLog&) = default;
  IDocumentAuditLog& operator=(const IDocumentAuditLog&) = default;
  IDocumentAuditLog(IDocumentAuditLog&&) = default;
  IDocumentAuditLog& operator=(IDocumentAuditLog&&) = default;
};

class InMemoryDocumentAuditLog final : public IDocumentAuditLog {
 public:
  void append(const DocumentAuditRecord& record) override;
  [[nodiscard]] std::vector<DocumentAuditRecord> query_by_document(
      const std::string& document_id) const override;
  [[nodiscard]] std::vector<DocumentAuditRecord> list_all() const override;

 private:
  mutable std::mutex mutex_;
  std::vector<DocumentAuditRecord> records_;
};

}  // namespace docvec::storage
