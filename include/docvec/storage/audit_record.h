#pragma once

#include <string>

namespace docvec::storage {

// One edit of one stored document.
// description is one of "Document added.", "Document updated.", "Document deleted.".
struct DocumentAuditRecord {
  std::string document_id;  // NOLINT(readability-identifier-naming)
  std::string editor_id;    // NOLINT(readability-identifier-naming)
  std::string created_at;   // NOLINT(readability-identifier-naming)
  std::string description;  // NOLINT(readability-identifier-naming)

  bool operator==(const DocumentAuditRecord&) const = default;
};

inline constexpr const char* kAuditDocumentAdded = "Document added.";
inline constexpr const char* kAuditDocumentUpdated = "Document updated.";
inline constexpr const char* kAuditDocumentDeleted = "Document deleted.";

}  // namespace docvec::storage
