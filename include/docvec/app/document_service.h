#pragma once

#include "docvec/app/service_config.h"
#include "docvec/app/services.h"
#include "docvec/domain/document.h"
#include "docvec/domain/metadata.h"
#include "docvec/store/vector_store.h"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace docvec::app {

// The store accepted none of the submitted documents: each was a near-duplicate
// of a stored one.
class DuplicateDocumentError : public std::runtime_error {
 public:
  explicit DuplicateDocumentError(const std::string& message) : std::runtime_error(message) {}
};

// Every mutating request names the editor; the audit trail records it.
// A missing or empty editor_id is a core::ValidationError.
//
// Audit policy: a failed audit append is logged as a warning and never fails the
// request. Audit records are keyed by metadata id.

// ────────────────────────────────────────────────────────────────
// Add
// ────────────────────────────────────────────────────────────────

struct AddDocumentRequest {
  std::string page_content;            // NOLINT(readability-identifier-naming)
  domain::MetadataOptions metadata;    // NOLINT(readability-identifier-naming)
  std::optional<std::string> editor_id;  // NOLINT(readability-identifier-naming)
};

// Requires at least one tag. Enqueues a save and records "Document added.".
// Throws DuplicateDocumentError when the document was rejected as a near-duplicate.
[[nodiscard]] domain::StoredDocument run_add_document(const AddDocumentRequest& req,
                                                      Services& services);

// ────────────────────────────────────────────────────────────────
// Delete
// ────────────────────────────────────────────────────────────────

struct DeleteDocumentsRequest {
  std::vector<std::string> metadata_ids;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> editor_id;   // NOLINT(readability-identifier-naming)
};

// Removes every document whose metadata id is listed, enqueues a save and records
// "Document deleted." per removed document.
[[nodiscard]] store::RemovalResult run_delete_documents(const DeleteDocumentsRequest& req,
                                                        Services& services);

// ────────────────────────────────────────────────────────────────
// Update
// ────────────────────────────────────────────────────────────────

struct UpdateDocumentRequest {
  std::string metadata_id;                          // NOLINT(readability-identifier-naming)
  std::optional<std::string> page_content;          // NOLINT(readability-identifier-naming)
  std::optional<domain::MetadataOptions> metadata;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> editor_id;             // NOLINT(readability-identifier-naming)
};

// Delete then reinsert as a new document (new storage id). The new document keeps
// metadata_id unless req.metadata sets its own ids.
// Throws core::ValidationError when content or metadata is missing (checked before
// anything is removed) and core::NotFoundError when no document carries metadata_id.
// Records "Document updated." and enqueues a save.
[[nodiscard]] domain::StoredDocument run_update_document(const UpdateDocumentRequest& req,
                                                         Services& services);

// ────────────────────────────────────────────────────────────────
// Retrieval
// ────────────────────────────────────────────────────────────────

struct GetDocumentsRequest {
  std::string query;                              // NOLINT(readability-identifier-naming)
  std::size_t k{6};                               // NOLINT(readability-identifier-naming)
  std::optional<std::vector<std::string>> tags;   // NOLINT(readability-identifier-naming)
  std::optional<std::size_t> fetch_k;             // NOLINT(readability-identifier-naming)
  std::optional<double> score_threshold;          // NOLINT(readability-identifier-naming)
  bool powerset{true};                            // NOLINT(readability-identifier-naming)
};

// Plain search followed by the reranker.
[[nodiscard]] std::vector<domain::Document> run_get_documents(const GetDocumentsRequest& req,
                                                              Services& services);

struct FindDocumentsRequest {
  std::string query;              // NOLINT(readability-identifier-naming)
  std::vector<std::string> tags;  // NOLINT(readability-identifier-naming)
};

// Searches with config.default_tags followed by req.tags, loosening the score
// threshold per config.find_policy until enough documents are found, then reranks.
// Uses powerset expansion when the caller gave no tags, priority expansion otherwise.
[[nodiscard]] std::vector<domain::Document> run_find_documents(const FindDocumentsRequest& req,
                                                               Services& services,
                                                               const ServiceConfig& config);

}  // namespace docvec::app
