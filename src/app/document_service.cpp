#include "docvec/app/document_service.h"

#include "docvec/core/errors.h"
#include "docvec/storage/audit_record.h"
#include "docvec/store/adaptive_search.h"

#include <spdlog/spdlog.h>

namespace docvec::app {

namespace {

const std::string& require_editor(const std::optional<std::string>& editor_id) {
  if (!editor_id.has_value() || editor_id->empty()) {
    throw core::ValidationError("editor id is required for document changes");
  }
  return editor_id.value();
}

void audit(Services& services, const std::string& document_id, const std::string& editor_id,
           const char* description) {
  try {
    services.audit_log.append(storage::DocumentAuditRecord{
        document_id, editor_id, services.clock.now_iso8601(), description});
  } catch (const std::exception& e) {
    spdlog::warn("[DocumentService] Audit append for {} failed: {}", document_id, e.what());
  }
}

domain::Document build_document(const std::string& page_content,
                                const domain::MetadataOptions& options, core::IClock& clock) {
  domain::Document document{page_content, domain::make_metadata(options, clock)};
  if (document.metadata.tags.empty()) {
    throw core::ValidationError("the document must have at least one tag in its metadata");
  }
  return document;
}

domain::StoredDocument insert_one(const domain::Document& document, Services& services) {
  auto accepted = services.store.add_documents_with_ids({document});
  if (accepted.empty()) {
    throw DuplicateDocumentError("document rejected as a near-duplicate of a stored document");
  }
  return std::move(accepted.front());
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Mutations
// ────────────────────────────────────────────────────────────────

domain::StoredDocument run_add_document(const AddDocumentRequest& req, Services& services) {
  const auto& editor = require_editor(req.editor_id);
  const auto document = build_document(req.page_content, req.metadata, services.clock);

  auto stored = insert_one(document, services);
  services.store.save_index();
  audit(services, stored.document.metadata.ids, editor, storage::kAuditDocumentAdded);

  spdlog::info("[DocumentService] Document {} added", stored.document.metadata.ids);
  return stored;
}

store::RemovalResult run_delete_documents(const DeleteDocumentsRequest& req, Services& services) {
  const auto& editor = require_editor(req.editor_id);

  auto result = services.store.delete_documents_by_ids(req.metadata_ids);
  services.store.save_index();
  for (const auto& removed : result.removed) {
    audit(services, removed.metadata.ids, editor, storage::kAuditDocumentDeleted);
  }

  spdlog::info("[DocumentService] Removed {} documents", result.n_removed);
  return result;
}

domain::StoredDocument run_update_document(const UpdateDocumentRequest& req, Services& services) {
  const auto& editor = require_editor(req.editor_id);
  if (!req.page_content.has_value() || !req.metadata.has_value()) {
    throw core::ValidationError("invalid data provided for document modification");
  }
  auto options = req.metadata.value();
  if (!options.ids.has_value()) {
    options.ids = req.metadata_id;
  }
  const auto document = build_document(req.page_content.value(), options, services.clock);

  const auto removal = services.store.delete_documents_by_ids({req.metadata_id});
  if (removal.n_removed == 0) {
    throw core::NotFoundError("no document found with id " + req.metadata_id +
                              ", unable to update");
  }
  // The removal has to reach disk even when the reinsert is rejected below.
  services.store.save_index();

  auto stored = insert_one(document, services);
  services.store.save_index();
  audit(services, stored.document.metadata.ids, editor, storage::kAuditDocumentUpdated);

  spdlog::info("[DocumentService] Document {} updated", req.metadata_id);
  return stored;
}

// ────────────────────────────────────────────────────────────────
// Retrieval
// ────────────────────────────────────────────────────────────────

std::vector<domain::Document> run_get_documents(const GetDocumentsRequest& req,
                                                Services& services) {
  store::SearchOptions options;
  options.k = req.k;
  if (req.tags.has_value()) {
    options.filter_tags = domain::Tags(req.tags.value());
  }
  options.fetch_k = req.fetch_k;
  options.score_threshold = req.score_threshold;
  options.powerset = req.powerset;

  auto documents = services.store.search(req.query, options);
  return services.reranker.rerank(std::move(documents), req.query);
}

std::vector<domain::Document> run_find_documents(const FindDocumentsRequest& req,
                                                 Services& services,
                                                 const ServiceConfig& config) {
  domain::Tags tags(config.default_tags);
  tags.add_tags(req.tags);

  store::SearchOptions options;
  options.k = config.find_k;
  options.filter_tags = tags;
  options.powerset = req.tags.empty();

  auto result = store::adaptive_search(services.store, req.query, options, config.find_policy);
  return services.reranker.rerank(std::move(result.documents), req.query);
}

}  // namespace docvec::app
