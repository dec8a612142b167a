#pragma once

#include "docvec/domain/document.h"
#include "docvec/storage/audit_record.h"
#include "docvec/store/vector_store.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <vector>

// JSON renderings printed on stdout by the CLI.

inline nlohmann::json stored_to_json(const docvec::domain::StoredDocument& stored) {
  return nlohmann::json{{"id", stored.id},
                        {"document", docvec::domain::document_to_json(stored.document)}};
}

inline nlohmann::json documents_to_json(const std::vector<docvec::domain::Document>& documents) {
  auto out = nlohmann::json::array();
  for (const auto& document : documents) {
    out.push_back(docvec::domain::document_to_json(document));
  }
  return out;
}

inline nlohmann::json audit_to_json(const std::vector<docvec::storage::DocumentAuditRecord>& rows) {
  auto out = nlohmann::json::array();
  for (const auto& row : rows) {
    out.push_back({{"created_at", row.created_at},
                   {"description", row.description},
                   {"document_id", row.document_id},
                   {"editor_id", row.editor_id}});
  }
  return out;
}

inline void print_json(const nlohmann::json& j) {
  std::cout << j.dump(2) << "\n";
}

// Waits for queued saves. Returns false (and reports on stderr) when any failed.
inline bool finish_writes(docvec::store::VectorStore& store) {
  store.wait_for_persistence();
  const auto stats = store.persistence_stats();
  if (stats.failed > 0) {
    std::cerr << "Error: save failed: " << stats.last_error << "\n";
    return false;
  }
  return true;
}
