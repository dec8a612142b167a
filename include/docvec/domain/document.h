#pragma once

#include "docvec/domain/metadata.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace docvec::domain {

// Document is the unit of storage: text content plus metadata.
// Stored documents are never edited in place; an update is a delete followed by a
// reinsert under a new storage id.
struct Document {
  std::string page_content;  // NOLINT(readability-identifier-naming)
  Metadata metadata;         // NOLINT(readability-identifier-naming)

  // A document is valid at `now` iff valid_time is indefinite, or `now` lies in
  // [start_time, start_time + valid_time]. The window is inclusive at both ends;
  // an indefinite document is valid at every instant, including before start_time.
  [[nodiscard]] bool is_valid_at(std::int64_t now_epoch_seconds) const;

  bool operator==(const Document&) const = default;
};

// A document together with its storage id, as returned by whole-table reads.
struct StoredDocument {
  std::string id;     // NOLINT(readability-identifier-naming)
  Document document;  // NOLINT(readability-identifier-naming)
};

[[nodiscard]] nlohmann::json document_to_json(const Document& document);
[[nodiscard]] Document document_from_json(const nlohmann::json& j);

}  // namespace docvec::domain
