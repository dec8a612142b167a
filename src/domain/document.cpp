#include "docvec/domain/document.h"

#include <cstdint>

namespace docvec::domain {

bool Document::is_valid_at(const std::int64_t now_epoch_seconds) const {
  if (metadata.valid_time == kIndefiniteValidity) {
    return true;
  }
  if (now_epoch_seconds < metadata.start_time || metadata.valid_time < 0) {
    return false;
  }
  // now >= start_time, so the unsigned difference is exact and never wraps.
  const auto elapsed = static_cast<std::uint64_t>(now_epoch_seconds) -
                       static_cast<std::uint64_t>(metadata.start_time);
  return elapsed <= static_cast<std::uint64_t>(metadata.valid_time);
}

nlohmann::json document_to_json(const Document& document) {
  nlohmann::json j;
  j["metadata"] = metadata_to_json(document.metadata);
  j["page_content"] = document.page_content;
  return j;
}

Document document_from_json(const nlohmann::json& j) {
  Document document;
  document.page_content = j.at("page_content").get<std::string>();
  document.metadata = metadata_from_json(j.at("metadata"));
  return document;
}

}  // namespace docvec::domain
