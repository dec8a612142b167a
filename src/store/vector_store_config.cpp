#include "docvec/store/vector_store_config.h"

#include "docvec/core/errors.h"

namespace docvec::store {

namespace {

template <typename T>
void read_field(const nlohmann::json& j, const char* key, T& out) {
  const auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return;
  }
  try {
    out = it->get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw core::ValidationError(std::string("config field '") + key + "': " + e.what());
  }
}

}  // namespace

std::string to_string(const DedupNeighbourSource source) {
  switch (source) {
    case DedupNeighbourSource::kReembedText:
      return "reembed_text";
    case DedupNeighbourSource::kStoredVector:
      return "stored_vector";
  }
  return "reembed_text";
}

std::optional<DedupNeighbourSource> parse_dedup_neighbour_source(const std::string_view value) {
  if (value == "reembed_text") {
    return DedupNeighbourSource::kReembedText;
  }
  if (value == "stored_vector") {
    return DedupNeighbourSource::kStoredVector;
  }
  return std::nullopt;
}

void validate(const VectorStoreConfig& config) {
  if (config.index_name.empty()) {
    throw core::ValidationError("index_name must not be empty");
  }
  if (config.dedup_threshold < -1.0 || config.dedup_threshold > 1.0) {
    throw core::ValidationError("dedup_threshold must lie in [-1, 1]");
  }
  if (config.rebuild_workers == 0) {
    throw core::ValidationError("rebuild_workers must be at least 1");
  }
  if (config.persistence_queue_capacity == 0) {
    throw core::ValidationError("persistence_queue_capacity must be at least 1");
  }
  if (config.default_fetch_k == 0) {
    throw core::ValidationError("default_fetch_k must be at least 1");
  }
}

VectorStoreConfig vector_store_config_from_json(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw core::ValidationError("vector store config must be a JSON object");
  }

  VectorStoreConfig config;
  read_field(j, "folder_path", config.folder_path);
  read_field(j, "index_name", config.index_name);
  read_field(j, "dedup_threshold", config.dedup_threshold);
  read_field(j, "dedup_neighbours", config.dedup_neighbours);
  read_field(j, "rebuild_workers", config.rebuild_workers);
  read_field(j, "persistence_queue_capacity", config.persistence_queue_capacity);
  read_field(j, "score_threshold_slack", config.score_threshold_slack);
  read_field(j, "default_fetch_k", config.default_fetch_k);

  std::string source = to_string(config.dedup_neighbour_source);
  read_field(j, "dedup_neighbour_source", source);
  const auto parsed = parse_dedup_neighbour_source(source);
  if (!parsed.has_value()) {
    throw core::ValidationError("dedup_neighbour_source must be reembed_text or stored_vector, got " +
                                source);
  }
  config.dedup_neighbour_source = parsed.value();

  validate(config);
  return config;
}

nlohmann::json to_json(const VectorStoreConfig& config) {
  return nlohmann::json{
      {"dedup_neighbour_source", to_string(config.dedup_neighbour_source)},
      {"dedup_neighbours", config.dedup_neighbours},
      {"dedup_threshold", config.dedup_threshold},
      {"default_fetch_k", config.default_fetch_k},
      {"folder_path", config.folder_path},
      {"index_name", config.index_name},
      {"persistence_queue_capacity", config.persistence_queue_capacity},
      {"rebuild_workers", config.rebuild_workers},
      {"score_threshold_slack", config.score_threshold_slack},
  };
}

}  // namespace docvec::store
