#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace docvec::store {

// Where the dedup probe takes the neighbours' embeddings from.
// kReembedText: embed the stored neighbour's page_content again (default).
// kStoredVector: reuse the vector already held by the index.
// With a deterministic embedder both give identical verdicts.
enum class DedupNeighbourSource {
  kReembedText,   // NOLINT(readability-identifier-naming)
  kStoredVector,  // NOLINT(readability-identifier-naming)
};

[[nodiscard]] std::string to_string(DedupNeighbourSource source);
[[nodiscard]] std::optional<DedupNeighbourSource> parse_dedup_neighbour_source(
    std::string_view value);

// VectorStoreConfig carries every tunable of a VectorStore.
// Every field has an explicit default.
struct VectorStoreConfig {
  std::string folder_path{"."};      // NOLINT(readability-identifier-naming)
  std::string index_name{"index"};   // NOLINT(readability-identifier-naming)
  double dedup_threshold{0.9};       // NOLINT(readability-identifier-naming)
  std::size_t dedup_neighbours{2};   // NOLINT(readability-identifier-naming)
  DedupNeighbourSource dedup_neighbour_source{  // NOLINT(readability-identifier-naming)
                                              DedupNeighbourSource::kReembedText};
  std::size_t rebuild_workers{4};              // NOLINT(readability-identifier-naming)
  std::size_t persistence_queue_capacity{64};  // NOLINT(readability-identifier-naming)
  // Added to a caller-supplied score threshold before filtering.
  double score_threshold_slack{0.0};  // NOLINT(readability-identifier-naming)
  std::size_t default_fetch_k{20};    // NOLINT(readability-identifier-naming)
};

// Throws core::ValidationError on out-of-range values.
void validate(const VectorStoreConfig& config);

// Reads a config object; every key is optional and falls back to the default.
// Throws core::ValidationError on wrong types or out-of-range values.
[[nodiscard]] VectorStoreConfig vector_store_config_from_json(const nlohmann::json& j);

[[nodiscard]] nlohmann::json to_json(const VectorStoreConfig& config);

}  // namespace docvec::store
