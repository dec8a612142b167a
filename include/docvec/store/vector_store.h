#pragma once

#include "docvec/core/clock.h"
#include "docvec/core/id_generator.h"
#include "docvec/domain/document.h"
#include "docvec/domain/tags.h"
#include "docvec/embedding/embedding_provider.h"
#include "docvec/store/doc_store.h"
#include "docvec/store/index_mapping.h"
#include "docvec/store/persistence_manager.h"
#include "docvec/store/tag_filter.h"
#include "docvec/store/vector_store_config.h"
#include "docvec/vector/similarity_index.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace docvec::store {

struct SearchOptions {
  std::size_t k{5};                          // NOLINT(readability-identifier-naming)
  std::optional<domain::Tags> filter_tags;   // NOLINT(readability-identifier-naming)
  std::optional<std::size_t> fetch_k;        // default: config.default_fetch_k
  std::optional<double> score_threshold;     // NOLINT(readability-identifier-naming)
  bool powerset{true};                       // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> now_epoch_seconds;  // default: the store's clock
};

struct ScoredDocument {
  std::string id;             // NOLINT(readability-identifier-naming)
  domain::Document document;  // NOLINT(readability-identifier-naming)
  float distance;             // NOLINT(readability-identifier-naming)
};

struct RemovalResult {
  std::vector<domain::Document> removed;  // NOLINT(readability-identifier-naming)
  std::size_t n_removed{0};               // NOLINT(readability-identifier-naming)
  std::size_t n_total{0};                 // NOLINT(readability-identifier-naming)
};

// VectorStore keeps a similarity index, a document table and the slot -> id
// mapping between them mutually consistent.
//
// Invariant after every completed mutation:
//   docstore.size() == mapping.size() == index.count(), mapping slots are 0..N-1.
//
// Locking: one reader-writer lock. add / remove / rebuild take it exclusively;
// search, get_all_documents and snapshot writes take it shared.
//
// Persistence: an existing <folder>/<index_name> snapshot is loaded by the
// constructor, after recover_interrupted_save() has dealt with leftover backups.
// save_index() only enqueues; the worker rebuilds and writes later.
class VectorStore final : public ISnapshotSource {
 public:
  // Throws core::ValidationError on a bad config and core::PersistenceError when an
  // existing snapshot cannot be loaded or its dimension differs from the embedder's.
  VectorStore(VectorStoreConfig config, const embedding::IEmbeddingProvider& embedder,
              core::IClock& clock, core::IIdGenerator& id_gen);
  ~VectorStore() override;

  VectorStore(const VectorStore&) = delete;
  VectorStore& operator=(const VectorStore&) = delete;
  VectorStore(VectorStore&&) = delete;
  VectorStore& operator=(VectorStore&&) = delete;

  // Embeds docs in one batch, rejects near-duplicates, appends the rest.
  // A document is rejected when its cosine similarity to one of its
  // config.dedup_neighbours nearest stored documents, or to an earlier accepted
  // document of the same batch, is greater than similarity_threshold
  // (default config.dedup_threshold).
  // Throws core::ValidationError for id-count mismatch, duplicate, empty or already
  // stored ids, or any text that is not valid UTF-8; core::EmbeddingUnavailableError
  // when the embedder fails.
  std::vector<domain::Document> add_documents(
      const std::vector<domain::Document>& docs,
      const std::optional<std::vector<std::string>>& ids = std::nullopt,
      std::optional<double> similarity_threshold = std::nullopt);

  // As add_documents, returning the storage id of every accepted document.
  std::vector<domain::StoredDocument> add_documents_with_ids(
      const std::vector<domain::Document>& docs,
      const std::optional<std::vector<std::string>>& ids = std::nullopt,
      std::optional<double> similarity_threshold = std::nullopt);

  // nullopt clears everything. Otherwise throws core::ValidationError for an empty
  // or duplicated id list and core::NotFoundError when any id is not stored.
  RemovalResult remove_documents_by_id(const std::optional<std::vector<std::string>>& ids);

  // Removes every document whose metadata.ids is listed. Zero matches is not an error.
  // Throws core::ValidationError when metadata_ids is empty.
  RemovalResult delete_documents_by_ids(const std::vector<std::string>& metadata_ids);

  [[nodiscard]] std::vector<domain::Document> search(std::string_view query,
                                                     const SearchOptions& options = {}) const;

  [[nodiscard]] std::vector<ScoredDocument> search_with_scores(
      std::string_view query, const SearchOptions& options = {}) const;

  // Pipeline: tag expansion, fetch (fetch_k with a filter, k without), resolve,
  // filter, score threshold (distance <= threshold + slack), validity, truncate to k.
  // Throws core::StoreConsistencyError when a slot resolves to no document.
  [[nodiscard]] std::vector<ScoredDocument> search_by_vector(
      const vector::Vector& embedding, const SearchOptions& options = {}) const;

  // Enqueues a save of the live state. Empty name means config.index_name.
  // Returns false when a save under that name was already pending.
  bool save_index(const std::string& name = "");

  // Re-embeds every stored document across config.rebuild_workers threads and swaps
  // in the fresh index and mapping. On failure the live state is untouched.
  void rebuild_index();

  [[nodiscard]] std::vector<domain::StoredDocument> get_all_documents() const;

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t dimension() const { return dimension_; }

  // Throws core::StoreConsistencyError when the structural invariant does not hold.
  void check_consistency() const;

  // Blocks until every queued save has been processed.
  void wait_for_persistence();

  [[nodiscard]] PersistenceStats persistence_stats() const;
  void set_persistence_failure_listener(PersistenceFailureListener listener);

  [[nodiscard]] const VectorStoreConfig& config() const { return config_; }

  // ISnapshotSource
  void rebuild_for_snapshot() override;
  void write_snapshot_to(const SnapshotPaths& paths) override;

 private:
  [[nodiscard]] std::vector<vector::Vector> embed_checked(
      const std::vector<std::string>& texts) const;

  // Indices into embeddings of the documents that survive the dedup probe.
  // Runs under the shared lock; probed_generation receives add_generation_ as seen.
  [[nodiscard]] std::vector<std::size_t> dedup(const std::vector<vector::Vector>& embeddings,
                                               double threshold,
                                               std::uint64_t& probed_generation) const;

  // Caller holds mutex_ exclusively. Drops entries of keep that are near-duplicates
  // of stored vectors; used when other adds landed after the dedup probe.
  [[nodiscard]] std::vector<std::size_t> recheck_locked(
      const std::vector<vector::Vector>& embeddings, const std::vector<std::size_t>& keep,
      double threshold) const;

  // Caller holds mutex_ exclusively.
  RemovalResult remove_locked(const std::vector<std::string>& ids);
  RemovalResult clear_locked();
  void check_consistency_locked() const;

  VectorStoreConfig config_;
  const embedding::IEmbeddingProvider& embedder_;
  core::IClock& clock_;
  core::IIdGenerator& id_gen_;
  std::size_t dimension_;

  mutable std::shared_mutex mutex_;
  std::unique_ptr<vector::ISimilarityIndex> index_;
  DocStore docstore_;
  IndexMapping mapping_;
  std::uint64_t add_generation_{0};  // bumped by every append, guarded by mutex_

  std::unique_ptr<PersistenceManager> persistence_;
};

}  // namespace docvec::store
