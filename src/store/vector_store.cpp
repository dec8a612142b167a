#include "docvec/store/vector_store.h"

#include "docvec/core/errors.h"
#include "docvec/core/normalization.h"
#include "docvec/store/snapshot_codec.h"
#include "docvec/vector/distance.h"
#include "docvec/vector/flat_l2_index.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <future>
#include <iterator>
#include <mutex>
#include <set>
#include <string_view>
#include <unordered_set>
#include <utility>

namespace docvec::store {

namespace {

void require_utf8(const std::string_view text, const char* field) {
  if (!core::is_valid_utf8(text)) {
    throw core::ValidationError(std::string(field) + " is not valid UTF-8");
  }
}

// Everything that ends up in the snapshot meta file must be valid UTF-8.
void require_utf8(const domain::Document& doc) {
  require_utf8(doc.page_content, "page_content");
  require_utf8(doc.metadata.ids, "metadata.ids");
  require_utf8(doc.metadata.splitter, "metadata.splitter");
  for (const auto& tag : doc.metadata.tags.get_tags()) {
    require_utf8(tag, "metadata.tags");
  }
}

}  // namespace

VectorStore::VectorStore(VectorStoreConfig config, const embedding::IEmbeddingProvider& embedder,
                         core::IClock& clock, core::IIdGenerator& id_gen)
    : config_(std::move(config)),
      embedder_(embedder),
      clock_(clock),
      id_gen_(id_gen),
      dimension_(embedder.dimension()) {
  validate(config_);
  if (dimension_ == 0) {
    throw core::ValidationError("embedder reports dimension 0");
  }

  const auto paths = snapshot_paths(config_.folder_path, config_.index_name);
  recover_interrupted_save(paths);
  if (snapshot_exists(paths)) {
    auto loaded = read_snapshot(paths);
    if (loaded.index->dimension() != dimension_) {
      throw core::PersistenceError("snapshot " + paths.vectors.string() + " has dimension " +
                                   std::to_string(loaded.index->dimension()) +
                                   ", embedder produces " + std::to_string(dimension_));
    }
    index_ = std::move(loaded.index);
    docstore_ = std::move(loaded.docstore);
    mapping_ = std::move(loaded.mapping);
    spdlog::info("[VectorStore] Loaded {} documents from {}", docstore_.size(),
                 paths.meta.string());
  } else {
    index_ = std::make_unique<vector::FlatL2Index>(dimension_);
    spdlog::debug("[VectorStore] No snapshot at {}, starting empty (dimension={})",
                  paths.meta.string(), dimension_);
  }

  persistence_ = std::make_unique<PersistenceManager>(*this, config_.folder_path,
                                                      config_.persistence_queue_capacity);
}

VectorStore::~VectorStore() {
  // Queued saves still read this store; drain them before members go away.
  persistence_->shutdown();
}

// ────────────────────────────────────────────────────────────────
// Embedding
// ────────────────────────────────────────────────────────────────

std::vector<vector::Vector> VectorStore::embed_checked(
    const std::vector<std::string>& texts) const {
  std::vector<vector::Vector> vectors;
  try {
    vectors = embedder_.embed_many(texts);
  } catch (const core::EmbeddingUnavailableError&) {
    throw;
  } catch (const std::exception& e) {
    throw core::EmbeddingUnavailableError(std::string("embedder failed: ") + e.what());
  }

  if (vectors.size() != texts.size()) {
    throw core::EmbeddingUnavailableError("embedder returned " + std::to_string(vectors.size()) +
                                          " vectors for " + std::to_string(texts.size()) +
                                          " texts");
  }
  for (const auto& v : vectors) {
    if (v.size() != dimension_) {
      throw core::EmbeddingUnavailableError("embedder returned dimension " +
                                            std::to_string(v.size()) + ", expected " +
                                            std::to_string(dimension_));
    }
  }
  return vectors;
}

// ────────────────────────────────────────────────────────────────
// Add
// ────────────────────────────────────────────────────────────────

std::vector<std::size_t> VectorStore::dedup(const std::vector<vector::Vector>& embeddings,
                                            const double threshold,
                                            std::uint64_t& probed_generation) const {
  std::vector<std::vector<vector::Vector>> neighbours(embeddings.size());

  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    probed_generation = add_generation_;
    if (index_->count() > 0 && config_.dedup_neighbours > 0) {
      std::vector<std::string> texts;
      std::vector<std::size_t> owners;
      for (std::size_t i = 0; i < embeddings.size(); ++i) {
        for (const auto& hit : index_->search(embeddings[i], config_.dedup_neighbours)) {
          if (hit.slot == vector::kEmptySlot) {
            continue;
          }
          if (config_.dedup_neighbour_source == DedupNeighbourSource::kStoredVector) {
            neighbours[i].push_back(index_->reconstruct(hit.slot));
            continue;
          }
          const auto id = mapping_.id_at(hit.slot);
          const domain::Document* doc = id.has_value() ? docstore_.search(id.value()) : nullptr;
          if (doc == nullptr) {
            throw core::StoreConsistencyError("slot " + std::to_string(hit.slot) +
                                              " has no stored document");
          }
          texts.push_back(doc->page_content);
          owners.push_back(i);
        }
      }
      if (!texts.empty()) {
        auto reembedded = embed_checked(texts);
        for (std::size_t j = 0; j < reembedded.size(); ++j) {
          neighbours[owners[j]].push_back(std::move(reembedded[j]));
        }
      }
    }
  }

  std::vector<std::size_t> accepted;
  for (std::size_t i = 0; i < embeddings.size(); ++i) {
    bool duplicate = false;
    for (const auto& neighbour : neighbours[i]) {
      const double similarity = vector::cosine_similarity(embeddings[i], neighbour);
      if (similarity > threshold) {
        spdlog::debug("[VectorStore] Rejected near-duplicate document (similarity={:.4f})",
                      similarity);
        duplicate = true;
        break;
      }
    }
    for (std::size_t j = 0; !duplicate && j < accepted.size(); ++j) {
      const double similarity = vector::cosine_similarity(embeddings[i], embeddings[accepted[j]]);
      if (similarity > threshold) {
        spdlog::debug("[VectorStore] Rejected near-duplicate within batch (similarity={:.4f})",
                      similarity);
        duplicate = true;
      }
    }
    if (!duplicate) {
      accepted.push_back(i);
    }
  }
  return accepted;
}

std::vector<std::size_t> VectorStore::recheck_locked(const std::vector<vector::Vector>& embeddings,
                                                     const std::vector<std::size_t>& keep,
                                                     const double threshold) const {
  std::vector<std::size_t> still_unique;
  for (const auto i : keep) {
    bool duplicate = false;
    for (const auto& hit : index_->search(embeddings[i], config_.dedup_neighbours)) {
      if (hit.slot == vector::kEmptySlot) {
        continue;
      }
      const double similarity =
          vector::cosine_similarity(embeddings[i], index_->reconstruct(hit.slot));
      if (similarity > threshold) {
        spdlog::debug("[VectorStore] Rejected concurrent near-duplicate (similarity={:.4f})",
                      similarity);
        duplicate = true;
        break;
      }
    }
    if (!duplicate) {
      still_unique.push_back(i);
    }
  }
  return still_unique;
}

std::vector<domain::Document> VectorStore::add_documents(
    const std::vector<domain::Document>& docs, const std::optional<std::vector<std::string>>& ids,
    const std::optional<double> similarity_threshold) {
  std::vector<domain::Document> out;
  for (auto& stored : add_documents_with_ids(docs, ids, similarity_threshold)) {
    out.push_back(std::move(stored.document));
  }
  return out;
}

std::vector<domain::StoredDocument> VectorStore::add_documents_with_ids(
    const std::vector<domain::Document>& docs, const std::optional<std::vector<std::string>>& ids,
    const std::optional<double> similarity_threshold) {
  if (docs.empty()) {
    return {};
  }
  for (const auto& doc : docs) {
    require_utf8(doc);
  }

  std::vector<std::string> storage_ids;
  if (ids.has_value()) {
    if (ids->size() != docs.size()) {
      throw core::ValidationError("got " + std::to_string(ids->size()) + " ids for " +
                                  std::to_string(docs.size()) + " documents");
    }
    std::unordered_set<std::string> seen;
    for (const auto& id : ids.value()) {
      if (id.empty()) {
        throw core::ValidationError("document ids must not be empty");
      }
      require_utf8(id, "document id");
      if (!seen.insert(id).second) {
        throw core::ValidationError("duplicate document id in request: " + id);
      }
    }
    storage_ids = ids.value();
  } else {
    storage_ids.reserve(docs.size());
    for (std::size_t i = 0; i < docs.size(); ++i) {
      storage_ids.push_back(id_gen_.next());
    }
  }

  std::vector<std::string> texts;
  texts.reserve(docs.size());
  for (const auto& doc : docs) {
    texts.push_back(doc.page_content);
  }
  auto embeddings = embed_checked(texts);

  const double threshold = similarity_threshold.value_or(config_.dedup_threshold);
  std::uint64_t probed_generation = 0;
  auto keep = dedup(embeddings, threshold, probed_generation);

  std::vector<domain::StoredDocument> accepted;
  if (!keep.empty()) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    // Documents appended between the probe and this lock were not compared.
    if (add_generation_ != probed_generation) {
      keep = recheck_locked(embeddings, keep, threshold);
    }

    std::vector<vector::Vector> accepted_vectors;
    std::vector<std::string> accepted_ids;
    accepted.reserve(keep.size());
    for (const auto i : keep) {
      if (docstore_.contains(storage_ids[i])) {
        throw core::ValidationError("document id already stored: " + storage_ids[i]);
      }
      accepted.push_back(domain::StoredDocument{storage_ids[i], docs[i]});
      accepted_vectors.push_back(std::move(embeddings[i]));
      accepted_ids.push_back(storage_ids[i]);
    }

    if (!accepted.empty()) {
      index_->add(accepted_vectors);
      mapping_.append(accepted_ids);
      for (const auto& stored : accepted) {
        docstore_.add(stored.id, stored.document);
      }
      ++add_generation_;
    }
  }

  spdlog::debug("[VectorStore] Added {} of {} documents", accepted.size(), docs.size());
  return accepted;
}

// ────────────────────────────────────────────────────────────────
// Remove
// ────────────────────────────────────────────────────────────────

RemovalResult VectorStore::clear_locked() {
  RemovalResult result;
  result.n_total = index_->count();
  result.n_removed = result.n_total;
  result.removed.reserve(docstore_.size());
  for (const auto& [id, document] : docstore_.entries()) {
    result.removed.push_back(document);
  }
  index_->reset();
  mapping_.clear();
  docstore_.clear();
  return result;
}

RemovalResult VectorStore::remove_locked(const std::vector<std::string>& ids) {
  if (ids.empty()) {
    throw core::ValidationError("removal id list must not be empty");
  }
  if (std::set<std::string>(ids.begin(), ids.end()).size() != ids.size()) {
    throw core::ValidationError("duplicate ids in the list of ids to remove");
  }
  for (const auto& id : ids) {
    if (!docstore_.contains(id)) {
      throw core::NotFoundError("no document with id " + id);
    }
  }

  const auto reverse = mapping_.reverse();
  RemovalResult result;
  result.n_total = index_->count();

  std::set<vector::Slot> slots;
  for (const auto& id : ids) {
    const auto it = reverse.find(id);
    if (it == reverse.end()) {
      throw core::StoreConsistencyError("document " + id + " is stored but not indexed");
    }
    slots.insert(it->second);
    result.removed.push_back(*docstore_.search(id));
  }

  result.n_removed = index_->remove(slots);
  mapping_.remove(slots);
  docstore_.remove(ids);
  return result;
}

RemovalResult VectorStore::remove_documents_by_id(
    const std::optional<std::vector<std::string>>& ids) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto result = ids.has_value() ? remove_locked(ids.value()) : clear_locked();
  spdlog::info("[VectorStore] Removed {} of {} documents", result.n_removed, result.n_total);
  return result;
}

RemovalResult VectorStore::delete_documents_by_ids(const std::vector<std::string>& metadata_ids) {
  if (metadata_ids.empty()) {
    throw core::ValidationError("target metadata ids cannot be empty");
  }
  const std::unordered_set<std::string> targets(metadata_ids.begin(), metadata_ids.end());

  std::unique_lock<std::shared_mutex> lock(mutex_);
  std::vector<std::string> storage_ids;
  for (const auto& [id, document] : docstore_.entries()) {
    if (targets.count(document.metadata.ids) > 0) {
      storage_ids.push_back(id);
    }
  }
  if (storage_ids.empty()) {
    RemovalResult result;
    result.n_total = index_->count();
    return result;
  }

  auto result = remove_locked(storage_ids);
  spdlog::info("[VectorStore] Removed {} of {} documents", result.n_removed, result.n_total);
  return result;
}

// ────────────────────────────────────────────────────────────────
// Search
// ────────────────────────────────────────────────────────────────

std::vector<domain::Document> VectorStore::search(const std::string_view query,
                                                  const SearchOptions& options) const {
  std::vector<domain::Document> out;
  for (auto& scored : search_with_scores(query, options)) {
    out.push_back(std::move(scored.document));
  }
  return out;
}

std::vector<ScoredDocument> VectorStore::search_with_scores(const std::string_view query,
                                                            const SearchOptions& options) const {
  auto vectors = embed_checked({std::string(query)});
  return search_by_vector(vectors.front(), options);
}

std::vector<ScoredDocument> VectorStore::search_by_vector(const vector::Vector& embedding,
                                                          const SearchOptions& options) const {
  if (embedding.size() != dimension_) {
    throw core::ValidationError("query vector has dimension " + std::to_string(embedding.size()) +
                                ", store dimension is " + std::to_string(dimension_));
  }
  if (options.k == 0) {
    return {};
  }

  std::optional<MetadataFilter> filter;
  if (options.filter_tags.has_value()) {
    filter = TagFilterEngine::to_filter(
        options.filter_tags.value(),
        options.powerset ? TagExpansion::kPowerset : TagExpansion::kPriority);
  }
  const std::size_t fetch =
      filter.has_value() ? options.fetch_k.value_or(config_.default_fetch_k) : options.k;

  std::vector<ScoredDocument> candidates;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& hit : index_->search(embedding, fetch)) {
      if (hit.slot == vector::kEmptySlot) {
        continue;
      }
      const auto id = mapping_.id_at(hit.slot);
      if (!id.has_value()) {
        throw core::StoreConsistencyError("slot " + std::to_string(hit.slot) + " is not mapped");
      }
      const domain::Document* doc = docstore_.search(id.value());
      if (doc == nullptr) {
        throw core::StoreConsistencyError("could not find document for id " + id.value());
      }
      if (filter.has_value() && !filter->matches(doc->metadata)) {
        continue;
      }
      candidates.push_back(ScoredDocument{id.value(), *doc, hit.distance});
    }
  }

  if (options.score_threshold.has_value()) {
    const double limit = options.score_threshold.value() + config_.score_threshold_slack;
    candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                    [limit](const ScoredDocument& c) {
                                      return static_cast<double>(c.distance) > limit;
                                    }),
                     candidates.end());
  }

  const std::int64_t now = options.now_epoch_seconds.value_or(clock_.now_epoch_seconds());
  candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                  [now](const ScoredDocument& c) {
                                    return !c.document.is_valid_at(now);
                                  }),
                   candidates.end());

  if (candidates.size() > options.k) {
    candidates.resize(options.k);
  }
  return candidates;
}

// ────────────────────────────────────────────────────────────────
// Rebuild / persistence
// ────────────────────────────────────────────────────────────────

bool VectorStore::save_index(const std::string& name) {
  return persistence_->enqueue(name.empty() ? config_.index_name : name);
}

void VectorStore::rebuild_index() {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  const auto& entries = docstore_.entries();
  const std::size_t n = entries.size();
  std::vector<std::string> ids;
  std::vector<std::string> texts;
  ids.reserve(n);
  texts.reserve(n);
  for (const auto& [id, document] : entries) {
    ids.push_back(id);
    texts.push_back(document.page_content);
  }

  std::vector<vector::Vector> vectors;
  vectors.reserve(n);
  std::size_t workers = 0;
  if (n > 0) {
    workers = std::min(config_.rebuild_workers, n);
    const std::size_t chunk = (n + workers - 1) / workers;

    std::vector<std::future<std::vector<vector::Vector>>> parts;
    for (std::size_t start = 0; start < n; start += chunk) {
      const std::size_t end = std::min(n, start + chunk);
      parts.push_back(std::async(std::launch::async, [this, &texts, start, end] {
        return embed_checked(std::vector<std::string>(
            texts.begin() + static_cast<std::ptrdiff_t>(start),
            texts.begin() + static_cast<std::ptrdiff_t>(end)));
      }));
    }
    for (auto& part : parts) {
      auto chunk_vectors = part.get();
      std::move(chunk_vectors.begin(), chunk_vectors.end(), std::back_inserter(vectors));
    }
  }

  auto fresh = std::make_unique<vector::FlatL2Index>(dimension_);
  fresh->add(vectors);
  index_ = std::move(fresh);
  mapping_ = IndexMapping(std::move(ids));

  spdlog::info("[VectorStore] Rebuilt index with {} documents ({} workers)", n, workers);
}

void VectorStore::rebuild_for_snapshot() {
  rebuild_index();
}

void VectorStore::write_snapshot_to(const SnapshotPaths& paths) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  write_snapshot(paths, *index_, docstore_, mapping_);
}

void VectorStore::wait_for_persistence() {
  persistence_->wait_idle();
}

PersistenceStats VectorStore::persistence_stats() const {
  return persistence_->stats();
}

void VectorStore::set_persistence_failure_listener(PersistenceFailureListener listener) {
  persistence_->set_failure_listener(std::move(listener));
}

// ────────────────────────────────────────────────────────────────
// Introspection
// ────────────────────────────────────────────────────────────────

std::vector<domain::StoredDocument> VectorStore::get_all_documents() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<domain::StoredDocument> out;
  out.reserve(docstore_.size());
  for (const auto& [id, document] : docstore_.entries()) {
    out.push_back(domain::StoredDocument{id, document});
  }
  return out;
}

std::size_t VectorStore::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return docstore_.size();
}

void VectorStore::check_consistency() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  check_consistency_locked();
}

void VectorStore::check_consistency_locked() const {
  const std::size_t n = index_->count();
  if (mapping_.size() != n || docstore_.size() != n) {
    throw core::StoreConsistencyError("size mismatch: index=" + std::to_string(n) +
                                      " mapping=" + std::to_string(mapping_.size()) +
                                      " docstore=" + std::to_string(docstore_.size()));
  }
  if (mapping_.reverse().size() != n) {
    throw core::StoreConsistencyError("two slots map to the same document id");
  }
  for (const auto& id : mapping_.ids()) {
    if (!docstore_.contains(id)) {
      throw core::StoreConsistencyError("slot maps to unknown document id " + id);
    }
  }
}

}  // namespace docvec::store
