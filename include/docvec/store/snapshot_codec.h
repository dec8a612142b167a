#pragma once

#include "docvec/store/doc_store.h"
#include "docvec/store/index_mapping.h"
#include "docvec/vector/flat_l2_index.h"

#include <filesystem>
#include <memory>
#include <string>

namespace docvec::store {

// On-disk snapshot of one named index: two sibling files in one folder.
//   <name>.vectors  FlatL2Index binary layout (see flat_l2_index.h)
//   <name>.meta     JSON:
//     {
//       "format_version": 1,
//       "docstore": [{"id": "...", "document": {...}}, ...],   // iteration order
//       "index_to_docstore_id": ["...", ...]                     // entry i is slot i
//     }
struct SnapshotPaths {
  std::filesystem::path vectors;  // NOLINT(readability-identifier-naming)
  std::filesystem::path meta;     // NOLINT(readability-identifier-naming)
};

inline constexpr int kSnapshotFormatVersion = 1;

[[nodiscard]] SnapshotPaths snapshot_paths(const std::filesystem::path& folder,
                                           const std::string& name);

// True when both files exist.
[[nodiscard]] bool snapshot_exists(const SnapshotPaths& paths);

struct LoadedSnapshot {
  std::unique_ptr<vector::FlatL2Index> index;  // NOLINT(readability-identifier-naming)
  DocStore docstore;                           // NOLINT(readability-identifier-naming)
  IndexMapping mapping;                        // NOLINT(readability-identifier-naming)
};

// Writes both files, creating the folder when missing.
// Throws core::PersistenceError on I/O failure.
void write_snapshot(const SnapshotPaths& paths, const vector::ISimilarityIndex& index,
                    const DocStore& docstore, const IndexMapping& mapping);

// Reads and cross-checks both files: index count, mapping size and docstore size
// must agree and every mapped id must be present in the docstore.
// Throws core::PersistenceError on I/O failure, malformed content, or a mismatch.
[[nodiscard]] LoadedSnapshot read_snapshot(const SnapshotPaths& paths);

}  // namespace docvec::store
