#include "docvec/store/snapshot_codec.h"

#include "docvec/core/errors.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <system_error>

namespace docvec::store {

SnapshotPaths snapshot_paths(const std::filesystem::path& folder, const std::string& name) {
  return SnapshotPaths{folder / (name + ".vectors"), folder / (name + ".meta")};
}

bool snapshot_exists(const SnapshotPaths& paths) {
  std::error_code ec;
  return std::filesystem::exists(paths.vectors, ec) && std::filesystem::exists(paths.meta, ec);
}

void write_snapshot(const SnapshotPaths& paths, const vector::ISimilarityIndex& index,
                    const DocStore& docstore, const IndexMapping& mapping) {
  std::error_code ec;
  const auto folder = paths.vectors.parent_path();
  if (!folder.empty()) {
    std::filesystem::create_directories(folder, ec);
    if (ec) {
      throw core::PersistenceError("cannot create folder " + folder.string() + ": " +
                                   ec.message());
    }
  }

  {
    std::ofstream out(paths.vectors, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw core::PersistenceError("cannot open " + paths.vectors.string() + " for writing");
    }
    try {
      index.write(out);
    } catch (const std::runtime_error& e) {
      throw core::PersistenceError(paths.vectors.string() + ": " + e.what());
    }
    out.flush();
    if (!out) {
      throw core::PersistenceError("write failed: " + paths.vectors.string());
    }
  }

  nlohmann::json meta;
  meta["format_version"] = kSnapshotFormatVersion;
  meta["docstore"] = nlohmann::json::array();
  for (const auto& [id, document] : docstore.entries()) {
    meta["docstore"].push_back({{"id", id}, {"document", domain::document_to_json(document)}});
  }
  meta["index_to_docstore_id"] = mapping.ids();

  std::ofstream out(paths.meta, std::ios::trunc);
  if (!out) {
    throw core::PersistenceError("cannot open " + paths.meta.string() + " for writing");
  }
  out << meta.dump();
  out.flush();
  if (!out) {
    throw core::PersistenceError("write failed: " + paths.meta.string());
  }
}

LoadedSnapshot read_snapshot(const SnapshotPaths& paths) {
  LoadedSnapshot snapshot;

  std::ifstream vectors_in(paths.vectors, std::ios::binary);
  if (!vectors_in) {
    throw core::PersistenceError("cannot open " + paths.vectors.string());
  }
  try {
    snapshot.index = vector::FlatL2Index::read(vectors_in);
  } catch (const std::runtime_error& e) {
    throw core::PersistenceError(paths.vectors.string() + ": " + e.what());
  }

  std::ifstream meta_in(paths.meta);
  if (!meta_in) {
    throw core::PersistenceError("cannot open " + paths.meta.string());
  }
  try {
    const auto meta = nlohmann::json::parse(meta_in);
    const int version = meta.at("format_version").get<int>();
    if (version != kSnapshotFormatVersion) {
      throw core::PersistenceError(paths.meta.string() + ": unsupported format version " +
                                   std::to_string(version));
    }
    for (const auto& entry : meta.at("docstore")) {
      snapshot.docstore.add(entry.at("id").get<std::string>(),
                            domain::document_from_json(entry.at("document")));
    }
    snapshot.mapping =
        IndexMapping(meta.at("index_to_docstore_id").get<std::vector<std::string>>());
  } catch (const nlohmann::json::exception& e) {
    throw core::PersistenceError(paths.meta.string() + ": " + e.what());
  }

  const auto n = snapshot.index->count();
  if (snapshot.mapping.size() != n || snapshot.docstore.size() != n) {
    throw core::PersistenceError("snapshot size mismatch: index=" + std::to_string(n) +
                                 " mapping=" + std::to_string(snapshot.mapping.size()) +
                                 " docstore=" + std::to_string(snapshot.docstore.size()));
  }
  if (snapshot.mapping.reverse().size() != n) {
    throw core::PersistenceError("snapshot maps two slots to the same document id");
  }
  for (const auto& id : snapshot.mapping.ids()) {
    if (!snapshot.docstore.contains(id)) {
      throw core::PersistenceError("snapshot maps a slot to unknown document id " + id);
    }
  }
  return snapshot;
}

}  // namespace docvec::store
