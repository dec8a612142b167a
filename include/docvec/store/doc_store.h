#pragma once

#include "docvec/domain/document.h"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace docvec::store {

// DocStore is an id-keyed table of documents with deterministic insertion-order
// iteration. Overwriting an existing id replaces the document in place and keeps
// its original position.
//
// Not synchronised; VectorStore guards it with its mutation lock.
class DocStore {
 public:
  using Entry = std::pair<std::string, domain::Document>;

  void add(const std::string& id, domain::Document document);

  // Returns nullptr when the id is absent.
  [[nodiscard]] const domain::Document* search(const std::string& id) const;

  [[nodiscard]] bool contains(const std::string& id) const;

  // Deletes every listed id that is present. Returns the number deleted.
  std::size_t remove(const std::vector<std::string>& ids);

  void clear();

  [[nodiscard]] std::size_t size() const { return entries_.size(); }
  [[nodiscard]] bool empty() const { return entries_.empty(); }

  [[nodiscard]] const std::vector<Entry>& entries() const { return entries_; }

 private:
  void reindex_from(std::size_t first);

  std::vector<Entry> entries_;
  std::unordered_map<std::string, std::size_t> position_;
};

}  // namespace docvec::store
