#pragma once

#include "docvec/vector/similarity_index.h"

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace docvec::store {

// IndexMapping maps similarity-index slots to document storage ids.
// Slots are always exactly 0..size()-1. remove() renumbers survivors in their
// original relative order, matching FlatL2Index's order-preserving compaction.
class IndexMapping {
 public:
  IndexMapping() = default;
  explicit IndexMapping(std::vector<std::string> ids) : ids_(std::move(ids)) {}

  // Appends ids to the next sequential slots.
  void append(const std::vector<std::string>& ids);

  [[nodiscard]] std::optional<std::string> id_at(vector::Slot slot) const;

  // id -> slot for every mapped id.
  [[nodiscard]] std::unordered_map<std::string, vector::Slot> reverse() const;

  void remove(const std::set<vector::Slot>& slots);

  void clear() { ids_.clear(); }

  [[nodiscard]] std::size_t size() const { return ids_.size(); }

  [[nodiscard]] const std::vector<std::string>& ids() const { return ids_; }

 private:
  std::vector<std::string> ids_;
};

}  // namespace docvec::store
