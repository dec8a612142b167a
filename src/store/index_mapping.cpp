#include "docvec/store/index_mapping.h"

namespace docvec::store {

void IndexMapping::append(const std::vector<std::string>& ids) {
  ids_.insert(ids_.end(), ids.begin(), ids.end());
}

std::optional<std::string> IndexMapping::id_at(const vector::Slot slot) const {
  if (slot < 0 || static_cast<std::size_t>(slot) >= ids_.size()) {
    return std::nullopt;
  }
  return ids_[static_cast<std::size_t>(slot)];
}

std::unordered_map<std::string, vector::Slot> IndexMapping::reverse() const {
  std::unordered_map<std::string, vector::Slot> out;
  out.reserve(ids_.size());
  for (std::size_t i = 0; i < ids_.size(); ++i) {
    out.emplace(ids_[i], static_cast<vector::Slot>(i));
  }
  return out;
}

void IndexMapping::remove(const std::set<vector::Slot>& slots) {
  if (slots.empty()) {
    return;
  }
  std::vector<std::string> survivors;
  survivors.reserve(ids_.size());
  for (std::size_t i = 0; i < ids_.size(); ++i) {
    if (slots.count(static_cast<vector::Slot>(i)) == 0) {
      survivors.push_back(std::move(ids_[i]));
    }
  }
  ids_ = std::move(survivors);
}

}  // namespace docvec::store
