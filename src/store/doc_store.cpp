#include "docvec/store/doc_store.h"

#include <algorithm>
#include <unordered_set>

namespace docvec::store {

void DocStore::add(const std::string& id, domain::Document document) {
  const auto it = position_.find(id);
  if (it != position_.end()) {
    entries_[it->second].second = std::move(document);
    return;
  }
  position_.emplace(id, entries_.size());
  entries_.emplace_back(id, std::move(document));
}

const domain::Document* DocStore::search(const std::string& id) const {
  const auto it = position_.find(id);
  if (it == position_.end()) {
    return nullptr;
  }
  return &entries_[it->second].second;
}

bool DocStore::contains(const std::string& id) const {
  return position_.count(id) > 0;
}

std::size_t DocStore::remove(const std::vector<std::string>& ids) {
  std::unordered_set<std::string> doomed;
  for (const auto& id : ids) {
    if (position_.count(id) > 0) {
      doomed.insert(id);
    }
  }
  if (doomed.empty()) {
    return 0;
  }

  std::size_t first_changed = entries_.size();
  for (const auto& id : doomed) {
    first_changed = std::min(first_changed, position_.at(id));
    position_.erase(id);
  }

  entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                [&doomed](const Entry& e) { return doomed.count(e.first) > 0; }),
                 entries_.end());
  reindex_from(first_changed);
  return doomed.size();
}

void DocStore::clear() {
  entries_.clear();
  position_.clear();
}

void DocStore::reindex_from(const std::size_t first) {
  for (std::size_t i = first; i < entries_.size(); ++i) {
    position_[entries_[i].first] = i;
  }
}

}  // namespace docvec::store
