#include "docvec/domain/tags.h"

#include <algorithm>

namespace docvec::domain {

Tags::Tags(const std::vector<std::string>& tags) {
  add_tags(tags);
}

bool Tags::add_tag(const std::string& tag) {
  if (has_tag(tag)) {
    return false;
  }
  tags_.push_back(tag);
  return true;
}

void Tags::add_tags(const std::vector<std::string>& tags) {
  for (const auto& tag : tags) {
    add_tag(tag);
  }
}

bool Tags::remove_tag(const std::string_view tag) {
  const auto it = std::find(tags_.begin(), tags_.end(), tag);
  if (it == tags_.end()) {
    return false;
  }
  tags_.erase(it);
  return true;
}

bool Tags::has_tag(const std::string_view tag) const {
  return std::find(tags_.begin(), tags_.end(), tag) != tags_.end();
}

}  // namespace docvec::domain
