#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace docvec::domain {

// Tags is an ordered set of unique strings.
// Insertion order is significant: the first and second entries are treated as the
// highest- and second-highest-priority tags by priority-based filter generation.
// The order is chosen by the caller and never re-derived here.
class Tags {
 public:
  Tags() = default;

  // Builds from a list, keeping the first occurrence of any duplicate.
  explicit Tags(const std::vector<std::string>& tags);

  // Appends tag unless already present. Returns false when rejected as a duplicate.
  bool add_tag(const std::string& tag);
  void add_tags(const std::vector<std::string>& tags);

  // Removes tag if present. Returns false (no-op) when absent.
  bool remove_tag(std::string_view tag);

  [[nodiscard]] bool has_tag(std::string_view tag) const;
  [[nodiscard]] const std::vector<std::string>& get_tags() const { return tags_; }
  [[nodiscard]] std::size_t size() const { return tags_.size(); }
  [[nodiscard]] bool empty() const { return tags_.empty(); }

  bool operator==(const Tags&) const = default;

 private:
  std::vector<std::string> tags_;
};

}  // namespace docvec::domain
