#pragma once

#include "docvec/domain/metadata.h"
#include "docvec/domain/tags.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace docvec::store {

// Tag lists longer than this are rejected: candidate counts grow factorially.
inline constexpr std::size_t kMaxExpandableTags = 8;

using TagCandidate = std::vector<std::string>;
using TagCandidates = std::vector<TagCandidate>;

// MetadataFilter maps a metadata key to the list of accepted values.
// A document matches iff, for every key, its metadata value (in metadata_to_json
// form) equals one of the accepted values. A missing key reads as null.
// Arrays compare element-wise, so a tags clause is an exact-order match.
class MetadataFilter {
 public:
  void require(const std::string& key, std::vector<nlohmann::json> accepted);

  [[nodiscard]] bool matches(const domain::Metadata& metadata) const;
  [[nodiscard]] bool matches_json(const nlohmann::json& metadata) const;

  [[nodiscard]] bool empty() const { return clauses_.empty(); }
  [[nodiscard]] const std::map<std::string, std::vector<nlohmann::json>>& clauses() const {
    return clauses_;
  }

 private:
  std::map<std::string, std::vector<nlohmann::json>> clauses_;
};

enum class TagExpansion {
  kPowerset,  // every subset, every ordering
  kPriority,  // orderings led by the first or second tag, plus singletons
};

// TagFilterEngine expands a caller's tag list into the exact tag orderings a
// stored document may carry and still match.
class TagFilterEngine {
 public:
  // All 2^n subsets including the empty one, every permutation of each,
  // deduplicated and sorted by (length, lexicographic).
  // ["a","b"] -> [], [a], [b], [a,b], [b,a]
  [[nodiscard]] static TagCandidates powerset_with_permutations(
      const std::vector<std::string>& tags);

  // Combinations of size n and, when n > 2, of size n-1, each permuted; only
  // permutations starting with tags[0] or tags[1] are kept. Enumeration follows
  // index order. When n > 1 every tag is appended as a singleton.
  [[nodiscard]] static TagCandidates priority_based_permutations(
      const std::vector<std::string>& tags);

  [[nodiscard]] static TagCandidates expand(const std::vector<std::string>& tags,
                                            TagExpansion expansion);

  // Returns nullopt when tags is empty (no filter).
  // Throws core::ValidationError when tags holds more than kMaxExpandableTags entries.
  [[nodiscard]] static std::optional<MetadataFilter> to_filter(const domain::Tags& tags,
                                                               TagExpansion expansion);
};

}  // namespace docvec::store
