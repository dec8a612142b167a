#pragma once

#include "docvec/store/vector_store.h"

#include <cstddef>
#include <string_view>
#include <vector>

namespace docvec::store {

// AdaptiveSearchPolicy loosens the score threshold step by step until enough
// documents come back. The threshold never exceeds initial + step * attempt_limit.
struct AdaptiveSearchPolicy {
  double initial_threshold{0.6};  // NOLINT(readability-identifier-naming)
  double step{0.05};              // NOLINT(readability-identifier-naming)
  std::size_t attempt_limit{10};  // NOLINT(readability-identifier-naming)
  std::size_t min_documents{1};   // NOLINT(readability-identifier-naming)

  [[nodiscard]] double max_threshold() const {
    return initial_threshold + step * static_cast<double>(attempt_limit);
  }
};

struct AdaptiveSearchResult {
  std::vector<domain::Document> documents;  // NOLINT(readability-identifier-naming)
  std::size_t attempts{0};                  // NOLINT(readability-identifier-naming)
  double last_threshold{0.0};               // threshold used by the final attempt
};

// adaptive_search runs store.search() with options.score_threshold replaced by the
// policy's threshold, up to attempt_limit times, stopping as soon as at least
// min_documents are returned. Returns the last attempt's documents.
[[nodiscard]] AdaptiveSearchResult adaptive_search(const VectorStore& store,
                                                   std::string_view query,
                                                   SearchOptions options,
                                                   const AdaptiveSearchPolicy& policy);

}  // namespace docvec::store
