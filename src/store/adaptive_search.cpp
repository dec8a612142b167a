#include "docvec/store/adaptive_search.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace docvec::store {

AdaptiveSearchResult adaptive_search(const VectorStore& store, const std::string_view query,
                                     SearchOptions options, const AdaptiveSearchPolicy& policy) {
  AdaptiveSearchResult result;
  double threshold = policy.initial_threshold;

  while (result.attempts < policy.attempt_limit &&
         result.documents.size() < policy.min_documents) {
    options.score_threshold = threshold;
    result.documents = store.search(query, options);
    result.last_threshold = threshold;
    ++result.attempts;

    threshold = std::min(threshold + policy.step, policy.max_threshold());
  }

  spdlog::debug("[AdaptiveSearch] {} documents after {} attempts (threshold={:.2f})",
                result.documents.size(), result.attempts, result.last_threshold);
  return result;
}

}  // namespace docvec::store
