#pragma once

#include "docvec/store/adaptive_search.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace docvec::app {

// ServiceConfig holds the document service's tunables.
//
// JSON form (every key optional):
//   {
//     "default_tags": ["faq"],
//     "find": {"initial_threshold": 0.6, "step": 0.05, "attempt_limit": 10,
//              "min_documents": 1, "k": 10}
//   }
struct ServiceConfig {
  // Prepended to the caller's tags by run_find_documents().
  std::vector<std::string> default_tags;  // NOLINT(readability-identifier-naming)
  store::AdaptiveSearchPolicy find_policy;  // NOLINT(readability-identifier-naming)
  std::size_t find_k{10};                   // NOLINT(readability-identifier-naming)
};

// Throws core::ValidationError on wrong types or out-of-range values.
[[nodiscard]] ServiceConfig service_config_from_json(const nlohmann::json& j);

}  // namespace docvec::app
