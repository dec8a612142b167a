#include "docvec/store/tag_filter.h"

#include "docvec/core/errors.h"

#include <algorithm>
#include <numeric>
#include <set>

namespace docvec::store {

namespace {

void check_expandable(const std::vector<std::string>& tags) {
  if (tags.size() > kMaxExpandableTags) {
    throw core::ValidationError("tag filter accepts at most " + std::to_string(kMaxExpandableTags) +
                                " tags, got " + std::to_string(tags.size()));
  }
}

// Visits every size-r combination of 0..n-1 in lexicographic index order.
template <typename Visitor>
void for_each_combination(const std::size_t n, const std::size_t r, Visitor&& visit) {
  if (r > n) {
    return;
  }
  std::vector<std::size_t> idx(r);
  std::iota(idx.begin(), idx.end(), 0);
  while (true) {
    visit(idx);
    std::size_t i = r;
    while (i > 0 && idx[i - 1] == n - r + (i - 1)) {
      --i;
    }
    if (i == 0) {
      return;
    }
    ++idx[i - 1];
    for (std::size_t j = i; j < r; ++j) {
      idx[j] = idx[j - 1] + 1;
    }
  }
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// MetadataFilter
// ────────────────────────────────────────────────────────────────

void MetadataFilter::require(const std::string& key, std::vector<nlohmann::json> accepted) {
  clauses_[key] = std::move(accepted);
}

bool MetadataFilter::matches(const domain::Metadata& metadata) const {
  if (clauses_.empty()) {
    return true;
  }
  return matches_json(domain::metadata_to_json(metadata));
}

bool MetadataFilter::matches_json(const nlohmann::json& metadata) const {
  for (const auto& [key, accepted] : clauses_) {
    const nlohmann::json value =
        metadata.contains(key) ? metadata.at(key) : nlohmann::json(nullptr);
    if (std::find(accepted.begin(), accepted.end(), value) == accepted.end()) {
      return false;
    }
  }
  return true;
}

// ────────────────────────────────────────────────────────────────
// TagFilterEngine
// ────────────────────────────────────────────────────────────────

TagCandidates TagFilterEngine::powerset_with_permutations(const std::vector<std::string>& tags) {
  check_expandable(tags);

  std::set<TagCandidate> unique;
  const std::size_t n = tags.size();
  for (std::size_t mask = 0; mask < (std::size_t{1} << n); ++mask) {
    TagCandidate subset;
    for (std::size_t i = 0; i < n; ++i) {
      if ((mask & (std::size_t{1} << i)) != 0) {
        subset.push_back(tags[i]);
      }
    }
    std::sort(subset.begin(), subset.end());
    do {
      unique.insert(subset);
    } while (std::next_permutation(subset.begin(), subset.end()));
  }

  TagCandidates out(unique.begin(), unique.end());
  std::stable_sort(out.begin(), out.end(), [](const TagCandidate& a, const TagCandidate& b) {
    if (a.size() != b.size()) {
      return a.size() < b.size();
    }
    return a < b;
  });
  return out;
}

TagCandidates TagFilterEngine::priority_based_permutations(const std::vector<std::string>& tags) {
  check_expandable(tags);

  TagCandidates out;
  const std::size_t n = tags.size();
  if (n == 0) {
    return out;
  }

  const auto leads_priority = [&tags, n](const std::string& first) {
    return first == tags[0] || (n > 1 && first == tags[1]);
  };

  const std::size_t smallest = n > 2 ? n - 1 : n;
  for (std::size_t r = n; r >= smallest; --r) {
    for_each_combination(n, r, [&](const std::vector<std::size_t>& combination) {
      std::vector<std::size_t> order = combination;
      do {
        if (!leads_priority(tags[order.front()])) {
          continue;
        }
        TagCandidate candidate;
        candidate.reserve(order.size());
        for (const auto i : order) {
          candidate.push_back(tags[i]);
        }
        if (std::find(out.begin(), out.end(), candidate) == out.end()) {
          out.push_back(std::move(candidate));
        }
      } while (std::next_permutation(order.begin(), order.end()));
    });
  }

  if (n > 1) {
    for (const auto& tag : tags) {
      out.push_back({tag});
    }
  }
  return out;
}

TagCandidates TagFilterEngine::expand(const std::vector<std::string>& tags,
                                      const TagExpansion expansion) {
  return expansion == TagExpansion::kPowerset ? powerset_with_permutations(tags)
                                              : priority_based_permutations(tags);
}

std::optional<MetadataFilter> TagFilterEngine::to_filter(const domain::Tags& tags,
                                                         const TagExpansion expansion) {
  if (tags.empty()) {
    return std::nullopt;
  }

  std::vector<nlohmann::json> accepted;
  for (const auto& candidate : expand(tags.get_tags(), expansion)) {
    accepted.emplace_back(candidate);
  }

  MetadataFilter filter;
  filter.require("tags", std::move(accepted));
  return filter;
}

}  // namespace docvec::store
