#include "docvec/core/errors.h"
#include "docvec/domain/metadata.h"
#include "docvec/store/tag_filter.h"

#include <catch2/catch_test_macros.hpp>

using namespace docvec;
using store::TagCandidates;
using store::TagExpansion;
using store::TagFilterEngine;

namespace {

domain::Metadata metadata_with_tags(const std::vector<std::string>& tags) {
  domain::Metadata metadata;
  metadata.ids = "m";
  metadata.tags = domain::Tags(tags);
  return metadata;
}

}  // namespace

TEST_CASE("Powerset expansion lists every ordering of every subset", "[tags][filter]") {
  SECTION("two tags") {
    const TagCandidates expected = {{}, {"a"}, {"b"}, {"a", "b"}, {"b", "a"}};
    CHECK(TagFilterEngine::powerset_with_permutations({"a", "b"}) == expected);
  }

  SECTION("three tags give 1 + 3 + 6 + 6 candidates") {
    const auto candidates = TagFilterEngine::powerset_with_permutations({"x", "y", "z"});
    CHECK(candidates.size() == 16);
    CHECK(candidates.front().empty());
    CHECK(candidates.back() == std::vector<std::string>{"z", "y", "x"});
  }

  SECTION("no tags give only the empty candidate") {
    CHECK(TagFilterEngine::powerset_with_permutations({}) == TagCandidates{{}});
  }
}

TEST_CASE("Priority expansion keeps orderings led by the top two tags", "[tags][filter]") {
  SECTION("three tags") {
    const TagCandidates expected = {
        {"a", "b", "c"}, {"a", "c", "b"}, {"b", "a", "c"}, {"b", "c", "a"},
        {"a", "b"},      {"b", "a"},      {"a", "c"},      {"b", "c"},
        {"a"},           {"b"},           {"c"},
    };
    CHECK(TagFilterEngine::priority_based_permutations({"a", "b", "c"}) == expected);
  }

  SECTION("two tags") {
    const TagCandidates expected = {{"a", "b"}, {"b", "a"}, {"a"}, {"b"}};
    CHECK(TagFilterEngine::priority_based_permutations({"a", "b"}) == expected);
  }

  SECTION("one tag") {
    CHECK(TagFilterEngine::priority_based_permutations({"a"}) == TagCandidates{{"a"}});
  }

  SECTION("every candidate of four tags starts with a priority tag or is a singleton") {
    const auto candidates = TagFilterEngine::priority_based_permutations({"p", "q", "r", "s"});
    for (const auto& candidate : candidates) {
      REQUIRE_FALSE(candidate.empty());
      const bool led = candidate.front() == "p" || candidate.front() == "q";
      CHECK((led || candidate.size() == 1));
    }
  }
}

TEST_CASE("Tag expansion rejects oversized tag lists", "[tags][filter]") {
  const std::vector<std::string> nine = {"1", "2", "3", "4", "5", "6", "7", "8", "9"};
  CHECK_THROWS_AS(TagFilterEngine::powerset_with_permutations(nine), core::ValidationError);
  CHECK_THROWS_AS(TagFilterEngine::priority_based_permutations(nine), core::ValidationError);
  CHECK_THROWS_AS(TagFilterEngine::to_filter(domain::Tags(nine), TagExpansion::kPriority),
                  core::ValidationError);
}

TEST_CASE("to_filter matches exact tag orderings", "[tags][filter]") {
  SECTION("empty tags mean no filter") {
    CHECK_FALSE(TagFilterEngine::to_filter(domain::Tags(), TagExpansion::kPowerset).has_value());
  }

  SECTION("powerset filter") {
    const auto filter = TagFilterEngine::to_filter(domain::Tags({"a", "b"}), TagExpansion::kPowerset);
    REQUIRE(filter.has_value());
    CHECK(filter->matches(metadata_with_tags({"b", "a"})));
    CHECK(filter->matches(metadata_with_tags({"a"})));
    CHECK(filter->matches(metadata_with_tags({})));
    CHECK_FALSE(filter->matches(metadata_with_tags({"a", "c"})));
    CHECK_FALSE(filter->matches(metadata_with_tags({"a", "b", "c"})));
  }

  SECTION("priority filter") {
    const auto filter =
        TagFilterEngine::to_filter(domain::Tags({"a", "b", "c"}), TagExpansion::kPriority);
    REQUIRE(filter.has_value());
    CHECK(filter->matches(metadata_with_tags({"b", "c", "a"})));
    CHECK(filter->matches(metadata_with_tags({"c"})));
    CHECK_FALSE(filter->matches(metadata_with_tags({"c", "a", "b"})));
    CHECK_FALSE(filter->matches(metadata_with_tags({"c", "a"})));
    CHECK_FALSE(filter->matches(metadata_with_tags({})));
  }
}

TEST_CASE("MetadataFilter reads missing keys as null", "[tags][filter]") {
  store::MetadataFilter filter;
  filter.require("owner", {nullptr});
  CHECK(filter.matches_json(nlohmann::json{{"tags", {"a"}}}));
  CHECK_FALSE(filter.matches_json(nlohmann::json{{"owner", "ops"}}));

  store::MetadataFilter related;
  related.require("related", {true});
  auto metadata = metadata_with_tags({"a"});
  CHECK_FALSE(related.matches(metadata));
  metadata.related = true;
  CHECK(related.matches(metadata));

  CHECK(store::MetadataFilter{}.matches(metadata));
}
