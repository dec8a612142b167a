#include "docvec/app/service_config.h"
#include "docvec/core/errors.h"
#include "docvec/store/vector_store_config.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace docvec;
using Catch::Matchers::WithinAbs;

TEST_CASE("Vector store config defaults", "[config]") {
  const auto config = store::vector_store_config_from_json(nlohmann::json::object());
  CHECK(config.folder_path == ".");
  CHECK(config.index_name == "index");
  CHECK_THAT(config.dedup_threshold, WithinAbs(0.9, 1e-12));
  CHECK(config.dedup_neighbours == 2);
  CHECK(config.dedup_neighbour_source == store::DedupNeighbourSource::kReembedText);
  CHECK(config.rebuild_workers == 4);
  CHECK(config.persistence_queue_capacity == 64);
  CHECK(config.score_threshold_slack == 0.0);
  CHECK(config.default_fetch_k == 20);
}

TEST_CASE("Vector store config reads every key", "[config]") {
  const auto j = nlohmann::json::parse(R"({
    "folder_path": "/srv/kb",
    "index_name": "faq",
    "dedup_threshold": 0.95,
    "dedup_neighbours": 3,
    "dedup_neighbour_source": "stored_vector",
    "rebuild_workers": 2,
    "persistence_queue_capacity": 8,
    "score_threshold_slack": 0.1,
    "default_fetch_k": 50
  })");
  const auto config = store::vector_store_config_from_json(j);
  CHECK(config.folder_path == "/srv/kb");
  CHECK(config.index_name == "faq");
  CHECK(config.dedup_neighbours == 3);
  CHECK(config.dedup_neighbour_source == store::DedupNeighbourSource::kStoredVector);
  CHECK(config.rebuild_workers == 2);
  CHECK(config.default_fetch_k == 50);

  CHECK(store::vector_store_config_from_json(store::to_json(config)).index_name == "faq");
}

TEST_CASE("Vector store config rejects bad values", "[config]") {
  using nlohmann::json;
  CHECK_THROWS_AS(store::vector_store_config_from_json(json::array()), core::ValidationError);
  CHECK_THROWS_AS(store::vector_store_config_from_json(json{{"index_name", ""}}),
                  core::ValidationError);
  CHECK_THROWS_AS(store::vector_store_config_from_json(json{{"dedup_threshold", 1.5}}),
                  core::ValidationError);
  CHECK_THROWS_AS(store::vector_store_config_from_json(json{{"rebuild_workers", 0}}),
                  core::ValidationError);
  CHECK_THROWS_AS(store::vector_store_config_from_json(json{{"rebuild_workers", "four"}}),
                  core::ValidationError);
  CHECK_THROWS_AS(store::vector_store_config_from_json(json{{"dedup_neighbour_source", "gpu"}}),
                  core::ValidationError);
}

TEST_CASE("Service config reads default tags and the find policy", "[config]") {
  const auto defaults = app::service_config_from_json(nlohmann::json::object());
  CHECK(defaults.default_tags.empty());
  CHECK(defaults.find_k == 10);
  CHECK(defaults.find_policy.attempt_limit == 10);
  CHECK_THAT(defaults.find_policy.initial_threshold, WithinAbs(0.6, 1e-12));
  CHECK_THAT(defaults.find_policy.step, WithinAbs(0.05, 1e-12));

  const auto config = app::service_config_from_json(nlohmann::json::parse(R"({
    "default_tags": ["support", "faq"],
    "find": {"initial_threshold": 0.4, "step": 0.1, "attempt_limit": 3, "min_documents": 2, "k": 4}
  })"));
  CHECK(config.default_tags == std::vector<std::string>{"support", "faq"});
  CHECK_THAT(config.find_policy.initial_threshold, WithinAbs(0.4, 1e-12));
  CHECK(config.find_policy.attempt_limit == 3);
  CHECK(config.find_policy.min_documents == 2);
  CHECK(config.find_k == 4);

  CHECK_THROWS_AS(app::service_config_from_json(nlohmann::json{{"find", 3}}),
                  core::ValidationError);
  CHECK_THROWS_AS(
      app::service_config_from_json(nlohmann::json{{"find", {{"attempt_limit", 0}}}}),
      core::ValidationError);
  CHECK_THROWS_AS(app::service_config_from_json(nlohmann::json{{"default_tags", "faq"}}),
                  core::ValidationError);
}
