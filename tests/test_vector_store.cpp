#include "docvec/core/clock.h"
#include "docvec/core/errors.h"
#include "docvec/core/id_generator.h"
#include "docvec/embedding/embedding_provider.h"
#include "docvec/store/vector_store.h"

#include "test_support.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <atomic>
#include <memory>
#include <stdexcept>

using namespace docvec;
using Catch::Matchers::WithinAbs;

namespace {

const std::string kApples = "apple banana cherry orchard harvest";
const std::string kPhysics = "quantum physics lecture notes semester";
const std::string kDatabase = "database index tuning guide postgres";
const std::string kHiking = "mountain hiking trail map summit";

// SwitchableEmbedder delegates to the stub embedder until told to fail or to
// return vectors of the wrong size.
class SwitchableEmbedder final : public embedding::IEmbeddingProvider {
 public:
  [[nodiscard]] std::vector<vector::Vector> embed_many(
      const std::vector<std::string>& texts) const override {
    if (fail) {
      throw std::runtime_error("model server unreachable");
    }
    auto out = inner_.embed_many(texts);
    if (short_vectors) {
      for (auto& v : out) {
        v.pop_back();
      }
    }
    return out;
  }
  [[nodiscard]] std::size_t dimension() const override { return inner_.dimension(); }

  std::atomic<bool> fail{false};
  std::atomic<bool> short_vectors{false};

 private:
  embedding::DeterministicStubEmbeddingProvider inner_{128};
};

struct StoreFixture {
  testing::ScratchDir dir;
  SwitchableEmbedder embedder;
  core::FixedClock clock{1000};
  core::SequentialIdGenerator ids{"doc"};
  std::unique_ptr<store::VectorStore> store;

  StoreFixture() {
    store::VectorStoreConfig config;
    config.folder_path = dir.str();
    store = std::make_unique<store::VectorStore>(config, embedder, clock, ids);
  }

  void seed() {
    store->add_documents({testing::make_doc(kApples, {"fruit"}),
                          testing::make_doc(kPhysics, {"science", "faq"}),
                          testing::make_doc(kDatabase, {"faq"}),
                          testing::make_doc(kHiking, {"outdoors"})});
  }
};

}  // namespace

TEST_CASE("VectorStore adds documents under generated ids", "[store]") {
  StoreFixture f;
  const auto stored = f.store->add_documents_with_ids(
      {testing::make_doc(kApples, {"fruit"}), testing::make_doc(kPhysics, {"science"})});

  REQUIRE(stored.size() == 2);
  CHECK(stored[0].id == "doc-0");
  CHECK(stored[1].id == "doc-1");
  CHECK(f.store->size() == 2);
  CHECK_NOTHROW(f.store->check_consistency());

  const auto all = f.store->get_all_documents();
  REQUIRE(all.size() == 2);
  CHECK(all[0].document.page_content == kApples);

  CHECK(f.store->add_documents({}).empty());
}

TEST_CASE("VectorStore validates caller-supplied ids", "[store]") {
  StoreFixture f;
  const std::vector<domain::Document> docs = {testing::make_doc(kApples, {"fruit"}),
                                              testing::make_doc(kPhysics, {"science"})};

  CHECK_THROWS_AS(f.store->add_documents(docs, std::vector<std::string>{"x"}),
                  core::ValidationError);
  CHECK_THROWS_AS(f.store->add_documents(docs, std::vector<std::string>{"x", "x"}),
                  core::ValidationError);
  CHECK_THROWS_AS(f.store->add_documents(docs, std::vector<std::string>{"x", ""}),
                  core::ValidationError);
  CHECK(f.store->size() == 0);

  f.store->add_documents({docs[0]}, std::vector<std::string>{"x"});
  CHECK_THROWS_AS(f.store->add_documents({docs[1]}, std::vector<std::string>{"x"}),
                  core::ValidationError);
  CHECK(f.store->size() == 1);
  CHECK_NOTHROW(f.store->check_consistency());
}

TEST_CASE("VectorStore surfaces embedder failures without mutating", "[store]") {
  StoreFixture f;
  f.seed();

  f.embedder.fail = true;
  CHECK_THROWS_AS(f.store->add_documents({testing::make_doc("brand new text here", {"x"})}),
                  core::EmbeddingUnavailableError);
  CHECK_THROWS_AS(f.store->search(kApples), core::EmbeddingUnavailableError);
  f.embedder.fail = false;

  f.embedder.short_vectors = true;
  CHECK_THROWS_AS(f.store->add_documents({testing::make_doc("another new text", {"x"})}),
                  core::EmbeddingUnavailableError);
  f.embedder.short_vectors = false;

  CHECK(f.store->size() == 4);
  CHECK_NOTHROW(f.store->check_consistency());
}

TEST_CASE("VectorStore::search returns the nearest documents first", "[store][search]") {
  StoreFixture f;
  f.seed();

  store::SearchOptions options;
  options.k = 2;
  const auto hits = f.store->search_with_scores(kDatabase, options);
  REQUIRE(hits.size() == 2);
  CHECK(hits[0].document.page_content == kDatabase);
  CHECK_THAT(hits[0].distance, WithinAbs(0.0, 1e-6));
  CHECK(hits[1].distance >= hits[0].distance);

  options.k = 0;
  CHECK(f.store->search(kDatabase, options).empty());

  options.k = 10;
  CHECK(f.store->search(kDatabase, options).size() == 4);
}

TEST_CASE("VectorStore::search applies tag filters", "[store][search]") {
  StoreFixture f;
  f.seed();

  store::SearchOptions options;
  options.k = 10;

  SECTION("powerset matches any ordering of any subset") {
    options.filter_tags = domain::Tags({"faq", "science"});
    const auto docs = f.store->search(kHiking, options);
    REQUIRE(docs.size() == 2);
    for (const auto& doc : docs) {
      CHECK((doc.page_content == kPhysics || doc.page_content == kDatabase));
    }
  }

  SECTION("priority expansion") {
    options.filter_tags = domain::Tags({"outdoors", "fruit", "faq"});
    options.powerset = false;
    const auto docs = f.store->search(kPhysics, options);
    REQUIRE(docs.size() == 3);
    for (const auto& doc : docs) {
      CHECK(doc.page_content != kPhysics);
    }
  }

  SECTION("empty tag list means no filter") {
    options.filter_tags = domain::Tags();
    CHECK(f.store->search(kHiking, options).size() == 4);
  }

  SECTION("fetch_k bounds the candidates considered before filtering") {
    options.filter_tags = domain::Tags({"outdoors"});
    options.fetch_k = 1;
    CHECK(f.store->search(kApples, options).empty());
    options.fetch_k = 4;
    CHECK(f.store->search(kApples, options).size() == 1);
  }
}

TEST_CASE("VectorStore::search applies the score threshold", "[store][search]") {
  StoreFixture f;
  f.seed();

  store::SearchOptions options;
  options.k = 10;
  options.score_threshold = 0.01;
  const auto docs = f.store->search(kApples, options);
  REQUIRE(docs.size() == 1);
  CHECK(docs[0].page_content == kApples);

  options.score_threshold = 4.0;
  CHECK(f.store->search(kApples, options).size() == 4);
}

TEST_CASE("VectorStore::search drops documents outside their validity window",
          "[store][search][validity]") {
  StoreFixture f;
  f.store->add_documents({testing::make_doc(kApples, {"fruit"}, "short-lived", 1000, 10),
                          testing::make_doc(kHiking, {"outdoors"}, "forever")});

  store::SearchOptions options;
  options.k = 1;
  options.now_epoch_seconds = 1010;
  auto docs = f.store->search(kApples, options);
  REQUIRE(docs.size() == 1);
  CHECK(docs[0].metadata.ids == "short-lived");

  SECTION("expired documents are filtered before truncation to k") {
    options.now_epoch_seconds = 1011;
    docs = f.store->search(kApples, options);
    CHECK(docs.empty());

    options.k = 2;
    docs = f.store->search(kApples, options);
    REQUIRE(docs.size() == 1);
    CHECK(docs[0].metadata.ids == "forever");
  }

  SECTION("the store clock is used when no instant is given") {
    options.now_epoch_seconds.reset();
    f.clock.set_epoch_seconds(999);
    CHECK(f.store->search(kApples, options).empty());
    f.clock.set_epoch_seconds(1005);
    CHECK(f.store->search(kApples, options).size() == 1);
  }
}

TEST_CASE("VectorStore::search_by_vector rejects wrong dimensions", "[store][search]") {
  StoreFixture f;
  CHECK_THROWS_AS(f.store->search_by_vector(vector::Vector(3, 0.0f)), core::ValidationError);
  CHECK(f.store->search_by_vector(vector::Vector(128, 0.0f)).empty());
}

TEST_CASE("VectorStore::remove_documents_by_id keeps the structures aligned", "[store][remove]") {
  StoreFixture f;
  f.seed();

  SECTION("removing listed ids") {
    const auto result = f.store->remove_documents_by_id(std::vector<std::string>{"doc-1", "doc-3"});
    CHECK(result.n_removed == 2);
    CHECK(result.n_total == 4);
    REQUIRE(result.removed.size() == 2);
    CHECK(result.removed[0].page_content == kPhysics);
    CHECK(result.removed[1].page_content == kHiking);

    CHECK(f.store->size() == 2);
    CHECK_NOTHROW(f.store->check_consistency());

    store::SearchOptions options;
    options.k = 1;
    const auto hits = f.store->search_with_scores(kDatabase, options);
    REQUIRE(hits.size() == 1);
    CHECK(hits[0].id == "doc-2");
    CHECK_THAT(hits[0].distance, WithinAbs(0.0, 1e-6));
  }

  SECTION("unknown ids fail without removing anything") {
    CHECK_THROWS_AS(f.store->remove_documents_by_id(std::vector<std::string>{"doc-0", "nope"}),
                    core::NotFoundError);
    CHECK(f.store->size() == 4);
  }

  SECTION("empty or duplicated lists are rejected") {
    CHECK_THROWS_AS(f.store->remove_documents_by_id(std::vector<std::string>{}),
                    core::ValidationError);
    CHECK_THROWS_AS(f.store->remove_documents_by_id(std::vector<std::string>{"doc-0", "doc-0"}),
                    core::ValidationError);
    CHECK(f.store->size() == 4);
  }

  SECTION("no ids clears the store") {
    const auto result = f.store->remove_documents_by_id(std::nullopt);
    CHECK(result.n_removed == 4);
    CHECK(result.removed.size() == 4);
    CHECK(f.store->size() == 0);
    CHECK_NOTHROW(f.store->check_consistency());
    CHECK(f.store->search(kApples).empty());
  }
}

TEST_CASE("Documents can be added, found and removed end to end", "[store][e2e]") {
  StoreFixture f;
  const auto stored =
      f.store->add_documents_with_ids({testing::make_doc("hello world", {"x"}, "greeting")});
  REQUIRE(stored.size() == 1);

  store::SearchOptions options;
  options.filter_tags = domain::Tags({"x"});
  const auto found = f.store->search("hello", options);
  REQUIRE(found.size() == 1);
  CHECK(found[0].page_content == "hello world");

  const auto removed = f.store->remove_documents_by_id(std::vector<std::string>{stored[0].id});
  CHECK(removed.n_removed == 1);
  CHECK(f.store->search("hello", options).empty());
  CHECK_NOTHROW(f.store->check_consistency());
}

TEST_CASE("Slots stay contiguous when adding after a non-trailing removal", "[store][remove]") {
  StoreFixture f;
  f.seed();
  f.store->remove_documents_by_id(std::vector<std::string>{"doc-1"});

  const auto added = f.store->add_documents_with_ids(
      {testing::make_doc("violin sonata concert hall", {"music"}),
       testing::make_doc("sourdough bread starter flour", {"baking"})});
  REQUIRE(added.size() == 2);
  CHECK(f.store->size() == 5);
  CHECK_NOTHROW(f.store->check_consistency());

  std::vector<std::string> order;
  for (const auto& entry : f.store->get_all_documents()) {
    order.push_back(entry.id);
  }
  CHECK(order == std::vector<std::string>{"doc-0", "doc-2", "doc-3", "doc-4", "doc-5"});

  // Every document, old or new, is still its own nearest neighbour.
  store::SearchOptions options;
  options.k = 1;
  for (const auto& entry : f.store->get_all_documents()) {
    const auto hits = f.store->search_with_scores(entry.document.page_content, options);
    REQUIRE(hits.size() == 1);
    CHECK(hits[0].id == entry.id);
    CHECK_THAT(hits[0].distance, WithinAbs(0.0, 1e-6));
  }
}

TEST_CASE("VectorStore::delete_documents_by_ids matches metadata ids", "[store][remove]") {
  StoreFixture f;
  f.store->add_documents({testing::make_doc(kApples, {"fruit"}, "shared"),
                          testing::make_doc(kPhysics, {"science"}, "shared"),
                          testing::make_doc(kHiking, {"outdoors"}, "other")});

  const auto result = f.store->delete_documents_by_ids({"shared", "absent"});
  CHECK(result.n_removed == 2);
  CHECK(f.store->size() == 1);
  CHECK_NOTHROW(f.store->check_consistency());

  const auto none = f.store->delete_documents_by_ids({"absent"});
  CHECK(none.n_removed == 0);
  CHECK(none.n_total == 1);

  CHECK_THROWS_AS(f.store->delete_documents_by_ids({}), core::ValidationError);
}

TEST_CASE("VectorStore::rebuild_index re-derives the index", "[store][rebuild]") {
  StoreFixture f;
  f.seed();
  f.store->add_documents({testing::make_doc("violin sonata concert hall", {"music"}),
                          testing::make_doc("sourdough bread starter flour", {"baking"}),
                          testing::make_doc("electric vehicle battery range", {"cars"})});
  f.store->remove_documents_by_id(std::vector<std::string>{"doc-2"});

  store::SearchOptions options;
  options.k = 3;
  const auto before = f.store->search_with_scores(kHiking, options);

  f.store->rebuild_index();
  CHECK_NOTHROW(f.store->check_consistency());
  CHECK(f.store->size() == 6);

  const auto after = f.store->search_with_scores(kHiking, options);
  REQUIRE(after.size() == before.size());
  for (std::size_t i = 0; i < after.size(); ++i) {
    CHECK(after[i].id == before[i].id);
    CHECK_THAT(after[i].distance, WithinAbs(before[i].distance, 1e-5));
  }

  SECTION("a failed rebuild leaves the live state untouched") {
    f.embedder.fail = true;
    CHECK_THROWS_AS(f.store->rebuild_index(), core::EmbeddingUnavailableError);
    f.embedder.fail = false;
    CHECK_NOTHROW(f.store->check_consistency());
    CHECK(f.store->search_with_scores(kHiking, options).front().id == before.front().id);
  }
}

TEST_CASE("VectorStore rejects invalid configuration", "[store][config]") {
  testing::ScratchDir dir;
  embedding::DeterministicStubEmbeddingProvider embedder(16);
  core::FixedClock clock(0);
  core::SequentialIdGenerator ids;

  store::VectorStoreConfig config;
  config.folder_path = dir.str();
  config.rebuild_workers = 0;
  CHECK_THROWS_AS(store::VectorStore(config, embedder, clock, ids), core::ValidationError);
}
