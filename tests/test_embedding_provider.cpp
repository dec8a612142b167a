#include "docvec/embedding/embedding_provider.h"
#include "docvec/vector/distance.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cmath>

using namespace docvec;
using Catch::Matchers::WithinAbs;

TEST_CASE("Stub embeddings are deterministic unit vectors", "[embedding]") {
  const embedding::DeterministicStubEmbeddingProvider provider(64);
  REQUIRE(provider.dimension() == 64);

  const auto a = provider.embed_text("Shipping takes three business days");
  const auto b = provider.embed_text("Shipping takes three business days");
  REQUIRE(a.size() == 64);
  CHECK(a == b);

  double norm = 0.0;
  for (const float v : a) {
    norm += static_cast<double>(v) * static_cast<double>(v);
  }
  CHECK_THAT(std::sqrt(norm), WithinAbs(1.0, 1e-5));
}

TEST_CASE("Stub embeddings ignore case and punctuation", "[embedding]") {
  const embedding::DeterministicStubEmbeddingProvider provider;
  CHECK(provider.embed_text("Hello, World!") == provider.embed_text("hello world"));
}

TEST_CASE("Stub embeddings of text without tokens are zero", "[embedding]") {
  const embedding::DeterministicStubEmbeddingProvider provider(16);
  const auto v = provider.embed_text("!? -");
  for (const float x : v) {
    CHECK(x == 0.0f);
  }
}

TEST_CASE("embed_many preserves input order", "[embedding]") {
  const embedding::DeterministicStubEmbeddingProvider provider(32);
  const auto batch = provider.embed_many({"alpha beta", "gamma delta", "alpha beta"});
  REQUIRE(batch.size() == 3);
  CHECK(batch[0] == provider.embed_text("alpha beta"));
  CHECK(batch[1] == provider.embed_text("gamma delta"));
  CHECK_THAT(vector::cosine_similarity(batch[0], batch[2]), WithinAbs(1.0, 1e-6));
}

TEST_CASE("Stub embedder rejects dimension zero", "[embedding]") {
  CHECK_THROWS_AS(embedding::DeterministicStubEmbeddingProvider(0), std::invalid_argument);
}
