#include "docvec/vector/distance.h"
#include "docvec/vector/flat_l2_index.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <sstream>
#include <string>

using namespace docvec;
using Catch::Matchers::WithinAbs;

namespace {

vector::FlatL2Index make_index() {
  vector::FlatL2Index index(2);
  index.add({{0.0f, 0.0f}, {1.0f, 0.0f}, {0.0f, 2.0f}, {3.0f, 3.0f}});
  return index;
}

}  // namespace

TEST_CASE("FlatL2Index rejects bad dimensions", "[vector][index]") {
  CHECK_THROWS_AS(vector::FlatL2Index(0), std::invalid_argument);

  vector::FlatL2Index index(3);
  CHECK_THROWS_AS(index.add({{1.0f, 2.0f}}), std::invalid_argument);
  CHECK(index.count() == 0);
  CHECK_THROWS_AS(index.search({1.0f}, 1), std::invalid_argument);
}

TEST_CASE("FlatL2Index::search orders by squared L2 distance", "[vector][index]") {
  const auto index = make_index();
  const auto hits = index.search({0.9f, 0.0f}, 3);

  REQUIRE(hits.size() == 3);
  CHECK(hits[0].slot == 1);
  CHECK_THAT(hits[0].distance, WithinAbs(0.01, 1e-5));
  CHECK(hits[1].slot == 0);
  CHECK_THAT(hits[1].distance, WithinAbs(0.81, 1e-5));
  CHECK(hits[2].slot == 2);
  CHECK_THAT(hits[2].distance, WithinAbs(4.81, 1e-5));
}

TEST_CASE("FlatL2Index::search breaks ties by slot", "[vector][index]") {
  vector::FlatL2Index index(1);
  index.add({{1.0f}, {-1.0f}, {1.0f}});
  const auto hits = index.search({0.0f}, 3);

  CHECK(hits[0].slot == 0);
  CHECK(hits[1].slot == 1);
  CHECK(hits[2].slot == 2);
}

TEST_CASE("FlatL2Index::search pads short results with empty slots", "[vector][index]") {
  const auto index = make_index();
  const auto hits = index.search({0.0f, 0.0f}, 6);

  REQUIRE(hits.size() == 6);
  CHECK(hits[3].slot != vector::kEmptySlot);
  CHECK(hits[4].slot == vector::kEmptySlot);
  CHECK(std::isinf(hits[4].distance));
  CHECK(hits[5].slot == vector::kEmptySlot);

  vector::FlatL2Index empty(2);
  const auto none = empty.search({0.0f, 0.0f}, 2);
  REQUIRE(none.size() == 2);
  CHECK(none[0].slot == vector::kEmptySlot);
}

TEST_CASE("FlatL2Index::remove compacts and preserves order", "[vector][index]") {
  auto index = make_index();
  CHECK(index.remove({0, 2}) == 2);
  REQUIRE(index.count() == 2);

  CHECK(index.reconstruct(0) == vector::Vector{1.0f, 0.0f});
  CHECK(index.reconstruct(1) == vector::Vector{3.0f, 3.0f});
  CHECK_THROWS_AS(index.reconstruct(2), std::out_of_range);

  CHECK(index.remove({}) == 0);
  CHECK(index.remove({7}) == 0);
  CHECK(index.count() == 2);

  index.reset();
  CHECK(index.count() == 0);
}

TEST_CASE("FlatL2Index binary form restores identical search results", "[vector][index]") {
  const auto index = make_index();
  std::stringstream buffer;
  index.write(buffer);

  const auto restored = vector::FlatL2Index::read(buffer);
  REQUIRE(restored->count() == 4);
  REQUIRE(restored->dimension() == 2);
  for (vector::Slot slot = 0; slot < 4; ++slot) {
    CHECK(restored->reconstruct(slot) == index.reconstruct(slot));
  }

  std::stringstream garbage("XXXX");
  CHECK_THROWS_AS(vector::FlatL2Index::read(garbage), std::runtime_error);

  std::stringstream whole;
  index.write(whole);
  const auto bytes = whole.str();
  std::stringstream truncated(bytes.substr(0, bytes.size() - 3));
  CHECK_THROWS_AS(vector::FlatL2Index::read(truncated), std::runtime_error);
}

TEST_CASE("FlatL2Index::read rejects a corrupt header before allocating", "[vector][index]") {
  const auto header = [](const std::uint32_t dimension, const std::uint64_t count) {
    std::string bytes = "DVIX";
    const std::uint32_t version = 1;
    bytes.append(reinterpret_cast<const char*>(&version), sizeof(version));
    bytes.append(reinterpret_cast<const char*>(&dimension), sizeof(dimension));
    bytes.append(reinterpret_cast<const char*>(&count), sizeof(count));
    return bytes;
  };

  SECTION("count larger than the data that follows") {
    std::stringstream in(header(4, std::uint64_t{1} << 40) + std::string(32, '\0'));
    CHECK_THROWS_AS(vector::FlatL2Index::read(in), std::runtime_error);
  }

  SECTION("count whose byte size overflows") {
    std::stringstream in(header(0xffffffffu, std::numeric_limits<std::uint64_t>::max()));
    CHECK_THROWS_AS(vector::FlatL2Index::read(in), std::runtime_error);
  }

  SECTION("an exact header and payload still loads") {
    std::stringstream in(header(2, 1) + std::string(2 * sizeof(float), '\0'));
    const auto index = vector::FlatL2Index::read(in);
    CHECK(index->count() == 1);
    CHECK(index->reconstruct(0) == vector::Vector{0.0f, 0.0f});
  }
}

TEST_CASE("cosine_similarity handles degenerate input", "[vector][distance]") {
  CHECK_THAT(vector::cosine_similarity({1.0f, 0.0f}, {2.0f, 0.0f}), WithinAbs(1.0, 1e-9));
  CHECK_THAT(vector::cosine_similarity({1.0f, 0.0f}, {0.0f, 1.0f}), WithinAbs(0.0, 1e-9));
  CHECK_THAT(vector::cosine_similarity({1.0f, 0.0f}, {-1.0f, 0.0f}), WithinAbs(-1.0, 1e-9));
  CHECK(vector::cosine_similarity({0.0f, 0.0f}, {1.0f, 0.0f}) == 0.0);
  CHECK(vector::cosine_similarity({1.0f}, {1.0f, 0.0f}) == 0.0);
  CHECK(vector::cosine_similarity({}, {}) == 0.0);
}
