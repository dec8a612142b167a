#pragma once

#include "docvec/vector/similarity_index.h"

#include <istream>
#include <memory>

namespace docvec::vector {

// FlatL2Index is an exact (brute-force) squared-L2 index over a contiguous
// row-major float buffer.
//
// search(): full scan, ties broken by ascending slot so results are deterministic.
// remove(): eager order-preserving compaction.
//
// Binary layout written by write() and accepted by read():
//   char[4]  magic "DVIX"
//   uint32   format version (1)
//   uint32   dimension
//   uint64   count
//   float32  count * dimension values, row-major, native byte order
class FlatL2Index final : public ISimilarityIndex {
 public:
  // Throws std::invalid_argument when dimension is zero.
  explicit FlatL2Index(std::size_t dimension);

  void add(const std::vector<Vector>& vectors) override;

  [[nodiscard]] std::vector<Neighbour> search(const Vector& query, std::size_t k) const override;

  std::size_t remove(const std::set<Slot>& slots) override;

  void reset() override;

  [[nodiscard]] std::size_t count() const override { return count_; }
  [[nodiscard]] std::size_t dimension() const override { return dimension_; }

  [[nodiscard]] Vector reconstruct(Slot slot) const override;

  void write(std::ostream& out) const override;

  // Throws std::runtime_error on a bad magic, an unsupported version, truncated input,
  // or a header whose count does not fit the bytes that follow it.
  [[nodiscard]] static std::unique_ptr<FlatL2Index> read(std::istream& in);

 private:
  std::size_t dimension_;
  std::size_t count_{0};
  std::vector<float> data_;
};

}  // namespace docvec::vector
