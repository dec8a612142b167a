#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <set>
#include <vector>

namespace docvec::vector {

using Vector = std::vector<float>;

// Slot is a dense 0-based position in a similarity index.
using Slot = std::int64_t;

// Padding slot returned by search() when the index holds fewer than k vectors.
inline constexpr Slot kEmptySlot = -1;

struct Neighbour {
  Slot slot;       // NOLINT(readability-identifier-naming)
  float distance;  // NOLINT(readability-identifier-naming)
};

// ISimilarityIndex stores fixed-dimension vectors in insertion-ordered slots.
//
// Contract:
// - add() appends in order; the i-th new vector receives slot count() + i.
// - search() returns exactly k neighbours ordered by ascending distance (lower is
//   more similar). Positions beyond count() are {kEmptySlot, +infinity}.
// - remove() compacts survivors into 0..count()-1, preserving their relative order,
//   before it returns.
// - dimension() is fixed at construction and never changes.
//
// Implementations are not internally synchronised; the owning store serialises access.
class ISimilarityIndex {
 public:
  virtual ~ISimilarityIndex() = default;

  // Throws std::invalid_argument when any vector has the wrong dimension.
  virtual void add(const std::vector<Vector>& vectors) = 0;

  [[nodiscard]] virtual std::vector<Neighbour> search(const Vector& query,
                                                      std::size_t k) const = 0;

  // Returns the number of vectors removed. Out-of-range slots are ignored.
  virtual std::size_t remove(const std::set<Slot>& slots) = 0;

  virtual void reset() = 0;

  [[nodiscard]] virtual std::size_t count() const = 0;
  [[nodiscard]] virtual std::size_t dimension() const = 0;

  // Returns a copy of the vector in slot. Throws std::out_of_range.
  [[nodiscard]] virtual Vector reconstruct(Slot slot) const = 0;

  // Binary serialization of the full index.
  virtual void write(std::ostream& out) const = 0;

 protected:
  ISimilarityIndex() = default;
  ISimilarityIndex(const ISimilarityIndex&) = default;
  ISimilarityIndex& operator=(const ISimilarityIndex&) = default;
  ISimilarityIndex(ISimilarityIndex&&) = default;
  ISimilarityIndex& operator=(ISimilarityIndex&&) = default;
};

}  // namespace docvec::vector
