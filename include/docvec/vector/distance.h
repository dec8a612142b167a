#pragma once

#include "docvec/vector/similarity_index.h"

#include <cstddef>

namespace docvec::vector {

// Squared Euclidean distance over the first n components of a and b.
[[nodiscard]] float l2_squared(const float* a, const float* b, std::size_t n);

// Cosine similarity in [-1, 1].
// Returns 0.0 on dimension mismatch, empty input, or a zero-magnitude vector.
[[nodiscard]] double cosine_similarity(const Vector& a, const Vector& b);

}  // namespace docvec::vector
