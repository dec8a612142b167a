#include "docvec/vector/distance.h"

#include <cmath>

namespace docvec::vector {

float l2_squared(const float* a, const float* b, const std::size_t n) {
  float sum = 0.0f;
  for (std::size_t i = 0; i < n; ++i) {
    const float diff = a[i] - b[i];
    sum += diff * diff;
  }
  return sum;
}

double cosine_similarity(const Vector& a, const Vector& b) {
  if (a.size() != b.size() || a.empty()) {
    return 0.0;
  }

  double dot_product = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;

  for (std::size_t i = 0; i < a.size(); ++i) {
    dot_product += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
    norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
  }

  norm_a = std::sqrt(norm_a);
  norm_b = std::sqrt(norm_b);

  if (norm_a == 0.0 || norm_b == 0.0) {
    return 0.0;
  }

  return dot_product / (norm_a * norm_b);
}

}  // namespace docvec::vector
