#pragma once

#include "docvec/vector/similarity_index.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace docvec::embedding {

// IEmbeddingProvider turns text into fixed-dimension vectors.
// Implementations must be safe to call from several threads at once and must
// report failures as core::EmbeddingUnavailableError.
class IEmbeddingProvider {
 public:
  virtual ~IEmbeddingProvider() = default;

  // embed_many returns one vector per input text, in input order.
  [[nodiscard]] virtual std::vector<vector::Vector> embed_many(
      const std::vector<std::string>& texts) const = 0;

  [[nodiscard]] virtual std::size_t dimension() const = 0;

  [[nodiscard]] vector::Vector embed_text(std::string_view text) const;

 protected:
  IEmbeddingProvider() = default;
  IEmbeddingProvider(const IEmbeddingProvider&) = default;
  IEmbeddingProvider& operator=(const IEmbeddingProvider&) = default;
  IEmbeddingProvider(IEmbeddingProvider&&) = default;
  IEmbeddingProvider& operator=(IEmbeddingProvider&&) = default;
};

// DeterministicStubEmbeddingProvider generates stable vectors without a model.
// Strategy: token-count histogram hashed into buckets, smoothed into the adjacent
// buckets, normalised to unit length. Text without tokens maps to the zero vector.
class DeterministicStubEmbeddingProvider final : public IEmbeddingProvider {
 public:
  explicit DeterministicStubEmbeddingProvider(std::size_t dim = 128);

  [[nodiscard]] std::vector<vector::Vector> embed_many(
      const std::vector<std::string>& texts) const override;
  [[nodiscard]] std::size_t dimension() const override { return dimension_; }

 private:
  [[nodiscard]] vector::Vector embed_one(std::string_view text) const;

  std::size_t dimension_;
};

}  // namespace docvec::embedding
