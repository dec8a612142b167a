#include "docvec/core/errors.h"
#include "docvec/core/hashing.h"
#include "docvec/core/normalization.h"
#include "docvec/embedding/embedding_provider.h"

#include <cmath>
#include <map>

namespace docvec::embedding {

vector::Vector IEmbeddingProvider::embed_text(std::string_view text) const {
  auto vectors = embed_many({std::string(text)});
  if (vectors.size() != 1) {
    throw core::EmbeddingUnavailableError("embedder returned " + std::to_string(vectors.size()) +
                                          " vectors for one text");
  }
  return std::move(vectors.front());
}

DeterministicStubEmbeddingProvider::DeterministicStubEmbeddingProvider(std::size_t dim)
    : dimension_(dim) {
  if (dimension_ == 0) {
    throw std::invalid_argument("DeterministicStubEmbeddingProvider: dimension must be positive");
  }
}

std::vector<vector::Vector> DeterministicStubEmbeddingProvider::embed_many(
    const std::vector<std::string>& texts) const {
  std::vector<vector::Vector> out;
  out.reserve(texts.size());
  for (const auto& text : texts) {
    out.push_back(embed_one(text));
  }
  return out;
}

vector::Vector DeterministicStubEmbeddingProvider::embed_one(std::string_view text) const {
  vector::Vector embedding(dimension_, 0.0f);

  const auto tokens = core::tokenize_ascii(std::string(text));
  if (tokens.empty()) {
    return embedding;
  }

  std::map<std::string, int> token_counts;
  for (const auto& token : tokens) {
    token_counts[token]++;
  }

  for (const auto& [token, count] : token_counts) {
    const std::size_t idx = core::stable_hash64(token) % dimension_;
    const std::size_t idx_prev = (idx + dimension_ - 1) % dimension_;
    const std::size_t idx_next = (idx + 1) % dimension_;

    embedding[idx] += static_cast<float>(count);
    embedding[idx_prev] += static_cast<float>(count) * 0.3f;
    embedding[idx_next] += static_cast<float>(count) * 0.3f;
  }

  float norm = 0.0f;
  for (const float val : embedding) {
    norm += val * val;
  }
  if (norm > 0.0f) {
    norm = std::sqrt(norm);
    for (float& val : embedding) {
      val /= norm;
    }
  }

  return embedding;
}

}  // namespace docvec::embedding
