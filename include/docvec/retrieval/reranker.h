#pragma once

#include "docvec/domain/document.h"

#include <string_view>
#include <vector>

namespace docvec::retrieval {

// IReranker reorders search results after retrieval.
// Reranking happens outside the store: it never sees distances or storage ids.
class IReranker {
 public:
  virtual ~IReranker() = default;

  [[nodiscard]] virtual std::vector<domain::Document> rerank(
      std::vector<domain::Document> documents, std::string_view query) const = 0;

 protected:
  IReranker() = default;
  IReranker(const IReranker&) = default;
  IReranker& operator=(const IReranker&) = default;
  IReranker(IReranker&&) = default;
  IReranker& operator=(IReranker&&) = default;
};

// IdentityReranker keeps the store's ascending-distance order.
class IdentityReranker final : public IReranker {
 public:
  [[nodiscard]] std::vector<domain::Document> rerank(std::vector<domain::Document> documents,
                                                     std::string_view /*query*/) const override {
    return documents;
  }
};

}  // namespace docvec::retrieval
