#pragma once

#include "docvec/core/clock.h"
#include "docvec/retrieval/reranker.h"
#include "docvec/storage/audit_log.h"
#include "docvec/store/vector_store.h"

namespace docvec::app {

// Services is a composition root that bundles the dependencies of the document
// service. It holds references (not ownership); the CLI or another entry point
// creates the concrete instances and manages their lifetimes.
struct Services {
  store::VectorStore& store;             // NOLINT(readability-identifier-naming)
  storage::IDocumentAuditLog& audit_log;  // NOLINT(readability-identifier-naming)
  retrieval::IReranker& reranker;        // NOLINT(readability-identifier-naming)
  core::IClock& clock;                   // NOLINT(readability-identifier-naming)

  Services(store::VectorStore& store, storage::IDocumentAuditLog& audit_log,
           retrieval::IReranker& reranker, core::IClock& clock)
      : store(store), audit_log(audit_log), reranker(reranker), clock(clock) {}

  ~Services() = default;

  Services(const Services&) = delete;
  Services& operator=(const Services&) = delete;
  Services(Services&&) = delete;
  Services& operator=(Services&&) = delete;
};

}  // namespace docvec::app
