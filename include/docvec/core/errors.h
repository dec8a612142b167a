#pragma once

#include <stdexcept>
#include <string>

namespace docvec::core {

// Error kinds raised by the store and the application service.
// Each derives from the standard exception whose contract it refines, so callers
// that only know <stdexcept> still catch them at the right granularity.

// Malformed request: duplicate or empty id lists, length mismatches, missing fields.
// Always raised before any shared state is touched.
class ValidationError : public std::invalid_argument {
 public:
  explicit ValidationError(const std::string& message) : std::invalid_argument(message) {}
};

// The targeted document does not exist. No mutation is performed.
class NotFoundError : public std::runtime_error {
 public:
  explicit NotFoundError(const std::string& message) : std::runtime_error(message) {}
};

// Index, mapping and document table have diverged. Not recoverable by retrying.
class StoreConsistencyError : public std::logic_error {
 public:
  explicit StoreConsistencyError(const std::string& message) : std::logic_error(message) {}
};

// I/O failure while reading or writing a persisted index.
class PersistenceError : public std::runtime_error {
 public:
  explicit PersistenceError(const std::string& message) : std::runtime_error(message) {}
};

// The embedder failed, timed out, or returned vectors of the wrong shape.
class EmbeddingUnavailableError : public std::runtime_error {
 public:
  explicit EmbeddingUnavailableError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace docvec::core
