#pragma once

#include <atomic>
#include <string>
#include <string_view>

namespace docvec::core {

// Abstract ID generator interface for dependency injection.
// Storage ids for documents come from here when the caller supplies none.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  // Generate the next identifier.
  // Contract: returned ID is non-empty and unique within this generator's lifetime.
  virtual std::string next() = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// Production ID generator: random version-4 UUID strings. Thread-safe.
class UuidIdGenerator final : public IIdGenerator {
 public:
  UuidIdGenerator() = default;
  ~UuidIdGenerator() override = default;

  UuidIdGenerator(const UuidIdGenerator&) = default;
  UuidIdGenerator& operator=(const UuidIdGenerator&) = default;
  UuidIdGenerator(UuidIdGenerator&&) = default;
  UuidIdGenerator& operator=(UuidIdGenerator&&) = default;

  std::string next() override;
};

// Deterministic ID generator: "<prefix>-<n>" with a sequential counter.
// For tests and demos where reproducible output is required.
// Thread-safe. Same sequence of next() calls produces same IDs.
class SequentialIdGenerator final : public IIdGenerator {
 public:
  explicit SequentialIdGenerator(std::string_view prefix = "doc") : prefix_(prefix) {}
  ~SequentialIdGenerator() override = default;

  // Not copyable or movable (contains atomic counter)
  SequentialIdGenerator(const SequentialIdGenerator&) = delete;
  SequentialIdGenerator& operator=(const SequentialIdGenerator&) = delete;
  SequentialIdGenerator(SequentialIdGenerator&&) = delete;
  SequentialIdGenerator& operator=(SequentialIdGenerator&&) = delete;

  std::string next() override;

 private:
  std::string prefix_;
  std::atomic<unsigned long long> counter_{0};
};

}  // namespace docvec::core
