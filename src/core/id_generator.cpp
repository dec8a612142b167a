#include "docvec/core/id_generator.h"

#include "docvec/core/uuid.h"

namespace docvec::core {

std::string UuidIdGenerator::next() {
  return new_uuid_string();
}

std::string SequentialIdGenerator::next() {
  const auto c = counter_.fetch_add(1, std::memory_order_relaxed);
  return prefix_ + "-" + std::to_string(c);
}

}  // namespace docvec::core
