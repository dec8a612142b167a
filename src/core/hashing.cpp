#include "docvec/core/hashing.h"

namespace docvec::core {

std::uint64_t stable_hash64(const std::string_view input) {
  constexpr std::uint64_t kOffset = 14695981039346656037ull;
  constexpr std::uint64_t kPrime = 1099511628211ull;

  std::uint64_t hash = kOffset;
  for (const char ch : input) {
    // Explicit cast to unsigned char to avoid sign-extension (ES.46: avoid narrowing conversions).
    hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(ch));
    hash *= kPrime;
  }
  return hash;
}

}  // namespace docvec::core
