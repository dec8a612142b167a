#pragma once

#include <cstdint>
#include <string_view>

namespace docvec::core {

// FNV-1a 64-bit. Stable across platforms and runs; used to bucket tokens in the stub
// embedder. Not a cryptographic hash (see sha256.h).
[[nodiscard]] std::uint64_t stable_hash64(std::string_view input);

}  // namespace docvec::core
