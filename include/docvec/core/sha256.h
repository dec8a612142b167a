#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace docvec::core {

// sha256_hex returns the SHA-256 digest of input as a lower-case hex string.
//
// Implements FIPS 180-4 SHA-256.
// Output: 64-character lower-case hexadecimal string.
[[nodiscard]] std::string sha256_hex(std::string_view input);

// Byte-buffer overload, for hashing binary identifiers such as raw UUID bytes.
[[nodiscard]] std::string sha256_hex(const std::uint8_t* data, std::size_t size);

}  // namespace docvec::core
