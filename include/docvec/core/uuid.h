#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace docvec::core {

using UuidBytes = std::array<std::uint8_t, 16>;

// generate_uuid_v4 returns 16 random bytes with the RFC 4122 version (4) and
// variant (10xx) bits set. Thread-safe.
[[nodiscard]] UuidBytes generate_uuid_v4();

// Canonical 8-4-4-4-12 lower-case hex form.
[[nodiscard]] std::string uuid_to_string(const UuidBytes& bytes);

// Parses the canonical form (hyphens required, either case).
// Throws ValidationError when the input is not a UUID.
[[nodiscard]] UuidBytes parse_uuid(std::string_view text);

// uuid_to_sha256 hashes the 16 raw bytes of a UUID (not its text form).
// This is how default metadata identifiers are derived.
// Throws ValidationError when the input is not a UUID.
[[nodiscard]] std::string uuid_to_sha256(std::string_view uuid_text);

// Shorthand for uuid_to_string(generate_uuid_v4()).
[[nodiscard]] std::string new_uuid_string();

}  // namespace docvec::core
