#include "docvec/core/uuid.h"

#include "docvec/core/errors.h"
#include "docvec/core/sha256.h"

#include <mutex>
#include <random>

namespace docvec::core {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

// Positions of the four hyphens in the 36-character canonical form.
bool is_hyphen_position(const std::size_t i) {
  return i == 8 || i == 13 || i == 18 || i == 23;
}

}  // namespace

UuidBytes generate_uuid_v4() {
  static std::mutex mutex;
  static std::mt19937_64 engine{std::random_device{}()};

  UuidBytes bytes{};
  {
    std::lock_guard<std::mutex> lock(mutex);
    const std::uint64_t hi = engine();
    const std::uint64_t lo = engine();
    for (std::size_t i = 0; i < 8; ++i) {
      bytes[i] = static_cast<std::uint8_t>(hi >> ((7 - i) * 8));
      bytes[8 + i] = static_cast<std::uint8_t>(lo >> ((7 - i) * 8));
    }
  }

  bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0Fu) | 0x40u);  // version 4
  bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3Fu) | 0x80u);  // RFC 4122 variant
  return bytes;
}

std::string uuid_to_string(const UuidBytes& bytes) {
  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out.push_back('-');
    }
    out.push_back(kHexDigits[bytes[i] >> 4u]);
    out.push_back(kHexDigits[bytes[i] & 0x0Fu]);
  }
  return out;
}

UuidBytes parse_uuid(const std::string_view text) {
  if (text.size() != 36) {
    throw ValidationError("Invalid UUID string: '" + std::string(text) + "'");
  }

  UuidBytes bytes{};
  std::size_t byte_index = 0;
  for (std::size_t i = 0; i < text.size();) {
    if (is_hyphen_position(i)) {
      if (text[i] != '-') {
        throw ValidationError("Invalid UUID string: '" + std::string(text) + "'");
      }
      ++i;
      continue;
    }
    const int high = hex_value(text[i]);
    const int low = hex_value(text[i + 1]);
    if (high < 0 || low < 0 || is_hyphen_position(i + 1)) {
      throw ValidationError("Invalid UUID string: '" + std::string(text) + "'");
    }
    bytes[byte_index++] = static_cast<std::uint8_t>((high << 4) | low);
    i += 2;
  }
  return bytes;
}

std::string uuid_to_sha256(const std::string_view uuid_text) {
  const UuidBytes bytes = parse_uuid(uuid_text);
  return sha256_hex(bytes.data(), bytes.size());
}

std::string new_uuid_string() {
  return uuid_to_string(generate_uuid_v4());
}

}  // namespace docvec::core
