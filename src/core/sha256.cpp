#include "docvec/core/sha256.h"

#include <array>
#include <cstring>

namespace docvec::core {

namespace {

using Block = std::array<std::uint8_t, 64>;
using State = std::array<std::uint32_t, 8>;

// FIPS 180-4 §5.3.3 initial hash value.
constexpr State kInitialState = {
    0x6a09e667u, 0xbb67ae85u, 0x3c6ef372u, 0xa54ff53au,
    0x510e527fu, 0x9b05688cu, 0x1f83d9abu, 0x5be0cd19u,
};

// FIPS 180-4 §4.2.2 round constants.
constexpr std::array<std::uint32_t, 64> kRoundConstants = {
    0x428a2f98u, 0x71374491u, 0xb5c0fbcfu, 0xe9b5dba5u, 0x3956c25bu, 0x59f111f1u, 0x923f82a4u,
    0xab1c5ed5u, 0xd807aa98u, 0x12835b01u, 0x243185beu, 0x550c7dc3u, 0x72be5d74u, 0x80deb1feu,
    0x9bdc06a7u, 0xc19bf174u, 0xe49b69c1u, 0xefbe4786u, 0x0fc19dc6u, 0x240ca1ccu, 0x2de92c6fu,
    0x4a7484aau, 0x5cb0a9dcu, 0x76f988dau, 0x983e5152u, 0xa831c66du, 0xb00327c8u, 0xbf597fc7u,
    0xc6e00bf3u, 0xd5a79147u, 0x06ca6351u, 0x14292967u, 0x27b70a85u, 0x2e1b2138u, 0x4d2c6dfcu,
    0x53380d13u, 0x650a7354u, 0x766a0abbu, 0x81c2c92eu, 0x92722c85u, 0xa2bfe8a1u, 0xa81a664bu,
    0xc24b8b70u, 0xc76c51a3u, 0xd192e819u, 0xd6990624u, 0xf40e3585u, 0x106aa070u, 0x19a4c116u,
    0x1e376c08u, 0x2748774cu, 0x34b0bcb5u, 0x391c0cb3u, 0x4ed8aa4au, 0x5b9cca4fu, 0x682e6ff3u,
    0x748f82eeu, 0x78a5636fu, 0x84c87814u, 0x8cc70208u, 0x90befffau, 0xa4506cebu, 0xbef9a3f7u,
    0xc67178f2u,
};

constexpr std::uint32_t rotr(const std::uint32_t x, const unsigned n) noexcept {
  return (x >> n) | (x << (32u - n));
}

std::uint32_t load_be32(const std::uint8_t* p) noexcept {
  return (static_cast<std::uint32_t>(p[0]) << 24u) | (static_cast<std::uint32_t>(p[1]) << 16u) |
         (static_cast<std::uint32_t>(p[2]) << 8u) | static_cast<std::uint32_t>(p[3]);
}

void compress(State& state, const std::uint8_t* block) noexcept {
  std::array<std::uint32_t, 64> schedule{};
  for (std::size_t i = 0; i < 16; ++i) {
    schedule[i] = load_be32(block + i * 4);
  }
  for (std::size_t i = 16; i < 64; ++i) {
    const std::uint32_t w15 = schedule[i - 15];
    const std::uint32_t w2 = schedule[i - 2];
    const std::uint32_t s0 = rotr(w15, 7u) ^ rotr(w15, 18u) ^ (w15 >> 3u);
    const std::uint32_t s1 = rotr(w2, 17u) ^ rotr(w2, 19u) ^ (w2 >> 10u);
    schedule[i] = schedule[i - 16] + s0 + schedule[i - 7] + s1;
  }

  // v = {a, b, c, d, e, f, g, h}
  State v = state;
  for (std::size_t i = 0; i < 64; ++i) {
    const std::uint32_t big_s1 = rotr(v[4], 6u) ^ rotr(v[4], 11u) ^ rotr(v[4], 25u);
    const std::uint32_t choose = (v[4] & v[5]) ^ (~v[4] & v[6]);
    const std::uint32_t t1 = v[7] + big_s1 + choose + kRoundConstants[i] + schedule[i];
    const std::uint32_t big_s0 = rotr(v[0], 2u) ^ rotr(v[0], 13u) ^ rotr(v[0], 22u);
    const std::uint32_t majority = (v[0] & v[1]) ^ (v[0] & v[2]) ^ (v[1] & v[2]);

    for (std::size_t j = 7; j > 0; --j) {
      v[j] = v[j - 1];
    }
    v[4] += t1;
    v[0] = t1 + big_s0 + majority;
  }

  for (std::size_t i = 0; i < state.size(); ++i) {
    state[i] += v[i];
  }
}

std::string to_hex(const State& state) {
  constexpr char kDigits[] = "0123456789abcdef";  // NOLINT(modernize-avoid-c-arrays)
  std::string out;
  out.reserve(state.size() * 8);
  for (const std::uint32_t word : state) {
    for (int shift = 28; shift >= 0; shift -= 4) {
      out.push_back(kDigits[(word >> static_cast<unsigned>(shift)) & 0xfu]);
    }
  }
  return out;
}

}  // namespace

std::string sha256_hex(const std::uint8_t* data, const std::size_t size) {
  State state = kInitialState;

  const std::size_t full_blocks = size / 64;
  for (std::size_t b = 0; b < full_blocks; ++b) {
    compress(state, data + b * 64);
  }

  // Tail: the remaining bytes, 0x80, zero fill, then the bit length big-endian.
  // Needs a second block when fewer than 9 bytes remain after the message.
  const std::size_t rest = size - full_blocks * 64;
  std::array<Block, 2> tail{};
  if (rest > 0) {
    std::memcpy(tail[0].data(), data + full_blocks * 64, rest);
  }
  tail[0][rest] = 0x80u;
  const std::size_t tail_blocks = rest + 9 > 64 ? 2 : 1;
  Block& last = tail[tail_blocks - 1];

  const std::uint64_t bit_len = static_cast<std::uint64_t>(size) * 8u;
  for (std::size_t i = 0; i < 8; ++i) {
    last[56 + i] = static_cast<std::uint8_t>(bit_len >> ((7 - i) * 8));
  }

  for (std::size_t b = 0; b < tail_blocks; ++b) {
    compress(state, tail[b].data());
  }
  return to_hex(state);
}

std::string sha256_hex(const std::string_view input) {
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  return sha256_hex(reinterpret_cast<const std::uint8_t*>(input.data()), input.size());
}

}  // namespace docvec::core
