#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace docvec::core {

// Deterministic ASCII-only text helpers. Locale-independent, byte-stable output
// across platforms and compilers.

// tokenize_ascii splits input on non-alphanumeric delimiters into tokens.
// - ASCII A-Z folded to a-z via explicit char math (no std::tolower)
// - Any non-alphanumeric byte is a delimiter
// - Tokens shorter than min_length are dropped
// - Tokens are returned in encounter order
inline std::vector<std::string> tokenize_ascii(const std::string_view input,
                                               const std::size_t min_length = 2) {
  constexpr char kCaseOffset = 'a' - 'A';

  std::vector<std::string> tokens;
  std::string current;
  current.reserve(32);

  const auto flush = [&]() {
    if (current.size() >= min_length && !current.empty()) {
      tokens.push_back(current);
    }
    current.clear();
  };

  for (const char ch : input) {
    if ((ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9')) {
      current.push_back(ch);
    } else if (ch >= 'A' && ch <= 'Z') {
      current.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      flush();
    }
  }
  flush();

  return tokens;
}

// trim removes leading and trailing whitespace (ASCII space/tab/newline/CR).
inline std::string trim(const std::string_view input) {
  const auto is_space = [](const char ch) {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
  };

  std::size_t start = 0;
  while (start < input.size() && is_space(input[start])) {
    ++start;
  }
  std::size_t end = input.size();
  while (end > start && is_space(input[end - 1])) {
    --end;
  }
  return std::string{input.substr(start, end - start)};
}

// is_valid_utf8 accepts well-formed UTF-8 only: no overlong forms, no UTF-16
// surrogates (U+D800..U+DFFF), nothing above U+10FFFF, no truncated sequences.
inline bool is_valid_utf8(const std::string_view input) {
  std::size_t i = 0;
  while (i < input.size()) {
    const auto lead = static_cast<unsigned char>(input[i]);
    if (lead < 0x80u) {
      ++i;
      continue;
    }

    std::size_t length = 0;
    unsigned char min_second = 0x80u;
    unsigned char max_second = 0xbfu;
    if (lead >= 0xc2u && lead <= 0xdfu) {
      length = 2;
    } else if (lead >= 0xe0u && lead <= 0xefu) {
      length = 3;
      if (lead == 0xe0u) {
        min_second = 0xa0u;
      } else if (lead == 0xedu) {
        max_second = 0x9fu;
      }
    } else if (lead >= 0xf0u && lead <= 0xf4u) {
      length = 4;
      if (lead == 0xf0u) {
        min_second = 0x90u;
      } else if (lead == 0xf4u) {
        max_second = 0x8fu;
      }
    } else {
      return false;
    }

    if (input.size() - i < length) {
      return false;
    }
    const auto second = static_cast<unsigned char>(input[i + 1]);
    if (second < min_second || second > max_second) {
      return false;
    }
    for (std::size_t k = 2; k < length; ++k) {
      const auto next = static_cast<unsigned char>(input[i + k]);
      if (next < 0x80u || next > 0xbfu) {
        return false;
      }
    }
    i += length;
  }
  return true;
}

}  // namespace docvec::core
