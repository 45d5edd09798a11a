#pragma once

namespace brdoc::core {

// Deterministic ASCII-only character classification.
// These functions are locale-independent and produce byte-stable results
// across all platforms and compilers. Bytes outside 0x00-0x7F never classify
// as digits or letters. Negative char values are valid input.

constexpr bool is_ascii(const char ch) { return static_cast<unsigned char>(ch) < 0x80; }

constexpr bool is_ascii_digit(const char ch) { return ch >= '0' && ch <= '9'; }

constexpr bool is_ascii_upper(const char ch) { return ch >= 'A' && ch <= 'Z'; }

constexpr bool is_ascii_lower(const char ch) { return ch >= 'a' && ch <= 'z'; }

constexpr bool is_ascii_alnum(const char ch) {
  return is_ascii_digit(ch) || is_ascii_upper(ch) || is_ascii_lower(ch);
}

// to_ascii_upper converts a-z to A-Z. Every other byte is returned unchanged.
constexpr char to_ascii_upper(const char ch) {
  if (is_ascii_lower(ch)) {
    constexpr char kCaseOffset = 'a' - 'A';
    return static_cast<char>(ch - kCaseOffset);
  }
  return ch;
}

}  // namespace brdoc::core
