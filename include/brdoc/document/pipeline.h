#pragma once

#include "brdoc/core/ascii.h"
#include "brdoc/core/result.h"
#include "brdoc/document/checksum.h"
#include "brdoc/document/validation_error.h"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace brdoc::document::pipeline {

// Validation pipeline shared by every document kind, parameterized by a traits
// type (see traits.h):
//
//   raw input -> sanitize -> is_uniform -> verify_check_digits -> canonical value
//
// Every stage is a pure function. Validation works in a fixed-capacity stack
// buffer; nothing here allocates except format() and complete().

// Buffer holds exactly one unmasked document.
template <typename Traits>
using Buffer = std::array<char, Traits::kLength>;

// Returned by sanitize when the input holds a byte outside ASCII.
inline constexpr std::size_t kForeignCharacter = static_cast<std::size_t>(-1);

// sanitize copies the characters accepted by Traits into buffer, canonicalized,
// skipping every other ASCII byte. Returns the number of characters written.
//
// A non-ASCII byte may belong to a letter or digit of another script, so it is
// never skipped: scanning stops and kForeignCharacter is returned.
// Scanning also stops at the first accepted character that does not fit; the
// return value is then N + 1.
template <typename Traits, std::size_t N>
[[nodiscard]] std::size_t sanitize(const std::string_view input, std::array<char, N>& buffer) {
  std::size_t count = 0;

  for (const char ch : input) {
    if (!core::is_ascii(ch)) {
      return kForeignCharacter;
    }
    if (!Traits::accepts(ch)) {
      continue;
    }
    if (count == N) {
      return N + 1;  // Overflow
    }
    buffer[count++] = Traits::canonicalize(ch);
  }

  return count;
}

// is_uniform reports whether every character equals the first one.
// An empty sequence is not uniform.
[[nodiscard]] inline bool is_uniform(const std::string_view value) {
  if (value.empty()) {
    return false;
  }
  return value.find_first_not_of(value.front()) == std::string_view::npos;
}

// verify_check_digits checks the two trailing characters of a sanitized value.
// The first check digit covers the kLength - 2 leading characters; the second
// covers kLength - 1 characters, including the first check digit.
template <typename Traits>
[[nodiscard]] std::optional<ValidationError> verify_check_digits(const std::string_view value) {
  constexpr std::size_t kFirst = Traits::kLength - 2;
  constexpr std::size_t kSecond = Traits::kLength - 1;

  if (value[kFirst] != checksum::to_check_char(Traits::check_value(value.substr(0, kFirst)))) {
    return ValidationError::kInvalidFirstCheckDigit;
  }
  if (value[kSecond] != checksum::to_check_char(Traits::check_value(value.substr(0, kSecond)))) {
    return ValidationError::kInvalidSecondCheckDigit;
  }
  return std::nullopt;
}

// run executes sanitize, the degenerate-value guard and the checksum verifier.
// On success buffer holds the canonical value and std::nullopt is returned.
// Null/empty detection is the caller's concern: an empty input is a length mismatch here.
template <typename Traits>
[[nodiscard]] std::optional<ValidationError> run(const std::string_view input,
                                                 Buffer<Traits>& buffer) {
  const std::size_t count = sanitize<Traits>(input, buffer);
  if (count == kForeignCharacter) {
    return ValidationError::kInvalidCharacter;
  }
  if (count != Traits::kLength) {
    return ValidationError::kLengthMismatch;
  }

  const std::string_view value{buffer.data(), buffer.size()};
  if (is_uniform(value)) {
    return ValidationError::kDegenerateValue;
  }

  return verify_check_digits<Traits>(value);
}

// complete sanitizes a base of kLength - 2 characters and appends both check digits.
// Fails with kInvalidCharacter, kLengthMismatch or kDegenerateValue; never with a
// check digit error.
template <typename Traits>
[[nodiscard]] core::Result<Buffer<Traits>, ValidationError> complete(const std::string_view base) {
  using R = core::Result<Buffer<Traits>, ValidationError>;
  constexpr std::size_t kBaseLength = Traits::kLength - 2;

  std::array<char, kBaseLength> base_buffer{};
  const std::size_t count = sanitize<Traits>(base, base_buffer);
  if (count == kForeignCharacter) {
    return R::err(ValidationError::kInvalidCharacter);
  }
  if (count != kBaseLength) {
    return R::err(ValidationError::kLengthMismatch);
  }

  Buffer<Traits> buffer{};
  for (std::size_t i = 0; i < kBaseLength; ++i) {
    buffer[i] = base_buffer[i];
  }

  const std::string_view value{buffer.data(), buffer.size()};
  buffer[kBaseLength] = checksum::to_check_char(Traits::check_value(value.substr(0, kBaseLength)));
  buffer[kBaseLength + 1] =
      checksum::to_check_char(Traits::check_value(value.substr(0, kBaseLength + 1)));

  if (is_uniform(value)) {
    return R::err(ValidationError::kDegenerateValue);
  }
  return R::ok(buffer);
}

// format expands a canonical value into its display form by inserting the
// separators from Traits::kSeparators. An empty value formats to an empty string.
// No validation is performed.
template <typename Traits>
[[nodiscard]] std::string format(const std::string_view canonical) {
  if (canonical.empty()) {
    return std::string{};
  }

  std::string formatted;
  formatted.reserve(canonical.size() + Traits::kSeparators.size());

  std::size_t next = 0;
  for (std::size_t i = 0; i < canonical.size(); ++i) {
    if (next < Traits::kSeparators.size() && Traits::kSeparators[next].position == i) {
      formatted.push_back(Traits::kSeparators[next].symbol);
      ++next;
    }
    formatted.push_back(canonical[i]);
  }

  return formatted;
}

}  // namespace brdoc::document::pipeline
