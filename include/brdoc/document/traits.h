#pragma once

#include "brdoc/core/ascii.h"
#include "brdoc/document/checksum.h"
#include "brdoc/document/document_kind.h"

#include <array>
#include <cstddef>
#include <string_view>

namespace brdoc::document {

// Separator is a punctuation character inserted into the display form,
// immediately before the unmasked character at `position`.
struct Separator {
  std::size_t position;
  char symbol;
};

// A document traits type parameterizes the validation pipeline. It provides:
//   kKind             - the DocumentKind
//   kLength           - unmasked length; the last two characters are check digits
//   kFormattedLength  - display length (kLength + separator count)
//   kSeparators       - display layout, in ascending position order
//   accepts(ch)       - alphabet predicate applied to raw input bytes
//   canonicalize(ch)  - maps an accepted byte to its canonical form
//   check_value(p)    - check value in [0, 9] for the prefix p preceding a check digit

// CPF: 11 digits, displayed as XXX.XXX.XXX-XX.
// Weights descend from 10 (first check digit) or 11 (second check digit).
struct CpfTraits {
  static constexpr DocumentKind kKind = DocumentKind::kCpf;
  static constexpr std::size_t kLength = 11;
  static constexpr std::array<Separator, 3> kSeparators{{{3, '.'}, {6, '.'}, {9, '-'}}};
  static constexpr std::size_t kFormattedLength = kLength + kSeparators.size();

  static constexpr bool accepts(const char ch) { return core::is_ascii_digit(ch); }
  static constexpr char canonicalize(const char ch) { return ch; }

  static int check_value(const std::string_view prefix) {
    const int first_weight = static_cast<int>(prefix.size()) + 1;
    return checksum::mod11_check_value(checksum::descending_weighted_sum(prefix, first_weight));
  }
};

// CNPJ: 14 alphanumerics (letters folded to upper case), displayed as XX.XXX.XXX/XXXX-XX.
// Weights cycle 2..9 from the right. Check digits are always decimal digits.
struct CnpjTraits {
  static constexpr DocumentKind kKind = DocumentKind::kCnpj;
  static constexpr std::size_t kLength = 14;
  static constexpr std::array<Separator, 4> kSeparators{
      {{2, '.'}, {5, '.'}, {8, '/'}, {12, '-'}}};
  static constexpr std::size_t kFormattedLength = kLength + kSeparators.size();

  static constexpr bool accepts(const char ch) { return core::is_ascii_alnum(ch); }
  static constexpr char canonicalize(const char ch) { return core::to_ascii_upper(ch); }

  static int check_value(const std::string_view prefix) {
    return checksum::mod11_check_value(checksum::cyclic_weighted_sum(prefix));
  }
};

static_assert(CpfTraits::kFormattedLength == 14);
static_assert(CnpjTraits::kFormattedLength == 18);

}  // namespace brdoc::document
