#pragma once

#include <string_view>

namespace brdoc::document::checksum {

// Weighted modulo-11 check-digit primitives shared by every document kind.
//
// A check digit is computed in two steps:
//   1. weighted_sum: sum of char_value(c) * weight over a prefix, where the
//      weight sequence depends on the document kind;
//   2. mod11_check_value: remainder = sum % 11; 0 if remainder < 2, else 11 - remainder.
// The resulting value is always in [0, 9] and is rendered as a decimal digit.

// char_value maps a canonical character to its numeric contribution: c - '0'.
// Digits map to 0-9. Upper-case letters map to 17 ('A') through 42 ('Z');
// this offset is mandated by the alphanumeric CNPJ rules and is not an alphabet index.
constexpr int char_value(const char ch) { return ch - '0'; }

// to_check_char renders a check value in [0, 9] as its digit character.
constexpr char to_check_char(const int check_value) { return static_cast<char>('0' + check_value); }

// mod11_check_value reduces a weighted sum to a check value in [0, 9].
[[nodiscard]] int mod11_check_value(int weighted_sum);

// descending_weighted_sum scans prefix left to right; the first character is
// weighted first_weight and each following character one less.
// CPF uses first_weight = prefix.size() + 1 (10 for the first check digit, 11 for the second).
[[nodiscard]] int descending_weighted_sum(std::string_view prefix, int first_weight);

// cyclic_weighted_sum scans prefix right to left with weights 2, 3, ..., 9, 2, 3, ...
// The right-most character is weighted 2.
[[nodiscard]] int cyclic_weighted_sum(std::string_view prefix);

}  // namespace brdoc::document::checksum
