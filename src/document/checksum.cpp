#include "brdoc/document/checksum.h"

#include <cstddef>

namespace brdoc::document::checksum {

namespace {

constexpr int kModulus = 11;
constexpr int kMinCyclicWeight = 2;
constexpr int kMaxCyclicWeight = 9;

}  // namespace

int mod11_check_value(const int weighted_sum) {
  const int remainder = weighted_sum % kModulus;
  return remainder < 2 ? 0 : kModulus - remainder;
}

int descending_weighted_sum(const std::string_view prefix, const int first_weight) {
  int sum = 0;
  int weight = first_weight;

  for (const char ch : prefix) {
    sum += char_value(ch) * weight;
    --weight;
  }

  return sum;
}

int cyclic_weighted_sum(const std::string_view prefix) {
  int sum = 0;
  int weight = kMinCyclicWeight;

  // Right to left
  for (std::size_t i = prefix.size(); i > 0; --i) {
    sum += char_value(prefix[i - 1]) * weight;
    if (++weight > kMaxCyclicWeight) {
      weight = kMinCyclicWeight;
    }
  }

  return sum;
}

}  // namespace brdoc::document::checksum
