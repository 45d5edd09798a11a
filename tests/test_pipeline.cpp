#include "brdoc/document/pipeline.h"
#include "brdoc/document/traits.h"

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <string>
#include <string_view>

using namespace brdoc::document;

namespace {

template <std::size_t N>
std::string written(const std::array<char, N>& buffer, std::size_t count) {
  return std::string(buffer.data(), count);
}

}  // namespace

// ── sanitize ──────────────────────────────────────────────────────────────

TEST_CASE("sanitize keeps only digits for CPF", "[document][pipeline][sanitize]") {
  pipeline::Buffer<CpfTraits> buffer{};
  const auto count = pipeline::sanitize<CpfTraits>("  123.456.789-09 \t", buffer);
  REQUIRE(count == 11);
  CHECK(written(buffer, count) == "12345678909");
}

TEST_CASE("sanitize treats letters as separators for CPF", "[document][pipeline][sanitize]") {
  pipeline::Buffer<CpfTraits> buffer{};
  const auto count = pipeline::sanitize<CpfTraits>("abc.def.ghi-jk", buffer);
  CHECK(count == 0);
}

TEST_CASE("sanitize upper-cases letters for CNPJ", "[document][pipeline][sanitize]") {
  pipeline::Buffer<CnpjTraits> buffer{};
  const auto count = pipeline::sanitize<CnpjTraits>("sp.mm6.uql/0001-05", buffer);
  REQUIRE(count == 14);
  CHECK(written(buffer, count) == "SPMM6UQL000105");
}

TEST_CASE("sanitize stops at the first non-ASCII byte", "[document][pipeline][sanitize]") {
  pipeline::Buffer<CpfTraits> buffer{};
  // "123é456.789-09" in UTF-8
  CHECK(pipeline::sanitize<CpfTraits>("123\xC3\xA9" "456.789-09", buffer) ==
        pipeline::kForeignCharacter);

  pipeline::Buffer<CnpjTraits> cnpj_buffer{};
  // Trailing "É" after a complete CNPJ
  CHECK(pipeline::sanitize<CnpjTraits>("12.345.678/0001-95\xC3\x89", cnpj_buffer) ==
        pipeline::kForeignCharacter);
}

TEST_CASE("sanitize reports short input by its count", "[document][pipeline][sanitize]") {
  pipeline::Buffer<CpfTraits> buffer{};
  CHECK(pipeline::sanitize<CpfTraits>("", buffer) == 0);
  CHECK(pipeline::sanitize<CpfTraits>("12-3", buffer) == 3);
  CHECK(pipeline::sanitize<CpfTraits>("1234567890", buffer) == 10);
}

TEST_CASE("sanitize stops at the first character past capacity", "[document][pipeline][sanitize]") {
  pipeline::Buffer<CpfTraits> buffer{};
  CHECK(pipeline::sanitize<CpfTraits>("123456789012", buffer) == 12);
  // Anything beyond capacity + 1 is never scanned into the count.
  CHECK(pipeline::sanitize<CpfTraits>("123456789012345678901234567890", buffer) == 12);
  // The first 11 characters were written before the overflow was detected.
  CHECK(written(buffer, 11) == "12345678901");
}

TEST_CASE("sanitize honours a smaller caller buffer", "[document][pipeline][sanitize]") {
  std::array<char, 3> buffer{};
  CHECK(pipeline::sanitize<CnpjTraits>("a.b", buffer) == 2);
  CHECK(pipeline::sanitize<CnpjTraits>("a.b.c", buffer) == 3);
  CHECK(pipeline::sanitize<CnpjTraits>("a.b.c.d", buffer) == 4);
}

// ── is_uniform ────────────────────────────────────────────────────────────

TEST_CASE("is_uniform detects sequences of one repeated character",
          "[document][pipeline][uniform]") {
  CHECK(pipeline::is_uniform("00000000000"));
  CHECK(pipeline::is_uniform("AAAAAAAAAAAAAA"));
  CHECK(pipeline::is_uniform("7"));
  CHECK_FALSE(pipeline::is_uniform("00000000001"));
  CHECK_FALSE(pipeline::is_uniform("10000000000"));
  CHECK_FALSE(pipeline::is_uniform(""));
}

// ── verify_check_digits ───────────────────────────────────────────────────

TEST_CASE("verify_check_digits accepts matching check digits", "[document][pipeline][checksum]") {
  CHECK_FALSE(pipeline::verify_check_digits<CpfTraits>("12345678909").has_value());
  CHECK_FALSE(pipeline::verify_check_digits<CnpjTraits>("12345678000195").has_value());
  CHECK_FALSE(pipeline::verify_check_digits<CnpjTraits>("SPMM6UQL000105").has_value());
}

TEST_CASE("verify_check_digits reports the first mismatching digit",
          "[document][pipeline][checksum]") {
  CHECK(pipeline::verify_check_digits<CpfTraits>("12345678919") ==
        ValidationError::kInvalidFirstCheckDigit);
  CHECK(pipeline::verify_check_digits<CpfTraits>("12345678900") ==
        ValidationError::kInvalidSecondCheckDigit);
  // Both wrong: the first one wins
  CHECK(pipeline::verify_check_digits<CpfTraits>("12345678911") ==
        ValidationError::kInvalidFirstCheckDigit);
  CHECK(pipeline::verify_check_digits<CnpjTraits>("12345678000100") ==
        ValidationError::kInvalidFirstCheckDigit);
  CHECK(pipeline::verify_check_digits<CnpjTraits>("12345678000191") ==
        ValidationError::kInvalidSecondCheckDigit);
}

TEST_CASE("verify_check_digits rejects a letter in a check position",
          "[document][pipeline][checksum]") {
  CHECK(pipeline::verify_check_digits<CnpjTraits>("SPMM6UQL0001A5") ==
        ValidationError::kInvalidFirstCheckDigit);
}

// ── run ───────────────────────────────────────────────────────────────────

TEST_CASE("run reports pipeline stages in order", "[document][pipeline]") {
  pipeline::Buffer<CpfTraits> buffer{};
  CHECK(pipeline::run<CpfTraits>("", buffer) == ValidationError::kLengthMismatch);
  CHECK(pipeline::run<CpfTraits>("1234567890", buffer) == ValidationError::kLengthMismatch);
  CHECK(pipeline::run<CpfTraits>("123456789012", buffer) == ValidationError::kLengthMismatch);
  CHECK(pipeline::run<CpfTraits>("123.456.789-09\xC2\xA0", buffer) ==
        ValidationError::kInvalidCharacter);
  CHECK(pipeline::run<CpfTraits>("000.000.000-00", buffer) == ValidationError::kDegenerateValue);
  CHECK(pipeline::run<CpfTraits>("123.456.789-19", buffer) ==
        ValidationError::kInvalidFirstCheckDigit);
  CHECK(pipeline::run<CpfTraits>("123.456.789-01", buffer) ==
        ValidationError::kInvalidSecondCheckDigit);
  CHECK_FALSE(pipeline::run<CpfTraits>("123.456.789-09", buffer).has_value());
}

TEST_CASE("run rejects all-zero documents that would pass the checksum", "[document][pipeline]") {
  // Every weighted sum of zeros is 0, so both check digits compute to '0'.
  CHECK_FALSE(pipeline::verify_check_digits<CpfTraits>("00000000000").has_value());
  CHECK_FALSE(pipeline::verify_check_digits<CnpjTraits>("00000000000000").has_value());

  pipeline::Buffer<CpfTraits> cpf_buffer{};
  pipeline::Buffer<CnpjTraits> cnpj_buffer{};
  CHECK(pipeline::run<CpfTraits>("00000000000", cpf_buffer) == ValidationError::kDegenerateValue);
  CHECK(pipeline::run<CnpjTraits>("00000000000000", cnpj_buffer) ==
        ValidationError::kDegenerateValue);
}

// ── complete ──────────────────────────────────────────────────────────────

TEST_CASE("complete appends both check digits", "[document][pipeline][complete]") {
  const auto cpf = pipeline::complete<CpfTraits>("123.456.789");
  REQUIRE(cpf.has_value());
  CHECK(std::string(cpf.value().data(), cpf.value().size()) == "12345678909");

  const auto cnpj = pipeline::complete<CnpjTraits>("sp.mm6.uql/0001");
  REQUIRE(cnpj.has_value());
  CHECK(std::string(cnpj.value().data(), cnpj.value().size()) == "SPMM6UQL000105");
}

TEST_CASE("complete rejects a base of the wrong length", "[document][pipeline][complete]") {
  CHECK(pipeline::complete<CpfTraits>("12345678").error() == ValidationError::kLengthMismatch);
  CHECK(pipeline::complete<CpfTraits>("12345678909").error() == ValidationError::kLengthMismatch);
  CHECK(pipeline::complete<CnpjTraits>("").error() == ValidationError::kLengthMismatch);
  CHECK(pipeline::complete<CpfTraits>("123.456.\xC3\xA9" "789").error() ==
        ValidationError::kInvalidCharacter);
}

TEST_CASE("complete rejects a base that completes to a degenerate value",
          "[document][pipeline][complete]") {
  // Both check digits of nine ones compute to '1'.
  CHECK(pipeline::complete<CpfTraits>("111111111").error() == ValidationError::kDegenerateValue);
}

// ── format ────────────────────────────────────────────────────────────────

TEST_CASE("format inserts CPF separators", "[document][pipeline][format]") {
  CHECK(pipeline::format<CpfTraits>("12345678909") == "123.456.789-09");
  CHECK(pipeline::format<CpfTraits>("12345678909").size() == CpfTraits::kFormattedLength);
}

TEST_CASE("format inserts CNPJ separators", "[document][pipeline][format]") {
  CHECK(pipeline::format<CnpjTraits>("12345678000195") == "12.345.678/0001-95");
  CHECK(pipeline::format<CnpjTraits>("SPMM6UQL000105") == "SP.MM6.UQL/0001-05");
  CHECK(pipeline::format<CnpjTraits>("12345678000195").size() == CnpjTraits::kFormattedLength);
}

TEST_CASE("format of an empty value is empty", "[document][pipeline][format]") {
  CHECK(pipeline::format<CpfTraits>("").empty());
  CHECK(pipeline::format<CnpjTraits>("").empty());
}
