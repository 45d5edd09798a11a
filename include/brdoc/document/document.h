#pragma once

#include "brdoc/core/result.h"
#include "brdoc/document/document_kind.h"
#include "brdoc/document/pipeline.h"
#include "brdoc/document/validation_error.h"

#include <compare>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace brdoc::document {

// BasicDocument is an immutable, self-validating document number.
//
// The only state is the canonical unmasked value (e.g. "12345678909").
// An instance either holds a value that passed the full validation pipeline,
// or is default-constructed and holds nothing. There is no way to build an
// instance around an unvalidated value, and no mutation after construction.
//
// Equality, ordering and hashing compare the canonical value byte by byte.
// The empty default instance orders before every valid instance.
//
// Instantiated as Cpf (cpf.h) and Cnpj (cnpj.h).
template <typename Traits>
class BasicDocument {
 public:
  using traits_type = Traits;
  using ValidateResult = core::Result<BasicDocument, ValidationError>;

  static constexpr DocumentKind kKind = Traits::kKind;
  static constexpr std::size_t kLength = Traits::kLength;
  static constexpr std::size_t kFormattedLength = Traits::kFormattedLength;

  BasicDocument() = default;

  // validate runs the pipeline and reports the rejection reason without throwing.
  // A nullptr input is reported as kNullOrEmpty.
  [[nodiscard]] static ValidateResult validate(const char* input) {
    if (input == nullptr) {
      return ValidateResult::err(ValidationError::kNullOrEmpty);
    }
    return validate(std::string_view{input});
  }

  [[nodiscard]] static ValidateResult validate(const std::string_view input) {
    pipeline::Buffer<Traits> buffer{};
    if (const auto error = pipeline::run<Traits>(input, buffer)) {
      return ValidateResult::err(*error);
    }
    return ValidateResult::ok(BasicDocument(std::string(buffer.data(), buffer.size())));
  }

  // from_string accepts masked or unmasked input.
  // Throws InvalidDocumentError carrying the reason and the original input,
  // or EmptyInputError for nullptr.
  [[nodiscard]] static BasicDocument from_string(const char* input) {
    if (input == nullptr) {
      throw EmptyInputError(kKind);
    }
    return from_string(std::string_view{input});
  }

  [[nodiscard]] static BasicDocument from_string(const std::string_view input) {
    auto result = validate(input);
    if (!result.has_value()) {
      throw InvalidDocumentError(kKind, result.error(), std::string{input});
    }
    return std::move(result).take_value();
  }

  // parse is from_string with a distinct failure for absent input:
  // throws EmptyInputError for nullptr or "", InvalidDocumentError otherwise.
  [[nodiscard]] static BasicDocument parse(const char* input) {
    if (input == nullptr) {
      throw EmptyInputError(kKind);
    }
    return parse(std::string_view{input});
  }

  [[nodiscard]] static BasicDocument parse(const std::string_view input) {
    if (input.empty()) {
      throw EmptyInputError(kKind);
    }
    return from_string(input);
  }

  // try_parse never throws. On failure result is reset to the default instance.
  static bool try_parse(const char* input, BasicDocument& result) {
    if (input == nullptr) {
      result = BasicDocument{};
      return false;
    }
    return try_parse(std::string_view{input}, result);
  }

  static bool try_parse(const std::string_view input, BasicDocument& result) {
    auto validated = validate(input);
    if (!validated.has_value()) {
      result = BasicDocument{};
      return false;
    }
    result = std::move(validated).take_value();
    return true;
  }

  // is_valid runs the pipeline without building an instance. No allocation.
  [[nodiscard]] static bool is_valid(const char* input) {
    return input != nullptr && is_valid(std::string_view{input});
  }

  [[nodiscard]] static bool is_valid(const std::string_view input) {
    pipeline::Buffer<Traits> buffer{};
    return !pipeline::run<Traits>(input, buffer).has_value();
  }

  // from_base appends both check digits to the first kLength - 2 characters.
  // Throws InvalidDocumentError (kLengthMismatch, kInvalidCharacter or
  // kDegenerateValue), or EmptyInputError for nullptr.
  [[nodiscard]] static BasicDocument from_base(const char* base) {
    if (base == nullptr) {
      throw EmptyInputError(kKind);
    }
    return from_base(std::string_view{base});
  }

  [[nodiscard]] static BasicDocument from_base(const std::string_view base) {
    const auto completed = pipeline::complete<Traits>(base);
    if (!completed.has_value()) {
      throw InvalidDocumentError(kKind, completed.error(), std::string{base});
    }
    const auto& buffer = completed.value();
    return BasicDocument(std::string(buffer.data(), buffer.size()));
  }

  // has_value is false only for the default instance.
  [[nodiscard]] bool has_value() const { return !value_.empty(); }

  // value returns the canonical unmasked value, or "" for the default instance.
  [[nodiscard]] const std::string& value() const { return value_; }

  // to_string returns the punctuated display form, or "" for the default instance.
  [[nodiscard]] std::string to_string() const { return pipeline::format<Traits>(value_); }

  bool operator==(const BasicDocument&) const = default;
  std::strong_ordering operator<=>(const BasicDocument&) const = default;

 private:
  explicit BasicDocument(std::string canonical) : value_(std::move(canonical)) {}

  std::string value_;
};

template <typename Traits>
std::ostream& operator<<(std::ostream& os, const BasicDocument<Traits>& doc) {
  return os << doc.to_string();
}

}  // namespace brdoc::document

namespace std {

template <typename Traits>
struct hash<brdoc::document::BasicDocument<Traits>> {
  size_t operator()(const brdoc::document::BasicDocument<Traits>& doc) const noexcept {
    return hash<string>{}(doc.value());
  }
};

}  // namespace std
