#pragma once

#include "brdoc/document/document_kind.h"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace brdoc::document {

// ValidationError enumerates every reason the validation pipeline rejects an input.
// Following E.14 (use purpose-designed types as error indicators).
// Order matches pipeline order: the first failing stage determines the reason.
enum class ValidationError : uint8_t {
  kNullOrEmpty,              // input absent or empty; checked before sanitization
  kInvalidCharacter,         // a byte outside ASCII appeared in the input
  kLengthMismatch,           // sanitized character count differs from the fixed length
  kDegenerateValue,          // every sanitized character is identical
  kInvalidFirstCheckDigit,   // first check digit does not match
  kInvalidSecondCheckDigit,  // second check digit does not match
};

// to_string returns a stable snake_case identifier for the error.
[[nodiscard]] std::string_view to_string(ValidationError error);

// describe renders a human-readable, log-ready message for a rejection,
// e.g. "CPF: invalid first check digit".
[[nodiscard]] std::string describe(DocumentKind kind, ValidationError error);

// InvalidDocumentError is thrown by the constructing and parsing operations.
// It carries the document kind, the rejection reason and the original input.
class InvalidDocumentError : public std::invalid_argument {
 public:
  InvalidDocumentError(DocumentKind kind, ValidationError error, std::string input);

  [[nodiscard]] DocumentKind kind() const noexcept { return kind_; }
  [[nodiscard]] ValidationError error() const noexcept { return error_; }
  [[nodiscard]] const std::string& input() const noexcept { return input_; }

 private:
  DocumentKind kind_;
  ValidationError error_;
  std::string input_;
};

// EmptyInputError is the distinct error raised by parse() for a null or empty input.
// Callers catching InvalidDocumentError also catch this.
class EmptyInputError final : public InvalidDocumentError {
 public:
  explicit EmptyInputError(DocumentKind kind);
};

}  // namespace brdoc::document
