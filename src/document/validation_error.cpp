#include "brdoc/document/validation_error.h"

#include "brdoc/document/traits.h"

#include <utility>

namespace brdoc::document {

namespace {

std::string length_hint(DocumentKind kind) {
  switch (kind) {
    case DocumentKind::kCpf:
      return std::to_string(CpfTraits::kLength) + " characters unmasked or " +
             std::to_string(CpfTraits::kFormattedLength) + " masked";
    case DocumentKind::kCnpj:
      return std::to_string(CnpjTraits::kLength) + " characters unmasked or " +
             std::to_string(CnpjTraits::kFormattedLength) + " masked";
  }
  return "unknown length";
}

std::string build_message(DocumentKind kind, ValidationError error, const std::string& input) {
  std::string message = describe(kind, error);
  if (!input.empty()) {
    message += " (input: \"";
    message += input;
    message += "\")";
  }
  return message;
}

}  // namespace

std::string_view to_string(ValidationError error) {
  switch (error) {
    case ValidationError::kNullOrEmpty:
      return "null_or_empty";
    case ValidationError::kInvalidCharacter:
      return "invalid_character";
    case ValidationError::kLengthMismatch:
      return "length_mismatch";
    case ValidationError::kDegenerateValue:
      return "degenerate_value";
    case ValidationError::kInvalidFirstCheckDigit:
      return "invalid_first_check_digit";
    case ValidationError::kInvalidSecondCheckDigit:
      return "invalid_second_check_digit";
  }
  return "unknown";
}

std::string describe(DocumentKind kind, ValidationError error) {
  std::string message{display_name(kind)};
  message += ": ";

  switch (error) {
    case ValidationError::kNullOrEmpty:
      message += "input must not be null or empty";
      break;
    case ValidationError::kInvalidCharacter:
      message += "input contains a non-ASCII character";
      break;
    case ValidationError::kLengthMismatch:
      message += "invalid length (expected " + length_hint(kind) + ")";
      break;
    case ValidationError::kDegenerateValue:
      message += "all characters are identical";
      break;
    case ValidationError::kInvalidFirstCheckDigit:
      message += "invalid first check digit";
      break;
    case ValidationError::kInvalidSecondCheckDigit:
      message += "invalid second check digit";
      break;
  }

  return message;
}

InvalidDocumentError::InvalidDocumentError(DocumentKind kind, ValidationError error,
                                           std::string input)
    : std::invalid_argument(build_message(kind, error, input)),
      kind_(kind),
      error_(error),
      input_(std::move(input)) {}

EmptyInputError::EmptyInputError(DocumentKind kind)
    : InvalidDocumentError(kind, ValidationError::kNullOrEmpty, std::string{}) {}

}  // namespace brdoc::document
