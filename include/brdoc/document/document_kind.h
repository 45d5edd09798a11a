#pragma once

// DocumentKind is the authoritative vocabulary for the document types this
// library understands.
//
// C++ Core Guidelines Enum.2: use enumerations to represent sets of related named constants.
// The compiler warns on incomplete switch statements, so adding a kind forces
// every switch site to be updated.

#include <cstdint>
#include <string_view>

namespace brdoc::document {

enum class DocumentKind : uint8_t {
  kCpf,   // Cadastro de Pessoas Fisicas, 11 digits
  kCnpj,  // Cadastro Nacional da Pessoa Juridica, 14 alphanumerics
};

// display_name returns the upper-case acronym used in human-readable messages.
// The returned string_view is a string literal and is always valid.
[[nodiscard]] inline std::string_view display_name(DocumentKind kind) {
  switch (kind) {
    case DocumentKind::kCpf:
      return "CPF";
    case DocumentKind::kCnpj:
      return "CNPJ";
  }
  return "UNKNOWN";  // unreachable - all enumerators covered above
}

}  // namespace brdoc::document
