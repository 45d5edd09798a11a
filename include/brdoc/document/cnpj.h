#pragma once

#include "brdoc/document/document.h"
#include "brdoc/document/traits.h"

namespace brdoc::document {

// Cnpj is a company number: 14 characters, displayed as XX.XXX.XXX/XXXX-XX.
// The first 12 characters may be digits or letters (alphanumeric CNPJ);
// lower-case input is folded to upper case. The two check digits are always digits.
//
//   auto cnpj = Cnpj::from_string("sp.mm6.uql/0001-05");
//   cnpj.value();      // "SPMM6UQL000105"
//   cnpj.to_string();  // "SP.MM6.UQL/0001-05"
using Cnpj = BasicDocument<CnpjTraits>;

extern template class BasicDocument<CnpjTraits>;

}  // namespace brdoc::document
