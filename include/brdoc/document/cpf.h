#pragma once

#include "brdoc/document/document.h"
#include "brdoc/document/traits.h"

namespace brdoc::document {

// Cpf is an individual taxpayer number: 11 digits, displayed as XXX.XXX.XXX-XX.
//
//   auto cpf = Cpf::from_string("123.456.789-09");
//   cpf.value();      // "12345678909"
//   cpf.to_string();  // "123.456.789-09"
using Cpf = BasicDocument<CpfTraits>;

extern template class BasicDocument<CpfTraits>;

}  // namespace brdoc::document
