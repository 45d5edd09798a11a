#pragma once

#include "brdoc/document/cnpj.h"
#include "brdoc/document/cpf.h"

#include <nlohmann/json.hpp>

namespace brdoc::document {

// nlohmann::json conversions, found by ADL:
//
//   nlohmann::json j = cpf;          // "12345678909"
//   auto cnpj = j.get<Cnpj>();
//
// A valid instance serializes to its unmasked value; the default instance to null.
// from_json accepts null (default instance) or a masked/unmasked string.
// Invalid strings throw InvalidDocumentError; other JSON types throw nlohmann::json::type_error.

void to_json(nlohmann::json& j, const Cpf& doc);
void from_json(const nlohmann::json& j, Cpf& doc);

void to_json(nlohmann::json& j, const Cnpj& doc);
void from_json(const nlohmann::json& j, Cnpj& doc);

}  // namespace brdoc::document
