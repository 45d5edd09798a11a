#include "brdoc/document/document_json.h"

#include <string>

namespace brdoc::document {

namespace {

template <typename Document>
void document_to_json(nlohmann::json& j, const Document& doc) {
  if (doc.has_value()) {
    j = doc.value();
  } else {
    j = nullptr;
  }
}

template <typename Document>
void document_from_json(const nlohmann::json& j, Document& doc) {
  if (j.is_null()) {
    doc = Document{};
    return;
  }
  // get<std::string>() throws type_error for non-string values
  doc = Document::from_string(j.get<std::string>());
}

}  // namespace

void to_json(nlohmann::json& j, const Cpf& doc) { document_to_json(j, doc); }

void from_json(const nlohmann::json& j, Cpf& doc) { document_from_json(j, doc); }

void to_json(nlohmann::json& j, const Cnpj& doc) { document_to_json(j, doc); }

void from_json(const nlohmann::json& j, Cnpj& doc) { document_from_json(j, doc); }

}  // namespace brdoc::document
