#include "brdoc/document/cnpj.h"

namespace brdoc::document {

template class BasicDocument<CnpjTraits>;

}  // namespace brdoc::document
