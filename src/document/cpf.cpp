#include "brdoc/document/cpf.h"

namespace brdoc::document {

template class BasicDocument<CpfTraits>;

}  // namespace brdoc::document
