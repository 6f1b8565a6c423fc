#include "common/types.h"

namespace pinion {
namespace common {

// Explicit template instantiations for frequently used Result types
template class Result<bool>;
template class Result<uint64_t>;
template class Result<PublicKey>;

} // namespace common
} // namespace pinion
