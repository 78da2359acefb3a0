#include <fxgen/core/column.hpp>
#include <fxgen/core/time.hpp>

#include <cstdint>

// Column<T> is header-only. Explicit instantiations for the element types
// used by SeriesTable keep compile times down in the tools and tests.

namespace fxgen {

template class Column<std::int64_t>;
template class Column<double>;
template class Column<Timestamp>;

}  // namespace fxgen
