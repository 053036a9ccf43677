#include <kodiak/core/column.hpp>

#include <cstdint>
#include <string>

// Column<T> is fully header-only (template class).
// Explicit instantiations for the four engine cell types keep every member
// compiled once and checked against the ColumnElement concept.

namespace kodiak {

template class Column<std::int64_t>;
template class Column<double>;
template class Column<std::string>;
template class Column<Bool>;

}  // namespace kodiak
