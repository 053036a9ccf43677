#pragma once

#include <kodiak/core/error.hpp>
#include <kodiak/runtime/table.hpp>

#include <expected>
#include <istream>
#include <string_view>

namespace kodiak::runtime {

/// Simple CSV reader (comma-separated, no quotes/escapes).
///
/// Column kinds are inferred per column: int64, then double, then bool
/// ("true"/"false"), else string. Empty fields and "NaN"/"nan" are null;
/// a null never decides the kind.
[[nodiscard]] auto read_csv(std::istream& input) -> std::expected<Table, Error>;
[[nodiscard]] auto read_csv_file(std::string_view path) -> std::expected<Table, Error>;

}  // namespace kodiak::runtime
