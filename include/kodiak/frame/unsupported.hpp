#pragma once

#include <kodiak/core/error.hpp>

#include <cstdint>
#include <span>
#include <string_view>

namespace kodiak {

enum class ApiKind : std::uint8_t {
    Function,
    Property,
};

/// A pandas API name that is recognized but not implemented.
///
/// `GroupBy::call` consults the groupby classes and `attribute` consults
/// `pd.DataFrame`; callers with their own name dispatch use the same table.
struct UnsupportedApi {
    std::string_view class_name;  // "pd.DataFrame", "pd.DataFrameGroupBy", "pd.SeriesGroupBy"
    std::string_view name;
    ApiKind kind = ApiKind::Function;
    std::string_view suggestion;  // empty when there is no nearby alternative
};

/// Descriptor for `class_name.name`, or nullptr when the name is not registered.
[[nodiscard]] auto lookup_unsupported(std::string_view class_name, std::string_view name) noexcept
    -> const UnsupportedApi*;

/// Every registered descriptor.
[[nodiscard]] auto unsupported_apis() noexcept -> std::span<const UnsupportedApi>;

/// NotImplemented error naming `pd.Class.name` and the suggestion, if any.
[[nodiscard]] auto unsupported_error(const UnsupportedApi& api) -> Error;

}  // namespace kodiak
