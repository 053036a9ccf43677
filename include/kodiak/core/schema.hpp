#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace kodiak {

/// Physical cell kinds understood by the engine.
enum class ScalarKind : std::uint8_t {
    Int,
    Double,
    String,
    Bool,
};

[[nodiscard]] auto to_string(ScalarKind kind) noexcept -> std::string_view;

[[nodiscard]] constexpr auto is_numeric(ScalarKind kind) noexcept -> bool {
    return kind == ScalarKind::Int || kind == ScalarKind::Double;
}

/// One named, typed output column of a plan.
struct Field {
    std::string name;
    ScalarKind kind = ScalarKind::Int;

    auto operator==(const Field&) const -> bool = default;
};

using Schema = std::vector<Field>;

/// Position of `name` in `schema`, or schema.size() when absent.
[[nodiscard]] auto field_index(const Schema& schema, std::string_view name) noexcept
    -> std::size_t;

}  // namespace kodiak
