#pragma once

#include <compare>
#include <cstddef>
#include <functional>

namespace kodiak {

/// Boolean cell value.
///
/// Wrapped so that Column<Bool> stores one byte per row and never decays to
/// the packed std::vector<bool> specialization.
struct Bool {
    bool value = false;
    auto operator<=>(const Bool&) const = default;
};

}  // namespace kodiak

namespace std {

template <>
struct hash<kodiak::Bool> {
    auto operator()(const kodiak::Bool& b) const noexcept -> std::size_t {
        return std::hash<bool>{}(b.value);
    }
};

}  // namespace std
