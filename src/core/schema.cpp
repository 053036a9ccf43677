#include <kodiak/core/schema.hpp>

namespace kodiak {

auto to_string(ScalarKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ScalarKind::Int:
            return "int64";
        case ScalarKind::Double:
            return "double";
        case ScalarKind::String:
            return "string";
        case ScalarKind::Bool:
            return "bool";
    }
    return "unknown";
}

auto field_index(const Schema& schema, std::string_view name) noexcept -> std::size_t {
    for (std::size_t i = 0; i < schema.size(); ++i) {
        if (schema[i].name == name) {
            return i;
        }
    }
    return schema.size();
}

}  // namespace kodiak
