#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace kodiak {

/// Error categories reported by the frame layer and the execution engine.
enum class ErrorKind : std::uint8_t {
    /// Wrong key arity or shape (e.g. a column indexer on a series).
    IndexingShape,
    /// A selection form the layer deliberately does not translate.
    UnsupportedSelection,
    /// A column, source or attribute that does not exist in the schema.
    SchemaResolution,
    /// Malformed aggregation spec, missing return schema, bad metadata.
    Configuration,
    /// A value of the wrong kind (non-callable function, bad assignment value).
    TypeMismatch,
    /// A failure detected while the engine evaluates data.
    RuntimeComputation,
    /// A recognized pandas API that is not implemented.
    NotImplemented,
};

struct Error {
    ErrorKind kind = ErrorKind::RuntimeComputation;
    std::string message;

    /// "<kind>: <message>"
    [[nodiscard]] auto format() const -> std::string;
};

[[nodiscard]] auto to_string(ErrorKind kind) noexcept -> std::string_view;

}  // namespace kodiak
