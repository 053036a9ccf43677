#include <kodiak/core/error.hpp>

#include <fmt/format.h>

namespace kodiak {

auto to_string(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::IndexingShape:
            return "IndexingShapeError";
        case ErrorKind::UnsupportedSelection:
            return "UnsupportedSelectionError";
        case ErrorKind::SchemaResolution:
            return "SchemaResolutionError";
        case ErrorKind::Configuration:
            return "ConfigurationError";
        case ErrorKind::TypeMismatch:
            return "TypeMismatchError";
        case ErrorKind::RuntimeComputation:
            return "RuntimeComputationError";
        case ErrorKind::NotImplemented:
            return "NotImplementedError";
    }
    return "Error";
}

auto Error::format() const -> std::string {
    return fmt::format("{}: {}", to_string(kind), message);
}

}  // namespace kodiak
