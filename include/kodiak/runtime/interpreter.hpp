#pragma once

#include <kodiak/core/error.hpp>
#include <kodiak/ir/node.hpp>
#include <kodiak/runtime/table.hpp>

#include <cstddef>
#include <expected>

namespace kodiak::runtime {

/// Engine knobs. Defaults suit tests and small tables.
struct ExecOptions {
    /// Upper bound on grouped-map worker threads; 0 means hardware concurrency.
    std::size_t max_threads = 0;
    /// Minimum number of groups before grouped-map invocations run in parallel.
    std::size_t parallel_group_threshold = 64;
};

/// Interpret an IR node tree against a table registry.
///
/// Row-preserving operators (filter, project, update, window) keep the
/// relative order of their input rows; aggregate emits groups in order of
/// first appearance; order is a stable sort.
[[nodiscard]] auto interpret(const ir::Node& node, const TableRegistry& registry,
                             const ExecOptions& options = {}) -> std::expected<Table, Error>;

/// Evaluate a scalar expression column-wise over `input`.
[[nodiscard]] auto evaluate(const ir::Expr& expr, const Table& input)
    -> std::expected<ColumnEntry, Error>;

}  // namespace kodiak::runtime
