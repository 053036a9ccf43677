#pragma once

#include <kodiak/core/error.hpp>
#include <kodiak/core/schema.hpp>
#include <kodiak/ir/node.hpp>

#include <expected>
#include <string>

namespace kodiak::ir {

/// Static result kind of `expr` evaluated against `input`.
///
/// The planner and the interpreter share these rules, so a schema computed
/// while building a plan is the schema the engine produces.
[[nodiscard]] auto infer_kind(const Expr& expr, const Schema& input)
    -> std::expected<ScalarKind, Error>;

[[nodiscard]] auto agg_result_kind(AggFunc func, ScalarKind input)
    -> std::expected<ScalarKind, Error>;

[[nodiscard]] auto cum_result_kind(CumFunc func, ScalarKind input)
    -> std::expected<ScalarKind, Error>;

[[nodiscard]] auto to_string(AggFunc func) noexcept -> std::string_view;
[[nodiscard]] auto to_string(CumFunc func) noexcept -> std::string_view;
[[nodiscard]] auto to_string(Builtin func) noexcept -> std::string_view;

/// Comma separated column names, "<none>" when empty.
[[nodiscard]] auto format_columns(const Schema& schema) -> std::string;

}  // namespace kodiak::ir
