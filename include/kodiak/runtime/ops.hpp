#pragma once

#include <kodiak/ir/node.hpp>
#include <kodiak/runtime/table.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace kodiak::ops {

// ─── Expression builders ──────────────────────────────────────────────────────
//  Convenience factories for constructing IR expression trees in the frame
//  layer and in tests.

[[nodiscard]] auto col_ref(std::string name) -> ir::Expr;
[[nodiscard]] auto int_lit(std::int64_t v) -> ir::Expr;
[[nodiscard]] auto dbl_lit(double v) -> ir::Expr;
[[nodiscard]] auto str_lit(std::string v) -> ir::Expr;
[[nodiscard]] auto bool_lit(bool v) -> ir::Expr;
[[nodiscard]] auto binop(ir::ArithmeticOp op, ir::Expr lhs, ir::Expr rhs) -> ir::Expr;
[[nodiscard]] auto fn_call(ir::Builtin callee, std::vector<ir::Expr> args) -> ir::Expr;

// ─── FilterExpr builders ──────────────────────────────────────────────────────

[[nodiscard]] auto filter_col(std::string name) -> ir::FilterExprPtr;
[[nodiscard]] auto filter_lit(ir::LiteralValue v) -> ir::FilterExprPtr;
[[nodiscard]] auto filter_int(std::int64_t v) -> ir::FilterExprPtr;
[[nodiscard]] auto filter_dbl(double v) -> ir::FilterExprPtr;
[[nodiscard]] auto filter_str(std::string v) -> ir::FilterExprPtr;
/// Constant predicate: keeps every row (true) or none (false).
[[nodiscard]] auto filter_bool(bool v) -> ir::FilterExprPtr;
[[nodiscard]] auto filter_cmp(ir::CompareOp op, ir::FilterExprPtr l, ir::FilterExprPtr r)
    -> ir::FilterExprPtr;
[[nodiscard]] auto filter_and(ir::FilterExprPtr l, ir::FilterExprPtr r) -> ir::FilterExprPtr;
[[nodiscard]] auto filter_or(ir::FilterExprPtr l, ir::FilterExprPtr r) -> ir::FilterExprPtr;
[[nodiscard]] auto filter_not(ir::FilterExprPtr operand) -> ir::FilterExprPtr;
[[nodiscard]] auto filter_in(ir::FilterExprPtr value, std::vector<ir::LiteralValue> set)
    -> ir::FilterExprPtr;

// ─── Compound builders ────────────────────────────────────────────────────────

[[nodiscard]] auto make_field(std::string alias, ir::Expr expr) -> ir::FieldSpec;
[[nodiscard]] auto make_agg(ir::AggFunc func, ir::Expr arg, std::string alias) -> ir::AggSpec;

// ─── Output ───────────────────────────────────────────────────────────────────

/// Text of one cell; nulls print as "null", NaN as "nan".
[[nodiscard]] auto format_cell(const runtime::ColumnEntry& entry, std::size_t row) -> std::string;

void print(const runtime::Table& t, std::ostream& out = std::cout);

}  // namespace kodiak::ops
