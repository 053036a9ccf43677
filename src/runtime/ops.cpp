#include <kodiak/runtime/ops.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>

namespace kodiak::ops {

namespace {

auto make_filter(ir::FilterExpr expr) -> ir::FilterExprPtr {
    return std::make_shared<const ir::FilterExpr>(std::move(expr));
}

}  // namespace

auto format_cell(const runtime::ColumnEntry& entry, std::size_t row) -> std::string {
    if (runtime::is_null(entry, row)) {
        return "null";
    }
    return std::visit(
        [row](const auto& c) -> std::string {
            using T = typename std::decay_t<decltype(c)>::value_type;
            if constexpr (std::is_same_v<T, std::string>) {
                return c[row];
            } else if constexpr (std::is_same_v<T, Bool>) {
                return c[row].value ? "true" : "false";
            } else if constexpr (std::is_same_v<T, double>) {
                double v = c[row];
                if (std::isnan(v))
                    return "nan";
                if (std::isinf(v))
                    return v > 0 ? "inf" : "-inf";
                return fmt::format("{:g}", v);
            } else {
                return std::to_string(c[row]);
            }
        },
        *entry.column);
}

void print(const runtime::Table& t, std::ostream& out) {
    if (t.columns.empty()) {
        out << "(empty table)\n";
        return;
    }

    std::size_t rows = t.rows();

    // Collect all cell strings and compute column widths.
    std::vector<std::vector<std::string>> cells(t.columns.size());
    std::vector<std::size_t> widths(t.columns.size());

    for (std::size_t c = 0; c < t.columns.size(); ++c) {
        widths[c] = t.columns[c].name.size();
        cells[c].reserve(rows);
        for (std::size_t r = 0; r < rows; ++r) {
            auto s = format_cell(t.columns[c], r);
            widths[c] = std::max(widths[c], s.size());
            cells[c].push_back(std::move(s));
        }
    }

    for (std::size_t c = 0; c < t.columns.size(); ++c) {
        if (c > 0)
            out << "  ";
        out << fmt::format("{:<{}}", t.columns[c].name, widths[c]);
    }
    out << "\n";

    for (std::size_t c = 0; c < t.columns.size(); ++c) {
        if (c > 0)
            out << "  ";
        out << std::string(widths[c], '-');
    }
    out << "\n";

    for (std::size_t r = 0; r < rows; ++r) {
        for (std::size_t c = 0; c < t.columns.size(); ++c) {
            if (c > 0)
                out << "  ";
            out << fmt::format("{:<{}}", cells[c][r], widths[c]);
        }
        out << "\n";
    }
}

// ─── Expression builders ──────────────────────────────────────────────────────

auto col_ref(std::string name) -> ir::Expr {
    return ir::Expr{ir::ColumnRef{.name = std::move(name)}};
}

auto int_lit(std::int64_t v) -> ir::Expr {
    return ir::Expr{ir::Literal{v}};
}

auto dbl_lit(double v) -> ir::Expr {
    return ir::Expr{ir::Literal{v}};
}

auto str_lit(std::string v) -> ir::Expr {
    return ir::Expr{ir::Literal{std::move(v)}};
}

auto bool_lit(bool v) -> ir::Expr {
    return ir::Expr{ir::Literal{Bool{v}}};
}

auto binop(ir::ArithmeticOp op, ir::Expr lhs, ir::Expr rhs) -> ir::Expr {
    return ir::Expr{ir::BinaryExpr{
        .op = op,
        .left = std::make_shared<const ir::Expr>(std::move(lhs)),
        .right = std::make_shared<const ir::Expr>(std::move(rhs)),
    }};
}

auto fn_call(ir::Builtin callee, std::vector<ir::Expr> args) -> ir::Expr {
    ir::CallExpr call;
    call.callee = callee;
    call.args.reserve(args.size());
    for (auto& arg : args) {
        call.args.push_back(std::make_shared<const ir::Expr>(std::move(arg)));
    }
    return ir::Expr{std::move(call)};
}

// ─── FilterExpr builders ──────────────────────────────────────────────────────

auto filter_col(std::string name) -> ir::FilterExprPtr {
    return make_filter(ir::FilterExpr{ir::FilterColumn{std::move(name)}});
}

auto filter_lit(ir::LiteralValue v) -> ir::FilterExprPtr {
    return make_filter(ir::FilterExpr{ir::FilterLiteral{std::move(v)}});
}

auto filter_int(std::int64_t v) -> ir::FilterExprPtr {
    return filter_lit(ir::LiteralValue{v});
}

auto filter_dbl(double v) -> ir::FilterExprPtr {
    return filter_lit(ir::LiteralValue{v});
}

auto filter_str(std::string v) -> ir::FilterExprPtr {
    return filter_lit(ir::LiteralValue{std::move(v)});
}

auto filter_bool(bool v) -> ir::FilterExprPtr {
    return filter_lit(ir::LiteralValue{Bool{v}});
}

auto filter_cmp(ir::CompareOp op, ir::FilterExprPtr l, ir::FilterExprPtr r) -> ir::FilterExprPtr {
    return make_filter(
        ir::FilterExpr{ir::FilterCmp{.op = op, .left = std::move(l), .right = std::move(r)}});
}

auto filter_and(ir::FilterExprPtr l, ir::FilterExprPtr r) -> ir::FilterExprPtr {
    return make_filter(ir::FilterExpr{ir::FilterAnd{.left = std::move(l), .right = std::move(r)}});
}

auto filter_or(ir::FilterExprPtr l, ir::FilterExprPtr r) -> ir::FilterExprPtr {
    return make_filter(ir::FilterExpr{ir::FilterOr{.left = std::move(l), .right = std::move(r)}});
}

auto filter_not(ir::FilterExprPtr operand) -> ir::FilterExprPtr {
    return make_filter(ir::FilterExpr{ir::FilterNot{std::move(operand)}});
}

auto filter_in(ir::FilterExprPtr value, std::vector<ir::LiteralValue> set) -> ir::FilterExprPtr {
    return make_filter(ir::FilterExpr{ir::FilterIn{.value = std::move(value), .set = std::move(set)}});
}

// ─── Compound builders ────────────────────────────────────────────────────────

auto make_field(std::string alias, ir::Expr expr) -> ir::FieldSpec {
    return ir::FieldSpec{.alias = std::move(alias), .expr = std::move(expr)};
}

auto make_agg(ir::AggFunc func, ir::Expr arg, std::string alias) -> ir::AggSpec {
    return ir::AggSpec{.func = func, .arg = std::move(arg), .alias = std::move(alias)};
}

}  // namespace kodiak::ops
