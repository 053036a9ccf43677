#include <kodiak/ir/types.hpp>
#include <kodiak/runtime/interpreter.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <robin_hood.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <compare>
#include <cstdint>
#include <exception>
#include <functional>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>

namespace kodiak::runtime {

namespace {

auto schema_error(std::string message) -> std::unexpected<Error> {
    return std::unexpected(
        Error{.kind = ErrorKind::SchemaResolution, .message = std::move(message)});
}

auto type_error(std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = ErrorKind::TypeMismatch, .message = std::move(message)});
}

auto compute_error(std::string message) -> std::unexpected<Error> {
    return std::unexpected(
        Error{.kind = ErrorKind::RuntimeComputation, .message = std::move(message)});
}

auto column_not_found(const std::string& name, const Table& input) -> std::unexpected<Error> {
    return schema_error(fmt::format("column not found: {} (available: {})", name,
                                    ir::format_columns(input.schema())));
}

auto as_double(const ScalarValue& value) -> double {
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return static_cast<double>(*i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return *d;
    }
    throw std::runtime_error("numeric value expected, got " +
                             std::string(to_string(kind_of(value))));
}

auto numeric_at(const ColumnValue& column, std::size_t row) -> double {
    if (const auto* ints = std::get_if<Column<std::int64_t>>(&column)) {
        return static_cast<double>((*ints)[row]);
    }
    if (const auto* dbls = std::get_if<Column<double>>(&column)) {
        return (*dbls)[row];
    }
    throw std::runtime_error("numeric column expected, got " +
                             std::string(to_string(kind_of(column))));
}

auto is_nan(const std::optional<ScalarValue>& value) -> bool {
    if (!value.has_value()) {
        return false;
    }
    const auto* d = std::get_if<double>(&*value);
    return d != nullptr && std::isnan(*d);
}

auto comparable(ScalarKind a, ScalarKind b) -> bool {
    return a == b || (is_numeric(a) && is_numeric(b));
}

/// Three-way comparison of two values of comparable kinds.
auto compare_values(const ScalarValue& a, const ScalarValue& b) -> std::partial_ordering {
    if (a.index() == b.index()) {
        return std::visit(
            [&b](const auto& lhs) -> std::partial_ordering {
                using T = std::decay_t<decltype(lhs)>;
                return lhs <=> std::get<T>(b);
            },
            a);
    }
    return as_double(a) <=> as_double(b);
}

auto truthy(const ScalarValue& value) -> bool {
    return std::visit(
        [](const auto& v) -> bool {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return !v.empty();
            } else if constexpr (std::is_same_v<T, Bool>) {
                return v.value;
            } else {
                return v != 0;
            }
        },
        value);
}

auto broadcast(const ScalarValue& value, std::size_t rows) -> ColumnEntry {
    ColumnValue column = std::visit(
        [rows](const auto& v) -> ColumnValue {
            using T = std::decay_t<decltype(v)>;
            return Column<T>(std::vector<T>(rows, v));
        },
        value);
    return ColumnEntry{.name = {},
                       .column = std::make_shared<ColumnValue>(std::move(column)),
                       .validity = std::nullopt};
}

auto gather_entry(const ColumnEntry& entry, const std::vector<std::size_t>& rows)
    -> ColumnEntry {
    ColumnValue column = std::visit(
        [&rows](const auto& src) -> ColumnValue {
            using ColT = std::decay_t<decltype(src)>;
            ColT dst;
            dst.resize(rows.size());
            for (std::size_t j = 0; j < rows.size(); ++j) {
                dst[j] = src[rows[j]];
            }
            return dst;
        },
        *entry.column);
    ColumnEntry out{.name = entry.name,
                    .column = std::make_shared<ColumnValue>(std::move(column)),
                    .validity = std::nullopt};
    if (entry.validity.has_value()) {
        std::vector<bool> validity(rows.size());
        for (std::size_t j = 0; j < rows.size(); ++j) {
            validity[j] = (*entry.validity)[rows[j]];
        }
        out.validity = std::move(validity);
    }
    return out;
}

auto gather(const Table& input, const std::vector<std::size_t>& rows) -> Table {
    Table output;
    for (const auto& entry : input.columns) {
        output.add_entry(gather_entry(entry, rows));
    }
    return output;
}

// ─── Expressions ─────────────────────────────────────────────────────────────

auto eval_expr(const ir::Expr& expr, const Table& input) -> std::expected<ColumnEntry, Error>;

auto apply_int(ir::ArithmeticOp op, std::int64_t lhs, std::int64_t rhs)
    -> std::optional<std::int64_t> {
    // Overflow and division by zero yield null.
    std::int64_t out = 0;
    switch (op) {
        case ir::ArithmeticOp::Add:
            if (__builtin_add_overflow(lhs, rhs, &out)) {
                return std::nullopt;
            }
            return out;
        case ir::ArithmeticOp::Sub:
            if (__builtin_sub_overflow(lhs, rhs, &out)) {
                return std::nullopt;
            }
            return out;
        case ir::ArithmeticOp::Mul:
            if (__builtin_mul_overflow(lhs, rhs, &out)) {
                return std::nullopt;
            }
            return out;
        case ir::ArithmeticOp::Div:
            if (rhs == 0 || (rhs == -1 && lhs == std::numeric_limits<std::int64_t>::min())) {
                return std::nullopt;
            }
            return lhs / rhs;
        case ir::ArithmeticOp::Mod:
            if (rhs == 0) {
                return std::nullopt;
            }
            if (rhs == -1) {
                return std::int64_t{0};
            }
            return lhs % rhs;
    }
    return std::nullopt;
}

auto apply_double(ir::ArithmeticOp op, double lhs, double rhs) -> double {
    switch (op) {
        case ir::ArithmeticOp::Add:
            return lhs + rhs;
        case ir::ArithmeticOp::Sub:
            return lhs - rhs;
        case ir::ArithmeticOp::Mul:
            return lhs * rhs;
        case ir::ArithmeticOp::Div:
            return lhs / rhs;
        case ir::ArithmeticOp::Mod:
            return std::fmod(lhs, rhs);
    }
    return 0.0;
}

auto eval_binary(const ir::BinaryExpr& binary, const Table& input)
    -> std::expected<ColumnEntry, Error> {
    auto lhs = eval_expr(*binary.left, input);
    if (!lhs) {
        return lhs;
    }
    auto rhs = eval_expr(*binary.right, input);
    if (!rhs) {
        return rhs;
    }
    ScalarKind lk = kind_of(*lhs->column);
    ScalarKind rk = kind_of(*rhs->column);
    if (!is_numeric(lk) || !is_numeric(rk)) {
        return type_error(fmt::format("arithmetic on {} and {}", to_string(lk), to_string(rk)));
    }
    const bool integral = lk == ScalarKind::Int && rk == ScalarKind::Int;
    const std::size_t rows = column_size(*lhs->column);
    ColumnBuilder out(integral ? ScalarKind::Int : ScalarKind::Double);
    out.reserve(rows);
    for (std::size_t row = 0; row < rows; ++row) {
        if (is_null(*lhs, row) || is_null(*rhs, row)) {
            out.append_null();
            continue;
        }
        if (integral) {
            auto value = apply_int(binary.op, std::get<Column<std::int64_t>>(*lhs->column)[row],
                                   std::get<Column<std::int64_t>>(*rhs->column)[row]);
            if (value.has_value()) {
                out.append(ScalarValue{*value});
            } else {
                out.append_null();
            }
        } else {
            out.append(ScalarValue{apply_double(binary.op, numeric_at(*lhs->column, row),
                                                numeric_at(*rhs->column, row))});
        }
    }
    return std::move(out).finish({});
}

auto eval_call(const ir::CallExpr& call, const Table& input) -> std::expected<ColumnEntry, Error> {
    // Arity and argument kinds are checked by the shared typing rules.
    auto result_kind = ir::infer_kind(ir::Expr{call}, input.schema());
    if (!result_kind) {
        return std::unexpected(result_kind.error());
    }
    std::vector<ColumnEntry> args;
    args.reserve(call.args.size());
    for (const auto& arg : call.args) {
        auto value = eval_expr(*arg, input);
        if (!value) {
            return value;
        }
        args.push_back(std::move(*value));
    }
    const ColumnEntry& first = args.front();
    const std::size_t rows = column_size(*first.column);

    switch (call.callee) {
        case ir::Builtin::NanToNull: {
            const auto* dbls = std::get_if<Column<double>>(first.column.get());
            if (dbls == nullptr) {
                return first;
            }
            ColumnEntry out = first;
            std::vector<bool> validity = first.validity.value_or(std::vector<bool>(rows, true));
            bool any_null = first.validity.has_value();
            for (std::size_t row = 0; row < rows; ++row) {
                if (std::isnan((*dbls)[row])) {
                    validity[row] = false;
                    any_null = true;
                }
            }
            if (any_null) {
                out.validity = std::move(validity);
            }
            return out;
        }
        case ir::Builtin::ToBool: {
            ColumnBuilder out(ScalarKind::Bool);
            out.reserve(rows);
            for (std::size_t row = 0; row < rows; ++row) {
                auto value = cell(first, row);
                if (!value.has_value()) {
                    out.append_null();
                } else {
                    out.append(ScalarValue{Bool{truthy(*value)}});
                }
            }
            return std::move(out).finish({});
        }
        case ir::Builtin::Coalesce: {
            ColumnBuilder out(*result_kind);
            out.reserve(rows);
            for (std::size_t row = 0; row < rows; ++row) {
                std::optional<ScalarValue> value;
                for (const auto& arg : args) {
                    value = cell(arg, row);
                    if (value.has_value()) {
                        break;
                    }
                }
                out.append(value);
            }
            return std::move(out).finish({});
        }
        case ir::Builtin::Log:
        case ir::Builtin::Exp: {
            ColumnBuilder out(ScalarKind::Double);
            out.reserve(rows);
            for (std::size_t row = 0; row < rows; ++row) {
                if (is_null(first, row)) {
                    out.append_null();
                    continue;
                }
                double x = numeric_at(*first.column, row);
                if (call.callee == ir::Builtin::Exp) {
                    out.append(ScalarValue{std::exp(x)});
                } else if (x <= 0.0) {
                    out.append_null();
                } else {
                    out.append(ScalarValue{std::log(x)});
                }
            }
            return std::move(out).finish({});
        }
        case ir::Builtin::CheckPositive: {
            for (std::size_t row = 0; row < rows; ++row) {
                if (is_null(first, row)) {
                    continue;
                }
                double x = numeric_at(*first.column, row);
                if (!std::isnan(x) && x <= 0.0) {
                    return compute_error(
                        fmt::format("values should be bigger than 0: {}", x));
                }
            }
            return first;
        }
    }
    return type_error("unknown builtin");
}

auto eval_expr(const ir::Expr& expr, const Table& input) -> std::expected<ColumnEntry, Error> {
    return std::visit(
        [&](const auto& node) -> std::expected<ColumnEntry, Error> {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ir::ColumnRef>) {
                const auto* entry = input.find_entry(node.name);
                if (entry == nullptr) {
                    return column_not_found(node.name, input);
                }
                return *entry;
            } else if constexpr (std::is_same_v<T, ir::Literal>) {
                return broadcast(node.value, input.rows());
            } else if constexpr (std::is_same_v<T, ir::BinaryExpr>) {
                return eval_binary(node, input);
            } else {
                return eval_call(node, input);
            }
        },
        expr.node);
}

// ─── Filters ─────────────────────────────────────────────────────────────────

using Mask = std::vector<std::uint8_t>;

auto eval_filter_value(const ir::FilterExpr& expr, const Table& input)
    -> std::expected<ColumnEntry, Error> {
    if (const auto* column = std::get_if<ir::FilterColumn>(&expr.node)) {
        const auto* entry = input.find_entry(column->name);
        if (entry == nullptr) {
            return column_not_found(column->name, input);
        }
        return *entry;
    }
    if (const auto* literal = std::get_if<ir::FilterLiteral>(&expr.node)) {
        return broadcast(literal->value, input.rows());
    }
    return type_error("filter comparison operand must be a column or literal");
}

auto compare_holds(ir::CompareOp op, std::partial_ordering ord) -> bool {
    switch (op) {
        case ir::CompareOp::Eq:
            return std::is_eq(ord);
        case ir::CompareOp::Ne:
            return std::is_neq(ord);
        case ir::CompareOp::Lt:
            return std::is_lt(ord);
        case ir::CompareOp::Le:
            return std::is_lteq(ord);
        case ir::CompareOp::Gt:
            return std::is_gt(ord);
        case ir::CompareOp::Ge:
            return std::is_gteq(ord);
    }
    return false;
}

auto compute_mask(const ir::FilterExpr& expr, const Table& input) -> std::expected<Mask, Error> {
    const std::size_t rows = input.rows();
    return std::visit(
        [&](const auto& node) -> std::expected<Mask, Error> {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ir::FilterColumn> ||
                          std::is_same_v<T, ir::FilterLiteral>) {
                auto value = eval_filter_value(expr, input);
                if (!value) {
                    return std::unexpected(value.error());
                }
                const auto* bools = std::get_if<Column<Bool>>(value->column.get());
                if (bools == nullptr) {
                    return type_error(fmt::format("filter predicate must be bool, got {}",
                                                  to_string(kind_of(*value->column))));
                }
                Mask mask(rows, 0);
                for (std::size_t row = 0; row < rows; ++row) {
                    mask[row] = !is_null(*value, row) && (*bools)[row].value ? 1 : 0;
                }
                return mask;
            } else if constexpr (std::is_same_v<T, ir::FilterCmp>) {
                auto lhs = eval_filter_value(*node.left, input);
                if (!lhs) {
                    return std::unexpected(lhs.error());
                }
                auto rhs = eval_filter_value(*node.right, input);
                if (!rhs) {
                    return std::unexpected(rhs.error());
                }
                ScalarKind lk = kind_of(*lhs->column);
                ScalarKind rk = kind_of(*rhs->column);
                if (!comparable(lk, rk)) {
                    return type_error(
                        fmt::format("cannot compare {} with {}", to_string(lk), to_string(rk)));
                }
                Mask mask(rows, 0);
                for (std::size_t row = 0; row < rows; ++row) {
                    auto a = cell(*lhs, row);
                    auto b = cell(*rhs, row);
                    if (a.has_value() && b.has_value()) {
                        mask[row] = compare_holds(node.op, compare_values(*a, *b)) ? 1 : 0;
                    }
                }
                return mask;
            } else if constexpr (std::is_same_v<T, ir::FilterAnd> ||
                                 std::is_same_v<T, ir::FilterOr>) {
                auto lhs = compute_mask(*node.left, input);
                if (!lhs) {
                    return lhs;
                }
                auto rhs = compute_mask(*node.right, input);
                if (!rhs) {
                    return rhs;
                }
                for (std::size_t row = 0; row < rows; ++row) {
                    if constexpr (std::is_same_v<T, ir::FilterAnd>) {
                        (*lhs)[row] = (*lhs)[row] & (*rhs)[row];
                    } else {
                        (*lhs)[row] = (*lhs)[row] | (*rhs)[row];
                    }
                }
                return lhs;
            } else if constexpr (std::is_same_v<T, ir::FilterNot>) {
                auto inner = compute_mask(*node.operand, input);
                if (!inner) {
                    return inner;
                }
                for (auto& bit : *inner) {
                    bit = bit == 0 ? 1 : 0;
                }
                return inner;
            } else {
                auto value = eval_filter_value(*node.value, input);
                if (!value) {
                    return std::unexpected(value.error());
                }
                ScalarKind vk = kind_of(*value->column);
                std::vector<ScalarValue> members;
                for (const auto& member : node.set) {
                    if (!comparable(vk, kind_of(member))) {
                        return type_error(fmt::format("cannot compare {} with {}", to_string(vk),
                                                      to_string(kind_of(member))));
                    }
                    members.push_back(member);
                }
                Mask mask(rows, 0);
                for (std::size_t row = 0; row < rows; ++row) {
                    auto v = cell(*value, row);
                    if (!v.has_value()) {
                        continue;
                    }
                    for (const auto& member : members) {
                        if (std::is_eq(compare_values(*v, member))) {
                            mask[row] = 1;
                            break;
                        }
                    }
                }
                return mask;
            }
        },
        expr.node);
}

auto filter_table(const Table& input, const ir::FilterExpr& predicate)
    -> std::expected<Table, Error> {
    auto mask = compute_mask(predicate, input);
    if (!mask) {
        return std::unexpected(mask.error());
    }
    std::vector<std::size_t> selected;
    selected.reserve(mask->size());
    for (std::size_t row = 0; row < mask->size(); ++row) {
        if ((*mask)[row] != 0) {
            selected.push_back(row);
        }
    }
    return gather(input, selected);
}

// ─── Relational operators ─────────────────────────────────────────────────────

auto project_table(const Table& input, const std::vector<ir::ColumnRef>& columns)
    -> std::expected<Table, Error> {
    Table output;
    for (const auto& col : columns) {
        const auto* entry = input.find_entry(col.name);
        if (entry == nullptr) {
            return column_not_found(col.name, input);
        }
        output.add_entry(*entry);
    }
    return output;
}

auto update_table(const Table& input, const std::vector<ir::FieldSpec>& fields)
    -> std::expected<Table, Error> {
    std::vector<ColumnEntry> computed;
    computed.reserve(fields.size());
    for (const auto& field : fields) {
        auto value = eval_expr(field.expr, input);
        if (!value) {
            return std::unexpected(value.error());
        }
        value->name = field.alias;
        computed.push_back(std::move(*value));
    }
    Table output = input;
    for (auto& entry : computed) {
        output.add_entry(std::move(entry));
    }
    return output;
}

struct Key {
    std::vector<std::optional<ScalarValue>> values;
};

struct KeyHash {
    auto operator()(const Key& key) const -> std::size_t {
        std::size_t seed = 0;
        auto hash_combine = [&](std::size_t value) {
            seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        };
        for (const auto& value : key.values) {
            hash_combine(value.has_value() ? std::hash<ScalarValue>{}(*value) : 0x5bd1e995U);
        }
        return seed;
    }
};

struct KeyEq {
    auto operator()(const Key& a, const Key& b) const -> bool { return a.values == b.values; }
};

/// Row ids of each group, groups in order of first appearance.
/// NaN keys fall into the null group.
auto group_rows(const std::vector<ColumnEntry>& keys, std::size_t rows)
    -> std::vector<std::vector<std::size_t>> {
    std::vector<std::vector<std::size_t>> groups;
    if (keys.empty()) {
        if (rows > 0) {
            groups.emplace_back(rows);
            std::iota(groups.front().begin(), groups.front().end(), std::size_t{0});
        }
        return groups;
    }
    robin_hood::unordered_flat_map<Key, std::size_t, KeyHash, KeyEq> lookup;
    for (std::size_t row = 0; row < rows; ++row) {
        Key key;
        key.values.reserve(keys.size());
        for (const auto& entry : keys) {
            auto value = cell(entry, row);
            if (is_nan(value)) {
                value.reset();
            }
            key.values.push_back(std::move(value));
        }
        auto [it, inserted] = lookup.emplace(std::move(key), groups.size());
        if (inserted) {
            groups.emplace_back();
        }
        groups[it->second].push_back(row);
    }
    return groups;
}

auto eval_keys(const std::vector<ir::Expr>& exprs, const Table& input)
    -> std::expected<std::vector<ColumnEntry>, Error> {
    std::vector<ColumnEntry> keys;
    keys.reserve(exprs.size());
    for (const auto& expr : exprs) {
        auto value = eval_expr(expr, input);
        if (!value) {
            return std::unexpected(value.error());
        }
        keys.push_back(std::move(*value));
    }
    return keys;
}

auto sample_variance(const ColumnEntry& arg, const std::vector<std::size_t>& rows)
    -> std::optional<double> {
    std::vector<double> values;
    values.reserve(rows.size());
    for (auto row : rows) {
        if (!is_null(arg, row)) {
            values.push_back(numeric_at(*arg.column, row));
        }
    }
    if (values.size() < 2) {
        return std::nullopt;
    }
    double mean = std::accumulate(values.begin(), values.end(), 0.0) /
                  static_cast<double>(values.size());
    double ss = 0.0;
    for (double v : values) {
        ss += (v - mean) * (v - mean);
    }
    return ss / static_cast<double>(values.size() - 1);
}

auto aggregate_group(ir::AggFunc func, ScalarKind kind, const ColumnEntry& arg,
                     const std::vector<std::size_t>& rows) -> std::optional<ScalarValue> {
    switch (func) {
        case ir::AggFunc::Count: {
            std::int64_t count = 0;
            for (auto row : rows) {
                if (!is_null(arg, row)) {
                    ++count;
                }
            }
            return ScalarValue{count};
        }
        case ir::AggFunc::CountDistinct: {
            robin_hood::unordered_flat_set<ScalarValue, std::hash<ScalarValue>> seen;
            for (auto row : rows) {
                auto value = cell(arg, row);
                if (value.has_value() && !is_nan(value)) {
                    seen.insert(std::move(*value));
                }
            }
            return ScalarValue{static_cast<std::int64_t>(seen.size())};
        }
        case ir::AggFunc::Sum: {
            bool any = false;
            if (kind == ScalarKind::Int) {
                std::int64_t total = 0;
                const auto& ints = std::get<Column<std::int64_t>>(*arg.column);
                for (auto row : rows) {
                    if (!is_null(arg, row)) {
                        if (__builtin_add_overflow(total, ints[row], &total)) {
                            return std::nullopt;
                        }
                        any = true;
                    }
                }
                return any ? std::optional<ScalarValue>{total} : std::nullopt;
            }
            double total = 0.0;
            for (auto row : rows) {
                if (!is_null(arg, row)) {
                    total += numeric_at(*arg.column, row);
                    any = true;
                }
            }
            return any ? std::optional<ScalarValue>{total} : std::nullopt;
        }
        case ir::AggFunc::Mean: {
            double total = 0.0;
            std::size_t count = 0;
            for (auto row : rows) {
                if (!is_null(arg, row)) {
                    total += numeric_at(*arg.column, row);
                    ++count;
                }
            }
            if (count == 0) {
                return std::nullopt;
            }
            return ScalarValue{total / static_cast<double>(count)};
        }
        case ir::AggFunc::Min:
        case ir::AggFunc::Max: {
            std::optional<ScalarValue> best;
            for (auto row : rows) {
                auto value = cell(arg, row);
                if (!value.has_value()) {
                    continue;
                }
                if (!best.has_value()) {
                    best = std::move(value);
                    continue;
                }
                auto ord = compare_values(*value, *best);
                if (func == ir::AggFunc::Min ? std::is_lt(ord) : std::is_gt(ord)) {
                    best = std::move(value);
                }
            }
            return best;
        }
        case ir::AggFunc::First:
            if (rows.empty()) {
                return std::nullopt;
            }
            return cell(arg, rows.front());
        case ir::AggFunc::Last:
            for (auto it = rows.rbegin(); it != rows.rend(); ++it) {
                if (auto value = cell(arg, *it); value.has_value()) {
                    return value;
                }
            }
            return std::nullopt;
        case ir::AggFunc::Std:
        case ir::AggFunc::Var: {
            auto variance = sample_variance(arg, rows);
            if (!variance.has_value()) {
                return std::nullopt;
            }
            return ScalarValue{func == ir::AggFunc::Std ? std::sqrt(*variance) : *variance};
        }
    }
    return std::nullopt;
}

auto aggregate_table(const ir::AggregateNode& node, const Table& input)
    -> std::expected<Table, Error> {
    std::vector<ColumnEntry> keys;
    for (const auto& field : node.group_by()) {
        auto value = eval_expr(field.expr, input);
        if (!value) {
            return std::unexpected(value.error());
        }
        keys.push_back(std::move(*value));
    }
    std::vector<ColumnEntry> args;
    std::vector<ScalarKind> kinds;
    for (const auto& agg : node.aggregations()) {
        auto value = eval_expr(agg.arg, input);
        if (!value) {
            return std::unexpected(value.error());
        }
        auto kind = ir::agg_result_kind(agg.func, kind_of(*value->column));
        if (!kind) {
            return std::unexpected(kind.error());
        }
        args.push_back(std::move(*value));
        kinds.push_back(*kind);
    }

    auto groups = group_rows(keys, input.rows());
    spdlog::debug("aggregate node {}: {} rows into {} groups", node.id(), input.rows(),
                  groups.size());

    Table output;
    for (std::size_t k = 0; k < keys.size(); ++k) {
        ColumnBuilder builder(kind_of(*keys[k].column));
        builder.reserve(groups.size());
        for (const auto& members : groups) {
            builder.append_from(keys[k], members.front());
        }
        output.add_entry(std::move(builder).finish(node.group_by()[k].alias));
    }
    for (std::size_t a = 0; a < args.size(); ++a) {
        const auto& agg = node.aggregations()[a];
        ColumnBuilder builder(kinds[a]);
        builder.reserve(groups.size());
        for (const auto& members : groups) {
            builder.append(aggregate_group(agg.func, kinds[a], args[a], members));
        }
        output.add_entry(std::move(builder).finish(agg.alias));
    }
    return output;
}

/// Orders two rows of one column; NaN sorts after every number.
auto compare_rows(const ColumnEntry& entry, std::size_t a, std::size_t b)
    -> std::partial_ordering {
    return std::visit(
        [a, b](const auto& col) -> std::partial_ordering {
            using T = typename std::decay_t<decltype(col)>::value_type;
            if constexpr (std::is_same_v<T, double>) {
                bool an = std::isnan(col[a]);
                bool bn = std::isnan(col[b]);
                if (an || bn) {
                    return an == bn ? std::partial_ordering::equivalent
                                    : (an ? std::partial_ordering::greater
                                          : std::partial_ordering::less);
                }
            }
            return col[a] <=> col[b];
        },
        *entry.column);
}

auto order_table(const ir::OrderNode& node, const Table& input) -> std::expected<Table, Error> {
    std::vector<const ColumnEntry*> keys;
    for (const auto& key : node.keys()) {
        const auto* entry = input.find_entry(key.name);
        if (entry == nullptr) {
            return column_not_found(key.name, input);
        }
        keys.push_back(entry);
    }
    std::vector<std::size_t> perm(input.rows());
    std::iota(perm.begin(), perm.end(), std::size_t{0});
    std::stable_sort(perm.begin(), perm.end(), [&](std::size_t a, std::size_t b) {
        for (std::size_t k = 0; k < keys.size(); ++k) {
            const auto& entry = *keys[k];
            const bool ascending = node.keys()[k].ascending;
            const bool a_null = is_null(entry, a);
            const bool b_null = is_null(entry, b);
            if (a_null || b_null) {
                if (a_null == b_null) {
                    continue;
                }
                // Nulls lead an ascending sort and trail a descending one.
                return ascending ? a_null : b_null;
            }
            auto ord = compare_rows(entry, a, b);
            if (std::is_lt(ord)) {
                return ascending;
            }
            if (std::is_gt(ord)) {
                return !ascending;
            }
        }
        return false;
    });
    return gather(input, perm);
}

/// Next running value; nullopt when an integer sum overflows.
auto accumulate_step(ir::CumFunc func, const ScalarValue& acc, const ScalarValue& value)
    -> std::optional<ScalarValue> {
    switch (func) {
        case ir::CumFunc::Sum:
            if (std::holds_alternative<std::int64_t>(acc) &&
                std::holds_alternative<std::int64_t>(value)) {
                std::int64_t out = 0;
                if (__builtin_add_overflow(std::get<std::int64_t>(acc),
                                           std::get<std::int64_t>(value), &out)) {
                    return std::nullopt;
                }
                return ScalarValue{out};
            }
            return ScalarValue{as_double(acc) + as_double(value)};
        case ir::CumFunc::Min:
            return std::is_lt(compare_values(value, acc)) ? value : acc;
        case ir::CumFunc::Max:
            return std::is_gt(compare_values(value, acc)) ? value : acc;
    }
    return acc;
}

auto window_table(const ir::WindowNode& node, const Table& input) -> std::expected<Table, Error> {
    auto keys = eval_keys(node.partition_by(), input);
    if (!keys) {
        return std::unexpected(keys.error());
    }
    const std::size_t rows = input.rows();
    auto groups = group_rows(*keys, rows);

    Table output = input;
    for (const auto& field : node.fields()) {
        auto arg = eval_expr(field.arg, input);
        if (!arg) {
            return std::unexpected(arg.error());
        }
        auto kind = ir::cum_result_kind(field.func, kind_of(*arg->column));
        if (!kind) {
            return std::unexpected(kind.error());
        }
        std::vector<std::optional<ScalarValue>> running(rows);
        for (const auto& members : groups) {
            std::optional<ScalarValue> acc;
            for (auto row : members) {
                auto value = cell(*arg, row);
                if (!value.has_value() || is_nan(value)) {
                    continue;
                }
                if (!acc.has_value()) {
                    acc = std::move(*value);
                } else if (auto next = accumulate_step(field.func, *acc, *value);
                           next.has_value()) {
                    acc = std::move(*next);
                } else {
                    // An overflowed running sum stays null for the rest of the group.
                    break;
                }
                running[row] = acc;
            }
        }
        ColumnBuilder builder(*kind);
        builder.reserve(rows);
        for (const auto& value : running) {
            builder.append(value);
        }
        output.add_entry(std::move(builder).finish(field.alias));
    }
    return output;
}

// ─── Grouped map ──────────────────────────────────────────────────────────────

auto check_group_result(const Table& part, const Schema& schema) -> std::expected<void, Error> {
    if (part.columns.size() != schema.size()) {
        return type_error(fmt::format("group function returned {} columns ({}), expected {} ({})",
                                      part.columns.size(), ir::format_columns(part.schema()),
                                      schema.size(), ir::format_columns(schema)));
    }
    const std::size_t rows = part.rows();
    for (std::size_t c = 0; c < schema.size(); ++c) {
        const auto& entry = part.columns[c];
        if (entry.name != schema[c].name) {
            return type_error(fmt::format("group function returned column {} where {} is declared",
                                          entry.name, schema[c].name));
        }
        ScalarKind kind = kind_of(*entry.column);
        if (kind != schema[c].kind &&
            !(kind == ScalarKind::Int && schema[c].kind == ScalarKind::Double)) {
            return type_error(fmt::format("group function returned {} for column {}, declared {}",
                                          to_string(kind), entry.name, to_string(schema[c].kind)));
        }
        if (column_size(*entry.column) != rows) {
            return type_error(
                fmt::format("group function returned ragged column {}", entry.name));
        }
    }
    return {};
}

auto group_map_table(const ir::GroupMapNode& node, const Table& input, const ExecOptions& options)
    -> std::expected<Table, Error> {
    if (!node.func()) {
        return type_error("group function is not callable");
    }
    auto keys = eval_keys(node.group_by(), input);
    if (!keys) {
        return std::unexpected(keys.error());
    }
    const auto groups = group_rows(*keys, input.rows());
    std::vector<std::expected<Table, std::string>> results(groups.size());

    auto run_group = [&](std::size_t g) {
        Table slice = gather(input, groups[g]);
        try {
            results[g] = node.func()(slice);
        } catch (const std::exception& e) {
            results[g] = std::unexpected(std::string(e.what()));
        }
    };

    const std::size_t hw = options.max_threads > 0
                               ? options.max_threads
                               : std::max<unsigned>(1, std::thread::hardware_concurrency());
    const bool use_parallel =
        hw > 1 && groups.size() > 1 && groups.size() >= options.parallel_group_threshold;
    if (use_parallel) {
        const std::size_t threads = std::min(groups.size(), hw);
        const std::size_t chunk = (groups.size() + threads - 1) / threads;
        spdlog::debug("group map node {}: {} groups on {} threads", node.id(), groups.size(),
                      threads);
        std::vector<std::thread> workers;
        workers.reserve(threads);
        for (std::size_t t = 0; t < threads; ++t) {
            std::size_t start = t * chunk;
            if (start >= groups.size()) {
                break;
            }
            std::size_t end = std::min(groups.size(), start + chunk);
            workers.emplace_back([&, start, end] {
                for (std::size_t g = start; g < end; ++g) {
                    run_group(g);
                }
            });
        }
        for (auto& th : workers) {
            th.join();
        }
    } else {
        spdlog::debug("group map node {}: {} groups", node.id(), groups.size());
        for (std::size_t g = 0; g < groups.size(); ++g) {
            run_group(g);
        }
    }

    const auto& schema = node.schema();
    const bool keep_order = node.rows() != ir::GroupMapRows::Any;
    std::vector<ColumnBuilder> builders;
    builders.reserve(schema.size());
    for (const auto& field : schema) {
        builders.emplace_back(field.kind);
    }
    // Input row each output row came from, when the child's row order is kept.
    std::vector<std::size_t> origin;
    for (std::size_t g = 0; g < results.size(); ++g) {
        auto& result = results[g];
        if (!result) {
            return compute_error(fmt::format("group function failed: {}", result.error()));
        }
        const Table& part = *result;
        if (auto checked = check_group_result(part, schema); !checked) {
            return std::unexpected(checked.error());
        }
        const std::size_t group_size = groups[g].size();
        const bool fits = node.rows() == ir::GroupMapRows::Any || part.rows() == group_size ||
                          (node.rows() == ir::GroupMapRows::Subset && part.rows() == 0);
        if (!fits) {
            return compute_error(fmt::format(
                "group function returned {} rows for a group of {}", part.rows(), group_size));
        }
        for (std::size_t row = 0; row < part.rows(); ++row) {
            for (std::size_t c = 0; c < schema.size(); ++c) {
                builders[c].append_from(part.columns[c], row);
            }
            if (keep_order) {
                origin.push_back(groups[g][row]);
            }
        }
    }
    Table output;
    for (std::size_t c = 0; c < schema.size(); ++c) {
        output.add_entry(std::move(builders[c]).finish(schema[c].name));
    }
    if (!keep_order) {
        return output;
    }
    std::vector<std::size_t> perm(origin.size());
    std::iota(perm.begin(), perm.end(), std::size_t{0});
    std::sort(perm.begin(), perm.end(),
              [&origin](std::size_t a, std::size_t b) { return origin[a] < origin[b]; });
    return gather(output, perm);
}

auto zip_table(const ir::ZipNode& node, const Table& left, const Table& right)
    -> std::expected<Table, Error> {
    const auto* entry = right.find_entry(node.column());
    if (entry == nullptr) {
        return column_not_found(node.column(), right);
    }
    if (left.rows() != right.rows()) {
        return compute_error(fmt::format("cannot align column {} by position: {} rows against {}",
                                         node.column(), right.rows(), left.rows()));
    }
    Table output = left;
    ColumnEntry aligned = *entry;
    aligned.name = node.alias();
    output.add_entry(std::move(aligned));
    return output;
}

auto interpret_node(const ir::Node& node, const TableRegistry& registry,
                    const ExecOptions& options) -> std::expected<Table, Error> {
    if (node.kind() == ir::NodeKind::Scan) {
        const auto& scan = static_cast<const ir::ScanNode&>(node);
        auto it = registry.find(scan.source_name());
        if (it == registry.end()) {
            std::vector<std::string> names;
            names.reserve(registry.size());
            for (const auto& [name, table] : registry) {
                names.push_back(name);
            }
            std::sort(names.begin(), names.end());
            return schema_error(fmt::format("unknown table: {} (available: {})",
                                            scan.source_name(), fmt::join(names, ", ")));
        }
        return it->second;
    }

    auto child = interpret_node(*node.children().front(), registry, options);
    if (!child) {
        return child;
    }
    switch (node.kind()) {
        case ir::NodeKind::Filter:
            return filter_table(*child, static_cast<const ir::FilterNode&>(node).predicate());
        case ir::NodeKind::Project:
            return project_table(*child, static_cast<const ir::ProjectNode&>(node).columns());
        case ir::NodeKind::Update:
            return update_table(*child, static_cast<const ir::UpdateNode&>(node).fields());
        case ir::NodeKind::Aggregate:
            return aggregate_table(static_cast<const ir::AggregateNode&>(node), *child);
        case ir::NodeKind::Order:
            return order_table(static_cast<const ir::OrderNode&>(node), *child);
        case ir::NodeKind::Window:
            return window_table(static_cast<const ir::WindowNode&>(node), *child);
        case ir::NodeKind::GroupMap:
            return group_map_table(static_cast<const ir::GroupMapNode&>(node), *child, options);
        case ir::NodeKind::Zip: {
            auto right = interpret_node(*node.children()[1], registry, options);
            if (!right) {
                return right;
            }
            return zip_table(static_cast<const ir::ZipNode&>(node), *child, *right);
        }
        case ir::NodeKind::Scan:
            break;
    }
    return std::unexpected(
        Error{.kind = ErrorKind::RuntimeComputation, .message = "unsupported node kind"});
}

}  // namespace

auto interpret(const ir::Node& node, const TableRegistry& registry, const ExecOptions& options)
    -> std::expected<Table, Error> {
    try {
        return interpret_node(node, registry, options);
    } catch (const std::runtime_error& e) {
        return compute_error(e.what());
    }
}

auto evaluate(const ir::Expr& expr, const Table& input) -> std::expected<ColumnEntry, Error> {
    try {
        return eval_expr(expr, input);
    } catch (const std::runtime_error& e) {
        return compute_error(e.what());
    }
}

}  // namespace kodiak::runtime
