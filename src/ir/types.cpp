#include <kodiak/ir/types.hpp>

#include <fmt/format.h>

#include <cctype>
#include <optional>
#include <string_view>

namespace kodiak::ir {

namespace {

auto is_simple_identifier(std::string_view name) -> bool {
    if (name.empty()) {
        return false;
    }
    unsigned char first = static_cast<unsigned char>(name.front());
    if (std::isalpha(first) == 0 && first != '_') {
        return false;
    }
    for (std::size_t i = 1; i < name.size(); ++i) {
        unsigned char ch = static_cast<unsigned char>(name[i]);
        if (std::isalnum(ch) == 0 && ch != '_') {
            return false;
        }
    }
    return true;
}

auto type_error(std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = ErrorKind::TypeMismatch, .message = std::move(message)});
}

auto numeric_arg(const CallExpr& call, const Schema& input) -> std::expected<ScalarKind, Error> {
    if (call.args.size() != 1) {
        return type_error(fmt::format("{}() expects 1 argument, got {}", to_string(call.callee),
                                      call.args.size()));
    }
    auto kind = infer_kind(*call.args.front(), input);
    if (!kind) {
        return kind;
    }
    if (!is_numeric(*kind)) {
        return type_error(
            fmt::format("{}() expects a numeric argument, got {}", to_string(call.callee),
                        to_string(*kind)));
    }
    return kind;
}

auto infer_call(const CallExpr& call, const Schema& input) -> std::expected<ScalarKind, Error> {
    switch (call.callee) {
        case Builtin::NanToNull:
        case Builtin::ToBool: {
            if (call.args.size() != 1) {
                return type_error(fmt::format("{}() expects 1 argument, got {}",
                                              to_string(call.callee), call.args.size()));
            }
            auto kind = infer_kind(*call.args.front(), input);
            if (!kind) {
                return kind;
            }
            return call.callee == Builtin::ToBool ? ScalarKind::Bool : *kind;
        }
        case Builtin::Coalesce: {
            if (call.args.empty()) {
                return type_error("coalesce() expects at least 1 argument");
            }
            std::optional<ScalarKind> result;
            for (const auto& arg : call.args) {
                auto kind = infer_kind(*arg, input);
                if (!kind) {
                    return kind;
                }
                if (!result.has_value() || *result == *kind) {
                    result = *kind;
                } else if (is_numeric(*result) && is_numeric(*kind)) {
                    result = ScalarKind::Double;
                } else {
                    return type_error(fmt::format("coalesce() mixes {} and {}",
                                                  to_string(*result), to_string(*kind)));
                }
            }
            return *result;
        }
        case Builtin::Log:
        case Builtin::Exp: {
            auto kind = numeric_arg(call, input);
            if (!kind) {
                return kind;
            }
            return ScalarKind::Double;
        }
        case Builtin::CheckPositive:
            return numeric_arg(call, input);
    }
    return type_error("unknown builtin");
}

}  // namespace

auto infer_kind(const Expr& expr, const Schema& input) -> std::expected<ScalarKind, Error> {
    return std::visit(
        [&](const auto& node) -> std::expected<ScalarKind, Error> {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, ColumnRef>) {
                auto pos = field_index(input, node.name);
                if (pos == input.size()) {
                    return std::unexpected(
                        Error{.kind = ErrorKind::SchemaResolution,
                              .message = fmt::format("column not found: {} (available: {})",
                                                     node.name, format_columns(input))});
                }
                return input[pos].kind;
            } else if constexpr (std::is_same_v<T, Literal>) {
                return runtime::kind_of(node.value);
            } else if constexpr (std::is_same_v<T, BinaryExpr>) {
                auto lhs = infer_kind(*node.left, input);
                if (!lhs) {
                    return lhs;
                }
                auto rhs = infer_kind(*node.right, input);
                if (!rhs) {
                    return rhs;
                }
                if (!is_numeric(*lhs) || !is_numeric(*rhs)) {
                    return type_error(fmt::format("arithmetic on {} and {}", to_string(*lhs),
                                                  to_string(*rhs)));
                }
                if (*lhs == ScalarKind::Int && *rhs == ScalarKind::Int) {
                    return ScalarKind::Int;
                }
                return ScalarKind::Double;
            } else {
                return infer_call(node, input);
            }
        },
        expr.node);
}

auto agg_result_kind(AggFunc func, ScalarKind input) -> std::expected<ScalarKind, Error> {
    switch (func) {
        case AggFunc::Count:
        case AggFunc::CountDistinct:
            return ScalarKind::Int;
        case AggFunc::Sum:
            if (!is_numeric(input)) {
                return type_error(fmt::format("sum of {} column", to_string(input)));
            }
            return input;
        case AggFunc::Mean:
        case AggFunc::Std:
        case AggFunc::Var:
            if (!is_numeric(input)) {
                return type_error(
                    fmt::format("{} of {} column", to_string(func), to_string(input)));
            }
            return ScalarKind::Double;
        case AggFunc::Min:
        case AggFunc::Max:
        case AggFunc::First:
        case AggFunc::Last:
            return input;
    }
    return type_error("unknown aggregate");
}

auto cum_result_kind(CumFunc func, ScalarKind input) -> std::expected<ScalarKind, Error> {
    if (func == CumFunc::Sum && !is_numeric(input)) {
        return type_error(fmt::format("cumulative sum of {} column", to_string(input)));
    }
    return input;
}

auto to_string(AggFunc func) noexcept -> std::string_view {
    switch (func) {
        case AggFunc::Count:
            return "count";
        case AggFunc::CountDistinct:
            return "nunique";
        case AggFunc::Sum:
            return "sum";
        case AggFunc::Mean:
            return "mean";
        case AggFunc::Min:
            return "min";
        case AggFunc::Max:
            return "max";
        case AggFunc::First:
            return "first";
        case AggFunc::Last:
            return "last";
        case AggFunc::Std:
            return "std";
        case AggFunc::Var:
            return "var";
    }
    return "unknown";
}

auto to_string(CumFunc func) noexcept -> std::string_view {
    switch (func) {
        case CumFunc::Sum:
            return "cumsum";
        case CumFunc::Min:
            return "cummin";
        case CumFunc::Max:
            return "cummax";
    }
    return "unknown";
}

auto to_string(Builtin func) noexcept -> std::string_view {
    switch (func) {
        case Builtin::NanToNull:
            return "nan_to_null";
        case Builtin::ToBool:
            return "to_bool";
        case Builtin::Coalesce:
            return "coalesce";
        case Builtin::Log:
            return "log";
        case Builtin::Exp:
            return "exp";
        case Builtin::CheckPositive:
            return "check_positive";
    }
    return "unknown";
}

auto format_columns(const Schema& schema) -> std::string {
    if (schema.empty()) {
        return "<none>";
    }
    std::string out;
    for (std::size_t i = 0; i < schema.size(); ++i) {
        if (i > 0) {
            out.append(", ");
        }
        const auto& name = schema[i].name;
        if (is_simple_identifier(name)) {
            out.append(name);
        } else {
            out.push_back('`');
            out.append(name);
            out.push_back('`');
        }
    }
    return out;
}

}  // namespace kodiak::ir
