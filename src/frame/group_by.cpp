#include <kodiak/frame/group_by.hpp>
#include <kodiak/frame/unsupported.hpp>
#include <kodiak/ir/builder.hpp>
#include <kodiak/ir/types.hpp>
#include <kodiak/runtime/ops.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <array>
#include <unordered_set>
#include <utility>

namespace kodiak {

namespace {

auto config_error(std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = ErrorKind::Configuration, .message = std::move(message)});
}

auto not_callable(std::string_view operation) -> std::unexpected<Error> {
    return std::unexpected(
        Error{.kind = ErrorKind::TypeMismatch,
              .message = fmt::format("{} needs a callable function", operation)});
}

auto column_refs(const std::vector<std::string>& names) -> std::vector<ir::ColumnRef> {
    std::vector<ir::ColumnRef> refs;
    refs.reserve(names.size());
    for (const auto& name : names) {
        refs.push_back(ir::ColumnRef{.name = name});
    }
    return refs;
}

/// Aggregation input for `column`; NaN counts as missing.
auto agg_input(const std::string& column, ScalarKind kind) -> ir::Expr {
    auto ref = ops::col_ref(column);
    if (kind == ScalarKind::Double) {
        return ops::fn_call(ir::Builtin::NanToNull, {std::move(ref)});
    }
    return ref;
}

auto labels_for(const FrameMetadata& metadata, const std::vector<std::string>& columns)
    -> std::optional<std::vector<ColumnLabel>> {
    if (!metadata.column_labels().has_value()) {
        return std::nullopt;
    }
    std::vector<ColumnLabel> labels;
    labels.reserve(columns.size());
    for (const auto& column : columns) {
        labels.push_back(metadata.label_of(column));
    }
    return labels;
}

/// `metadata` narrowed to `columns`, each declared as its kind in `kinds`.
auto retyped(const FrameMetadata& metadata, const std::vector<std::string>& columns,
             Schema kinds) -> std::expected<FrameMetadata, Error> {
    auto narrowed = metadata.with_data_columns(columns);
    if (!narrowed) {
        return narrowed;
    }
    return narrowed->copy(MetadataOverrides{.index_columns = std::nullopt,
                                            .data_columns = std::nullopt,
                                            .column_labels = std::nullopt,
                                            .schema = std::move(kinds)});
}

auto empty_like(const runtime::Table& table) -> runtime::Table {
    runtime::Table out;
    for (const auto& entry : table.columns) {
        runtime::ColumnBuilder builder(runtime::kind_of(*entry.column));
        out.add_entry(std::move(builder).finish(entry.name));
    }
    return out;
}

struct ReduceInfo {
    ir::AggFunc func;
    bool numeric_only;
};

auto reduce_info(GroupByOp op) -> ReduceInfo {
    switch (op) {
        case GroupByOp::Count:
            return {ir::AggFunc::Count, false};
        case GroupByOp::First:
            return {ir::AggFunc::First, false};
        case GroupByOp::Last:
            return {ir::AggFunc::Last, false};
        case GroupByOp::Max:
        case GroupByOp::Any:
            return {ir::AggFunc::Max, false};
        case GroupByOp::Min:
        case GroupByOp::All:
            return {ir::AggFunc::Min, false};
        case GroupByOp::Mean:
            return {ir::AggFunc::Mean, true};
        case GroupByOp::Std:
            return {ir::AggFunc::Std, true};
        case GroupByOp::Sum:
            return {ir::AggFunc::Sum, true};
        case GroupByOp::Var:
            return {ir::AggFunc::Var, true};
        default:
            break;
    }
    return {ir::AggFunc::Count, false};
}

constexpr std::array<std::pair<std::string_view, GroupByOp>, 16> kOps{{
    {"count", GroupByOp::Count},
    {"first", GroupByOp::First},
    {"last", GroupByOp::Last},
    {"max", GroupByOp::Max},
    {"mean", GroupByOp::Mean},
    {"min", GroupByOp::Min},
    {"std", GroupByOp::Std},
    {"sum", GroupByOp::Sum},
    {"var", GroupByOp::Var},
    {"all", GroupByOp::All},
    {"any", GroupByOp::Any},
    {"size", GroupByOp::Size},
    {"cummax", GroupByOp::CumMax},
    {"cummin", GroupByOp::CumMin},
    {"cumsum", GroupByOp::CumSum},
    {"cumprod", GroupByOp::CumProd},
}};

}  // namespace

auto parse_group_by_op(std::string_view name) noexcept -> std::optional<GroupByOp> {
    for (const auto& [key, op] : kOps) {
        if (key == name) {
            return op;
        }
    }
    return std::nullopt;
}

auto to_string(GroupByOp op) noexcept -> std::string_view {
    for (const auto& [key, value] : kOps) {
        if (value == op) {
            return key;
        }
    }
    return "unknown";
}

// ─── Construction ─────────────────────────────────────────────────────────────

GroupBy::GroupBy(Frame parent, GroupKey keys, std::optional<std::vector<std::string>> columns,
                 bool series)
    : parent_(std::move(parent)),
      keys_(std::move(keys)),
      columns_(std::move(columns)),
      series_(series) {}

auto group_by(const Frame& frame, const std::vector<GroupKeyInput>& keys)
    -> std::expected<GroupBy, Error> {
    auto key = GroupKey::make(frame, keys);
    if (!key) {
        return std::unexpected(key.error());
    }
    spdlog::debug("groupby: {} keys [{}] on node {}", key->size(), fmt::join(key->names(), ", "),
                  frame.plan()->id());
    if (frame.is_series()) {
        return GroupBy(frame, std::move(*key), frame.metadata().data_columns(), true);
    }
    return GroupBy(frame, std::move(*key), std::nullopt, false);
}

auto GroupBy::agg_columns() const -> std::vector<std::string> {
    if (columns_.has_value()) {
        return *columns_;
    }
    std::vector<std::string> columns;
    for (const auto& column : parent_.metadata().data_columns()) {
        if (!keys_.contains(column)) {
            columns.push_back(column);
        }
    }
    return columns;
}

auto GroupBy::local_columns() const -> std::vector<std::string> {
    return columns_.has_value() ? *columns_ : parent_.metadata().data_columns();
}

auto GroupBy::narrow(const std::string& column) const -> std::expected<GroupBy, Error> {
    auto narrowed = narrow(std::vector<std::string>{column});
    if (!narrowed) {
        return narrowed;
    }
    narrowed->series_ = true;
    return narrowed;
}

auto GroupBy::narrow(const std::vector<std::string>& columns) const
    -> std::expected<GroupBy, Error> {
    if (series_) {
        return std::unexpected(
            Error{.kind = ErrorKind::IndexingShape, .message = "too many indexers"});
    }
    if (columns.empty()) {
        return config_error("no columns selected from the groupby");
    }
    std::vector<std::string> unknown;
    for (const auto& column : columns) {
        if (!parent_.metadata().is_data_column(column)) {
            unknown.push_back(column);
        }
    }
    if (!unknown.empty()) {
        return std::unexpected(
            Error{.kind = ErrorKind::SchemaResolution,
                  .message = fmt::format("columns not found: {}", fmt::join(unknown, ", "))});
    }
    return GroupBy(parent_, keys_, columns, false);
}

// ─── Reductions ───────────────────────────────────────────────────────────────

auto GroupBy::count() const -> std::expected<Frame, Error> {
    return reduce(GroupByOp::Count);
}
auto GroupBy::first() const -> std::expected<Frame, Error> {
    return reduce(GroupByOp::First);
}
auto GroupBy::last() const -> std::expected<Frame, Error> {
    return reduce(GroupByOp::Last);
}
auto GroupBy::max() const -> std::expected<Frame, Error> {
    return reduce(GroupByOp::Max);
}
auto GroupBy::mean() const -> std::expected<Frame, Error> {
    return reduce(GroupByOp::Mean);
}
auto GroupBy::min() const -> std::expected<Frame, Error> {
    return reduce(GroupByOp::Min);
}
auto GroupBy::stddev() const -> std::expected<Frame, Error> {
    return reduce(GroupByOp::Std);
}
auto GroupBy::sum() const -> std::expected<Frame, Error> {
    return reduce(GroupByOp::Sum);
}
auto GroupBy::var() const -> std::expected<Frame, Error> {
    return reduce(GroupByOp::Var);
}
auto GroupBy::all() const -> std::expected<Frame, Error> {
    return reduce(GroupByOp::All);
}
auto GroupBy::any() const -> std::expected<Frame, Error> {
    return reduce(GroupByOp::Any);
}

auto GroupBy::reduce(GroupByOp op) const -> std::expected<Frame, Error> {
    const auto& metadata = parent_.metadata();
    const auto info = reduce_info(op);
    const bool boolean = op == GroupByOp::All || op == GroupByOp::Any;

    std::vector<ir::AggSpec> aggs;
    std::vector<std::string> data;
    Schema schema = keys_.schema();
    for (const auto& column : agg_columns()) {
        auto kind = metadata.declared_type(column);
        if (!kind) {
            return std::unexpected(kind.error());
        }
        if (info.numeric_only && !is_numeric(*kind)) {
            continue;
        }
        ir::Expr arg = agg_input(column, *kind);
        ScalarKind result = ScalarKind::Bool;
        if (boolean) {
            // all(): no false value; any(): some true value. Nulls do not count.
            arg = ops::fn_call(ir::Builtin::Coalesce,
                               {ops::fn_call(ir::Builtin::ToBool, {std::move(arg)}),
                                ops::bool_lit(op == GroupByOp::All)});
        } else {
            auto out = ir::agg_result_kind(info.func, *kind);
            if (!out) {
                return std::unexpected(out.error());
            }
            result = *out;
        }
        aggs.push_back(ops::make_agg(info.func, std::move(arg), column));
        data.push_back(column);
        schema.push_back(Field{.name = column, .kind = result});
    }

    auto out_metadata = FrameMetadata::make(keys_.index_columns(), data,
                                            labels_for(metadata, data), std::move(schema));
    if (!out_metadata) {
        return std::unexpected(out_metadata.error());
    }

    std::vector<ir::OrderKey> order;
    for (const auto& entry : keys_.entries()) {
        order.push_back(ir::OrderKey{.name = entry.alias, .ascending = true});
    }
    ir::Builder builder;
    auto plan = builder.order(builder.aggregate(keys_.source(), keys_.fields(), std::move(aggs)),
                              std::move(order));
    spdlog::debug("groupby {}: {} keys, {} columns", to_string(op), keys_.size(), data.size());

    std::optional<std::string> series;
    if (series_ && data.size() == 1) {
        series = data.front();
    }
    return parent_.derive(std::move(plan), std::move(*out_metadata), std::move(series));
}

auto GroupBy::size() const -> std::expected<Frame, Error> {
    auto columns = agg_columns();
    std::string name = is_explicit() && columns.size() == 1 ? columns.front() : "count";

    Schema schema = keys_.schema();
    schema.push_back(Field{.name = name, .kind = ScalarKind::Int});
    auto metadata = FrameMetadata::make(keys_.index_columns(), {name}, std::nullopt,
                                        std::move(schema));
    if (!metadata) {
        return std::unexpected(metadata.error());
    }

    std::vector<ir::OrderKey> order;
    for (const auto& entry : keys_.entries()) {
        order.push_back(ir::OrderKey{.name = entry.alias, .ascending = true});
    }
    ir::Builder builder;
    auto plan = builder.order(
        builder.aggregate(keys_.source(), keys_.fields(),
                          {ops::make_agg(ir::AggFunc::Count, ops::int_lit(1), name)}),
        std::move(order));
    spdlog::debug("groupby size: {} keys", keys_.size());
    return parent_.derive(std::move(plan), std::move(*metadata), name);
}

auto GroupBy::aggregate(const AggregationSpec& spec) const -> std::expected<Frame, Error> {
    if (spec.empty()) {
        return config_error("no aggregation functions given");
    }
    const auto& metadata = parent_.metadata();
    std::unordered_set<std::string> seen;
    std::vector<std::string> unknown;
    bool multi = false;
    for (const auto& request : spec) {
        if (request.functions.empty()) {
            return config_error(fmt::format("no aggregation functions given for column {}",
                                            request.column));
        }
        if (!seen.insert(request.column).second) {
            return config_error(
                fmt::format("column {} appears more than once in the aggregation", request.column));
        }
        for (const auto& function : request.functions) {
            if (!parse_agg_function(function).has_value()) {
                return config_error(fmt::format("unknown aggregate function '{}' for column {}",
                                                function, request.column));
            }
        }
        if (!metadata.is_data_column(request.column)) {
            unknown.push_back(request.column);
        }
        multi = multi || request.functions.size() > 1;
    }
    if (!unknown.empty()) {
        return std::unexpected(
            Error{.kind = ErrorKind::SchemaResolution,
                  .message = fmt::format("columns not found: {}", fmt::join(unknown, ", "))});
    }

    std::vector<ir::AggSpec> aggs;
    std::vector<std::string> data;
    std::vector<ColumnLabel> labels;
    Schema schema = keys_.schema();
    for (const auto& request : spec) {
        auto kind = metadata.declared_type(request.column);
        if (!kind) {
            return std::unexpected(kind.error());
        }
        for (const auto& function : request.functions) {
            auto func = *parse_agg_function(function);
            auto result = ir::agg_result_kind(func, *kind);
            if (!result) {
                return std::unexpected(result.error());
            }
            std::string id = multi ? agg_output_id(request.column, function) : request.column;
            aggs.push_back(ops::make_agg(func, agg_input(request.column, *kind), id));
            schema.push_back(Field{.name = id, .kind = *result});
            data.push_back(std::move(id));
            labels.push_back(ColumnLabel{request.column, function});
        }
    }

    std::optional<std::vector<ColumnLabel>> column_labels;
    if (multi) {
        column_labels = std::move(labels);
    }
    auto out_metadata = FrameMetadata::make(keys_.index_columns(), data,
                                            std::move(column_labels), std::move(schema));
    if (!out_metadata) {
        return std::unexpected(out_metadata.error());
    }
    ir::Builder builder;
    auto plan = builder.aggregate(keys_.source(), keys_.fields(), std::move(aggs));
    spdlog::debug("groupby aggregate: {} keys, {} outputs", keys_.size(), data.size());
    return parent_.derive(std::move(plan), std::move(*out_metadata));
}

// ─── Cumulative ───────────────────────────────────────────────────────────────

auto GroupBy::cummax() const -> std::expected<Frame, Error> {
    return cumulative(GroupByOp::CumMax);
}
auto GroupBy::cummin() const -> std::expected<Frame, Error> {
    return cumulative(GroupByOp::CumMin);
}
auto GroupBy::cumsum() const -> std::expected<Frame, Error> {
    return cumulative(GroupByOp::CumSum);
}
auto GroupBy::cumprod() const -> std::expected<Frame, Error> {
    return cumulative(GroupByOp::CumProd);
}

auto GroupBy::cumulative(GroupByOp op) const -> std::expected<Frame, Error> {
    const auto& metadata = parent_.metadata();
    if (metadata.index_columns().empty()) {
        return config_error(fmt::format("{} needs a frame with an index", to_string(op)));
    }
    const bool numeric = op == GroupByOp::CumSum || op == GroupByOp::CumProd;
    ir::CumFunc func = ir::CumFunc::Sum;
    if (op == GroupByOp::CumMax) {
        func = ir::CumFunc::Max;
    } else if (op == GroupByOp::CumMin) {
        func = ir::CumFunc::Min;
    }

    auto columns = agg_columns();
    std::vector<ir::CumSpec> fields;
    std::vector<ir::FieldSpec> finish;
    Schema kinds;
    for (const auto& column : columns) {
        auto kind = metadata.declared_type(column);
        if (!kind) {
            return std::unexpected(kind.error());
        }
        if (numeric && !is_numeric(*kind)) {
            return config_error(fmt::format("{} needs numeric columns, {} is {}", to_string(op),
                                            column, to_string(*kind)));
        }
        ir::Expr arg = agg_input(column, *kind);
        ScalarKind result = *kind;
        if (op == GroupByOp::CumProd) {
            // exp(sum(log(x))); non-positive values fail the job.
            arg = ops::fn_call(ir::Builtin::Log,
                               {ops::fn_call(ir::Builtin::CheckPositive, {std::move(arg)})});
            finish.push_back(
                ops::make_field(column, ops::fn_call(ir::Builtin::Exp, {ops::col_ref(column)})));
            result = ScalarKind::Double;
        }
        fields.push_back(ir::CumSpec{.func = func, .arg = std::move(arg), .alias = column});
        kinds.push_back(Field{.name = column, .kind = result});
    }

    auto out_metadata = retyped(metadata, columns, std::move(kinds));
    if (!out_metadata) {
        return std::unexpected(out_metadata.error());
    }

    ir::Builder builder;
    auto plan = builder.window(keys_.source(), keys_.exprs(), std::move(fields));
    if (!finish.empty()) {
        plan = builder.update(std::move(plan), std::move(finish));
    }
    plan = builder.project(std::move(plan), column_refs(out_metadata->output_columns()));
    spdlog::debug("groupby {}: {} keys, {} columns", to_string(op), keys_.size(), columns.size());

    std::optional<std::string> series;
    if (series_ && columns.size() == 1) {
        series = columns.front();
    }
    return parent_.derive(std::move(plan), std::move(*out_metadata), std::move(series));
}

// ─── Grouped map ──────────────────────────────────────────────────────────────

auto GroupBy::apply(ApplyFn func, const std::optional<Schema>& schema) const
    -> std::expected<Frame, Error> {
    if (!func) {
        return not_callable("apply");
    }
    if (!schema.has_value() || schema->empty()) {
        return config_error("apply needs a declared return schema");
    }
    std::vector<std::string> names;
    for (const auto& field : *schema) {
        names.push_back(field.name);
    }
    auto out_metadata = FrameMetadata::make({}, names, std::nullopt, *schema);
    if (!out_metadata) {
        return std::unexpected(out_metadata.error());
    }
    auto local_metadata = parent_.metadata().with_data_columns(local_columns());
    if (!local_metadata) {
        return std::unexpected(local_metadata.error());
    }

    ir::GroupMapFn wrapped = [func = std::move(func), local = std::move(*local_metadata),
                              declared = *schema](const runtime::Table& group)
        -> std::expected<runtime::Table, std::string> {
        auto frame = to_local_frame(group, local);
        if (!frame) {
            return std::unexpected(frame.error().message);
        }
        auto result = func(*frame);
        if (!result) {
            return result;
        }
        if (result->columns.size() != declared.size()) {
            return std::unexpected(fmt::format("apply returned {} columns, the schema declares {}",
                                               result->columns.size(), declared.size()));
        }
        runtime::Table renamed;
        for (std::size_t i = 0; i < declared.size(); ++i) {
            runtime::ColumnEntry entry = result->columns[i];
            entry.name = declared[i].name;
            renamed.add_entry(std::move(entry));
        }
        return renamed;
    };

    ir::Builder builder;
    auto plan = builder.group_map(keys_.source(), keys_.exprs(), std::move(wrapped), *schema);
    spdlog::debug("groupby apply: {} keys, {} output columns", keys_.size(), schema->size());
    return parent_.derive(std::move(plan), std::move(*out_metadata));
}

auto GroupBy::transform(TransformFn func, std::optional<ScalarKind> return_kind) const
    -> std::expected<Frame, Error> {
    if (!func) {
        return not_callable("transform");
    }
    if (!return_kind.has_value()) {
        return config_error("transform needs a declared return type");
    }
    const auto& metadata = parent_.metadata();
    std::vector<std::string> columns;
    for (const auto& column : agg_columns()) {
        if (!keys_.contains(column)) {
            columns.push_back(column);
        }
    }
    Schema kinds;
    for (const auto& column : columns) {
        kinds.push_back(Field{.name = column, .kind = *return_kind});
    }
    auto out_metadata = retyped(metadata, columns, kinds);
    if (!out_metadata) {
        return std::unexpected(out_metadata.error());
    }

    ir::GroupMapFn wrapped = [func = std::move(func), index = metadata.index_ids(),
                              columns](const runtime::Table& group)
        -> std::expected<runtime::Table, std::string> {
        const std::size_t rows = group.rows();
        runtime::Table out;
        for (const auto& id : index) {
            const auto* entry = group.find_entry(id);
            if (entry == nullptr) {
                return std::unexpected(fmt::format("group lacks index column {}", id));
            }
            out.add_entry(*entry);
        }
        for (const auto& column : columns) {
            const auto* entry = group.find_entry(column);
            if (entry == nullptr) {
                return std::unexpected(fmt::format("group lacks column {}", column));
            }
            auto result = func(*entry);
            if (!result) {
                return std::unexpected(result.error());
            }
            const bool same_length =
                result->column && runtime::column_size(*result->column) == rows &&
                (!result->validity.has_value() || result->validity->size() == rows);
            if (!same_length) {
                return std::unexpected(fmt::format(
                    "transform must return a column of the same length ({} rows) for {}", rows,
                    column));
            }
            result->name = column;
            out.add_entry(std::move(*result));
        }
        return out;
    };

    ir::Builder builder;
    auto plan = builder.group_map(keys_.source(), keys_.exprs(), std::move(wrapped),
                                  out_metadata->schema(), ir::GroupMapRows::Aligned);
    spdlog::debug("groupby transform: {} keys, {} columns", keys_.size(), columns.size());

    std::optional<std::string> series;
    if (series_ && columns.size() == 1) {
        series = columns.front();
    }
    return parent_.derive(std::move(plan), std::move(*out_metadata), std::move(series));
}

auto GroupBy::filter(FilterFn func) const -> std::expected<Frame, Error> {
    if (!func) {
        return not_callable("filter");
    }
    const auto& metadata = parent_.metadata();
    auto local_metadata = metadata.with_data_columns(local_columns());
    if (!local_metadata) {
        return std::unexpected(local_metadata.error());
    }

    ir::GroupMapFn wrapped = [func = std::move(func), local = std::move(*local_metadata),
                              output = metadata.output_columns()](const runtime::Table& group)
        -> std::expected<runtime::Table, std::string> {
        auto frame = to_local_frame(group, local);
        if (!frame) {
            return std::unexpected(frame.error().message);
        }
        auto keep = func(*frame);
        if (!keep) {
            return std::unexpected(keep.error());
        }
        runtime::Table rows;
        for (const auto& column : output) {
            const auto* entry = group.find_entry(column);
            if (entry == nullptr) {
                return std::unexpected(fmt::format("group lacks column {}", column));
            }
            rows.add_entry(*entry);
        }
        return *keep ? rows : empty_like(rows);
    };

    // Kept rows come back in the parent's row order.
    ir::Builder builder;
    auto plan = builder.group_map(keys_.source(), keys_.exprs(), std::move(wrapped),
                                  metadata.schema(), ir::GroupMapRows::Subset);
    spdlog::debug("groupby filter: {} keys", keys_.size());
    if (!series_) {
        return parent_.derive(std::move(plan), metadata, parent_.series_name());
    }
    auto columns = agg_columns();
    auto narrowed = metadata.with_data_columns(columns);
    if (!narrowed) {
        return std::unexpected(narrowed.error());
    }
    plan = builder.project(std::move(plan), column_refs(narrowed->output_columns()));
    return parent_.derive(std::move(plan), std::move(*narrowed), columns.front());
}

// ─── Dispatch ─────────────────────────────────────────────────────────────────

auto GroupBy::call(std::string_view name) const -> std::expected<Frame, Error> {
    if (auto op = parse_group_by_op(name); op.has_value()) {
        switch (*op) {
            case GroupByOp::Size:
                return size();
            case GroupByOp::CumMax:
            case GroupByOp::CumMin:
            case GroupByOp::CumSum:
            case GroupByOp::CumProd:
                return cumulative(*op);
            default:
                return reduce(*op);
        }
    }
    std::string_view class_name = series_ ? "pd.SeriesGroupBy" : "pd.DataFrameGroupBy";
    if (const auto* api = lookup_unsupported(class_name, name); api != nullptr) {
        return std::unexpected(unsupported_error(*api));
    }
    return std::unexpected(
        Error{.kind = ErrorKind::SchemaResolution,
              .message = fmt::format("'{}' object has no attribute '{}'",
                                     series_ ? "SeriesGroupBy" : "DataFrameGroupBy", name)});
}

}  // namespace kodiak
