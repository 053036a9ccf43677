#include <kodiak/frame/locator.hpp>
#include <kodiak/frame/unsupported.hpp>
#include <kodiak/ir/builder.hpp>
#include <kodiak/ir/types.hpp>
#include <kodiak/runtime/ops.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>
#include <type_traits>

namespace kodiak {

namespace {

auto unsupported(std::string message) -> std::unexpected<Error> {
    return std::unexpected(
        Error{.kind = ErrorKind::UnsupportedSelection, .message = std::move(message)});
}

auto column_refs(const std::vector<std::string>& names) -> std::vector<ir::ColumnRef> {
    std::vector<ir::ColumnRef> refs;
    refs.reserve(names.size());
    for (const auto& name : names) {
        refs.push_back(ir::ColumnRef{.name = name});
    }
    return refs;
}

auto single_index_column(const FrameMetadata& metadata, std::string_view selector)
    -> std::expected<IndexColumn, Error> {
    if (metadata.index_columns().size() != 1) {
        return unsupported(fmt::format("cannot use {} to slice a frame with {} index columns",
                                       selector, metadata.index_columns().size()));
    }
    return metadata.index_columns().front();
}

/// Filter for the row side of a selection; nullptr keeps every row.
auto row_filter(const FrameMetadata& metadata, const RowSelector& rows)
    -> std::expected<ir::FilterExprPtr, Error> {
    return std::visit(
        [&](const auto& sel) -> std::expected<ir::FilterExprPtr, Error> {
            using T = std::decay_t<decltype(sel)>;
            if constexpr (std::is_same_v<T, All>) {
                return nullptr;
            } else if constexpr (std::is_same_v<T, Label>) {
                return unsupported(
                    "cannot select rows by a single label; use a label list or a label range");
            } else if constexpr (std::is_same_v<T, LabelRange>) {
                if (sel.step.has_value()) {
                    return unsupported("cannot use a step with a label range");
                }
                if (sel.unbounded()) {
                    return nullptr;
                }
                auto index = single_index_column(metadata, "a label range");
                if (!index) {
                    return std::unexpected(index.error());
                }
                auto kind = metadata.declared_type(index->column);
                if (!kind) {
                    return std::unexpected(kind.error());
                }
                ir::FilterExprPtr pred;
                auto add_bound = [&](const ir::LiteralValue& bound, ir::CompareOp op) -> bool {
                    auto cast = cast_label(bound, *kind);
                    if (!cast.has_value()) {
                        return false;
                    }
                    auto cmp = ops::filter_cmp(op, ops::filter_col(index->column),
                                               ops::filter_lit(std::move(*cast)));
                    pred = pred ? ops::filter_and(std::move(pred), std::move(cmp))
                                : std::move(cmp);
                    return true;
                };
                // A bound that does not cast compares against null and matches nothing.
                if (sel.start.has_value() && !add_bound(*sel.start, ir::CompareOp::Ge)) {
                    return ops::filter_bool(false);
                }
                if (sel.stop.has_value() && !add_bound(*sel.stop, ir::CompareOp::Le)) {
                    return ops::filter_bool(false);
                }
                return pred;
            } else if constexpr (std::is_same_v<T, LabelList>) {
                auto index = single_index_column(metadata, "a label list");
                if (!index) {
                    return std::unexpected(index.error());
                }
                auto kind = metadata.declared_type(index->column);
                if (!kind) {
                    return std::unexpected(kind.error());
                }
                std::vector<ir::LiteralValue> labels;
                for (const auto& label : sel.labels) {
                    if (auto cast = cast_label(label, *kind); cast.has_value()) {
                        labels.push_back(std::move(*cast));
                    }
                }
                if (labels.empty()) {
                    return ops::filter_bool(false);
                }
                if (labels.size() == 1) {
                    return ops::filter_cmp(ir::CompareOp::Eq, ops::filter_col(index->column),
                                           ops::filter_lit(std::move(labels.front())));
                }
                return ops::filter_in(ops::filter_col(index->column), std::move(labels));
            } else {
                if (!sel.expr) {
                    return std::unexpected(Error{.kind = ErrorKind::TypeMismatch,
                                                 .message = "row predicate is empty"});
                }
                return sel.expr;
            }
        },
        rows);
}

struct ColumnChoice {
    /// nullopt keeps every data column.
    std::optional<std::vector<std::string>> columns;
    std::optional<std::string> series_name;
};

auto select_columns(const Frame& frame, const ColumnSelector& columns)
    -> std::expected<ColumnChoice, Error> {
    const auto& metadata = frame.metadata();
    const bool keep_all =
        std::holds_alternative<All>(columns) ||
        (std::holds_alternative<LabelRange>(columns) && std::get<LabelRange>(columns).unbounded());
    if (keep_all) {
        return ColumnChoice{.columns = std::nullopt, .series_name = frame.series_name()};
    }
    if (frame.is_series()) {
        return std::unexpected(
            Error{.kind = ErrorKind::IndexingShape, .message = "too many indexers"});
    }
    if (std::holds_alternative<LabelRange>(columns)) {
        return unsupported("cannot select columns by a label range; select columns by name, "
                           "reference or all");
    }

    std::vector<std::string> names;
    if (const auto* single = std::get_if<ir::ColumnRef>(&columns)) {
        names.push_back(single->name);
    } else {
        for (const auto& ref : std::get<std::vector<ir::ColumnRef>>(columns)) {
            names.push_back(ref.name);
        }
    }
    std::vector<std::string> unknown;
    for (const auto& name : names) {
        if (!metadata.is_data_column(name)) {
            unknown.push_back(name);
        }
    }
    if (!unknown.empty()) {
        return std::unexpected(
            Error{.kind = ErrorKind::SchemaResolution,
                  .message = fmt::format("none of [{}] are in the columns (available: {})",
                                         fmt::join(unknown, ", "),
                                         fmt::join(metadata.data_columns(), ", "))});
    }
    std::optional<std::string> series;
    if (std::holds_alternative<ir::ColumnRef>(columns)) {
        series = names.front();
    }
    return ColumnChoice{.columns = std::move(names), .series_name = std::move(series)};
}

auto whole_rows(const RowSelector& rows) -> bool {
    if (std::holds_alternative<All>(rows)) {
        return true;
    }
    const auto* range = std::get_if<LabelRange>(&rows);
    return range != nullptr && range->unbounded();
}

}  // namespace

auto cast_label(const ir::LiteralValue& label, ScalarKind kind) -> std::optional<ir::LiteralValue> {
    return std::visit(
        [kind](const auto& v) -> std::optional<ir::LiteralValue> {
            using T = std::decay_t<decltype(v)>;
            switch (kind) {
                case ScalarKind::Int:
                    if constexpr (std::is_same_v<T, std::int64_t>) {
                        return v;
                    } else if constexpr (std::is_same_v<T, double>) {
                        constexpr auto lo = static_cast<double>(std::numeric_limits<std::int64_t>::min());
                        constexpr auto hi = static_cast<double>(std::numeric_limits<std::int64_t>::max());
                        if (!std::isfinite(v) || v < lo || v >= hi) {
                            return std::nullopt;
                        }
                        return static_cast<std::int64_t>(std::trunc(v));
                    } else if constexpr (std::is_same_v<T, std::string>) {
                        std::int64_t out = 0;
                        auto result = std::from_chars(v.data(), v.data() + v.size(), out);
                        if (result.ec != std::errc() || result.ptr != v.data() + v.size()) {
                            return std::nullopt;
                        }
                        return out;
                    } else {
                        return std::int64_t{v.value ? 1 : 0};
                    }
                case ScalarKind::Double:
                    if constexpr (std::is_same_v<T, std::int64_t>) {
                        return static_cast<double>(v);
                    } else if constexpr (std::is_same_v<T, double>) {
                        return v;
                    } else if constexpr (std::is_same_v<T, std::string>) {
                        if (v.empty()) {
                            return std::nullopt;
                        }
                        char* end = nullptr;
                        double out = std::strtod(v.c_str(), &end);
                        if (*end != '\0') {
                            return std::nullopt;
                        }
                        return out;
                    } else {
                        return v.value ? 1.0 : 0.0;
                    }
                case ScalarKind::String:
                    if constexpr (std::is_same_v<T, std::string>) {
                        return v;
                    } else if constexpr (std::is_same_v<T, Bool>) {
                        return std::string(v.value ? "true" : "false");
                    } else {
                        return fmt::format("{}", v);
                    }
                case ScalarKind::Bool:
                    if constexpr (std::is_same_v<T, Bool>) {
                        return v;
                    } else if constexpr (std::is_same_v<T, std::string>) {
                        if (v == "true" || v == "1") {
                            return Bool{true};
                        }
                        if (v == "false" || v == "0") {
                            return Bool{false};
                        }
                        return std::nullopt;
                    } else {
                        return Bool{v != 0};
                    }
            }
            return std::nullopt;
        },
        label);
}

auto locate(const Frame& frame, const RowSelector& rows, const ColumnSelector& columns)
    -> std::expected<Frame, Error> {
    auto choice = select_columns(frame, columns);
    if (!choice) {
        return std::unexpected(choice.error());
    }
    auto filter = row_filter(frame.metadata(), rows);
    if (!filter) {
        return std::unexpected(filter.error());
    }

    ir::Builder builder;
    ir::NodePtr plan = frame.plan();
    if (*filter) {
        plan = builder.filter(std::move(plan), std::move(*filter));
    }
    FrameMetadata metadata = frame.metadata();
    if (choice->columns.has_value()) {
        auto projected = metadata.with_data_columns(*choice->columns);
        if (!projected) {
            return std::unexpected(projected.error());
        }
        metadata = std::move(*projected);
        plan = builder.project(std::move(plan), column_refs(metadata.output_columns()));
    }
    spdlog::debug("loc: node {} -> node {} ({} data columns)", frame.plan()->id(), plan->id(),
                  metadata.data_columns().size());
    return frame.derive(std::move(plan), std::move(metadata), std::move(choice->series_name));
}

auto locate_assign(const Frame& frame, const RowSelector& rows, const ColumnSelector& column,
                   const AssignValue& value) -> std::expected<Frame, Error> {
    if (frame.is_series()) {
        return std::unexpected(
            Error{.kind = ErrorKind::IndexingShape, .message = "too many indexers"});
    }
    if (!whole_rows(rows)) {
        return unsupported(
            "only assignment to all rows is supported: frame.loc[:, column] = value");
    }
    const auto* target = std::get_if<ir::ColumnRef>(&column);
    if (target == nullptr) {
        return unsupported("assignment needs a single column name: frame.loc[:, column] = value");
    }
    const auto& metadata = frame.metadata();
    if (metadata.is_index_column(target->name)) {
        return unsupported(fmt::format("cannot assign to index column {}", target->name));
    }

    ir::Builder builder;
    ir::NodePtr plan;
    ScalarKind kind = ScalarKind::Int;
    if (const auto* other = std::get_if<Frame>(&value)) {
        const auto& data = other->metadata().data_columns();
        if (data.size() != 1) {
            return std::unexpected(Error{
                .kind = ErrorKind::TypeMismatch,
                .message = fmt::format("cannot assign a frame with {} data columns to column {}",
                                       data.size(), target->name)});
        }
        if (!frame.aligned_with(*other)) {
            return std::unexpected(Error{
                .kind = ErrorKind::TypeMismatch,
                .message = fmt::format("cannot assign column {} from a frame with different rows; "
                                       "assign a column derived from this frame",
                                       target->name)});
        }
        auto declared = other->metadata().declared_type(data.front());
        if (!declared) {
            return std::unexpected(declared.error());
        }
        kind = *declared;
        plan = builder.zip(frame.plan(), other->plan(), data.front(), target->name);
    } else {
        const auto& expr = std::get<ir::Expr>(value);
        auto inferred = ir::infer_kind(expr, metadata.schema());
        if (!inferred) {
            return std::unexpected(inferred.error());
        }
        kind = *inferred;
        plan = builder.update(frame.plan(),
                              {ir::FieldSpec{.alias = target->name, .expr = expr}});
    }

    MetadataOverrides overrides;
    overrides.schema = Schema{Field{.name = target->name, .kind = kind}};
    if (!metadata.is_data_column(target->name)) {
        auto data = metadata.data_columns();
        data.push_back(target->name);
        overrides.data_columns = std::move(data);
        if (metadata.column_labels().has_value()) {
            auto labels = *metadata.column_labels();
            ColumnLabel label(metadata.label_levels());
            label.front() = target->name;
            labels.push_back(std::move(label));
            overrides.column_labels = std::optional<std::vector<ColumnLabel>>(std::move(labels));
        }
    }
    auto updated = metadata.copy(std::move(overrides));
    if (!updated) {
        return std::unexpected(updated.error());
    }

    spdlog::debug("loc assign: column {} on node {}", target->name, frame.plan()->id());
    return frame.derive(std::move(plan), std::move(*updated));
}

auto attribute(const Frame& frame, std::string_view name) -> std::expected<Frame, Error> {
    const auto& data = frame.metadata().data_columns();
    if (!frame.is_series() && std::ranges::find(data, name) != data.end()) {
        return locate(frame, All{}, ir::ColumnRef{.name = std::string(name)});
    }
    if (!frame.is_series()) {
        if (const auto* api = lookup_unsupported("pd.DataFrame", name); api != nullptr) {
            return std::unexpected(unsupported_error(*api));
        }
    }
    return std::unexpected(
        Error{.kind = ErrorKind::SchemaResolution,
              .message = fmt::format("'{}' object has no attribute '{}'",
                                     frame.is_series() ? "Series" : "DataFrame", name)});
}

}  // namespace kodiak
