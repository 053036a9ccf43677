#pragma once

#include <kodiak/core/error.hpp>
#include <kodiak/frame/frame.hpp>
#include <kodiak/ir/node.hpp>

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace kodiak {

// ─── Selectors ────────────────────────────────────────────────────────────────
//  Label-based selection keys, the `.loc[rows, columns]` grammar.

/// Every row, or every data column.
struct All {};

/// A bare scalar row label.
struct Label {
    ir::LiteralValue value;
};

/// Inclusive label range; absent bounds are open.
struct LabelRange {
    std::optional<ir::LiteralValue> start;
    std::optional<ir::LiteralValue> stop;
    std::optional<std::int64_t> step;

    [[nodiscard]] auto unbounded() const noexcept -> bool {
        return !start.has_value() && !stop.has_value() && !step.has_value();
    }
};

/// Explicit list of row labels.
struct LabelList {
    std::vector<ir::LiteralValue> labels;
};

/// Boolean expression evaluated against the frame's columns.
struct Predicate {
    ir::FilterExprPtr expr;
};

using RowSelector = std::variant<All, Label, LabelRange, LabelList, Predicate>;
using ColumnSelector = std::variant<All, ir::ColumnRef, std::vector<ir::ColumnRef>, LabelRange>;

/// Value assigned by `locate_assign`: an expression over the frame's columns,
/// or a Series-like frame with the frame's rows, whose values are taken by
/// position.
using AssignValue = std::variant<ir::Expr, Frame>;

/// `frame.loc[rows, columns]`.
///
/// Rows become a filter on the single index column (or the predicate itself);
/// columns become a projection that keeps the index columns in front. A single
/// column reference yields a Series-like frame.
[[nodiscard]] auto locate(const Frame& frame, const RowSelector& rows,
                          const ColumnSelector& columns = All{}) -> std::expected<Frame, Error>;

/// `frame.loc[:, column] = value`. Replaces or appends exactly one data column.
///
/// A frame value must hold one data column and share `frame`'s rows (see
/// `Frame::aligned_with`); anything else fails with TypeMismatch.
[[nodiscard]] auto locate_assign(const Frame& frame, const RowSelector& rows,
                                 const ColumnSelector& column, const AssignValue& value)
    -> std::expected<Frame, Error>;

/// `frame.name`: a data column as a Series-like frame.
///
/// Fails with NotImplemented for a registered but unimplemented `pd.DataFrame`
/// name, and SchemaResolution for anything else.
[[nodiscard]] auto attribute(const Frame& frame, std::string_view name)
    -> std::expected<Frame, Error>;

/// Cast a label to `kind`, as a SQL CAST would; nullopt when it does not convert.
[[nodiscard]] auto cast_label(const ir::LiteralValue& label, ScalarKind kind)
    -> std::optional<ir::LiteralValue>;

}  // namespace kodiak
