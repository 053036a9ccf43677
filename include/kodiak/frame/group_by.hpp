#pragma once

#include <kodiak/core/error.hpp>
#include <kodiak/frame/frame.hpp>
#include <kodiak/frame/group_key.hpp>
#include <kodiak/runtime/table.hpp>

#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kodiak {

/// Group-by operations callable by name.
enum class GroupByOp : std::uint8_t {
    Count,
    First,
    Last,
    Max,
    Mean,
    Min,
    Std,
    Sum,
    Var,
    All,
    Any,
    Size,
    CumMax,
    CumMin,
    CumSum,
    CumProd,
};

[[nodiscard]] auto parse_group_by_op(std::string_view name) noexcept -> std::optional<GroupByOp>;
[[nodiscard]] auto to_string(GroupByOp op) noexcept -> std::string_view;

/// Per-group function for `apply`: one group's rows in, a table out.
using ApplyFn = std::function<std::expected<runtime::Table, std::string>(const LocalFrame&)>;
/// Per-column function for `transform`: must return a column of the same length.
using TransformFn =
    std::function<std::expected<runtime::ColumnEntry, std::string>(const runtime::ColumnEntry&)>;
/// Per-group verdict for `filter`: true keeps the group.
using FilterFn = std::function<std::expected<bool, std::string>(const LocalFrame&)>;

/// Grouped view of a frame.
///
/// Terminal operations build a new Frame and leave the GroupBy untouched, so
/// one GroupBy can serve several operations. Unless narrowed, the aggregated
/// columns are the parent's data columns that are not keys.
class GroupBy {
   public:
    [[nodiscard]] auto parent() const noexcept -> const Frame& { return parent_; }
    [[nodiscard]] auto keys() const noexcept -> const GroupKey& { return keys_; }
    [[nodiscard]] auto is_series() const noexcept -> bool { return series_; }
    [[nodiscard]] auto is_explicit() const noexcept -> bool { return columns_.has_value(); }

    /// Columns the terminal operations aggregate.
    [[nodiscard]] auto agg_columns() const -> std::vector<std::string>;

    /// `groupby[column]`: a series GroupBy over one column.
    [[nodiscard]] auto narrow(const std::string& column) const -> std::expected<GroupBy, Error>;
    /// `groupby[[columns...]]`: a frame GroupBy over exactly these columns.
    [[nodiscard]] auto narrow(const std::vector<std::string>& columns) const
        -> std::expected<GroupBy, Error>;

    // ─── Reductions ──────────────────────────────────────────────────────────
    //  One row per key, sorted by key; the keys become the index.

    [[nodiscard]] auto count() const -> std::expected<Frame, Error>;
    [[nodiscard]] auto first() const -> std::expected<Frame, Error>;
    [[nodiscard]] auto last() const -> std::expected<Frame, Error>;
    [[nodiscard]] auto max() const -> std::expected<Frame, Error>;
    [[nodiscard]] auto mean() const -> std::expected<Frame, Error>;
    [[nodiscard]] auto min() const -> std::expected<Frame, Error>;
    /// Sample standard deviation (pandas `std`).
    [[nodiscard]] auto stddev() const -> std::expected<Frame, Error>;
    [[nodiscard]] auto sum() const -> std::expected<Frame, Error>;
    [[nodiscard]] auto var() const -> std::expected<Frame, Error>;
    [[nodiscard]] auto all() const -> std::expected<Frame, Error>;
    [[nodiscard]] auto any() const -> std::expected<Frame, Error>;

    /// Rows per group, as a Series-like frame sorted by key.
    [[nodiscard]] auto size() const -> std::expected<Frame, Error>;

    /// Named aggregation. Groups come out in first-appearance order.
    [[nodiscard]] auto aggregate(const AggregationSpec& spec) const
        -> std::expected<Frame, Error>;

    // ─── Cumulative ──────────────────────────────────────────────────────────
    //  Running values per group in the current row order; the index is kept.

    [[nodiscard]] auto cummax() const -> std::expected<Frame, Error>;
    [[nodiscard]] auto cummin() const -> std::expected<Frame, Error>;
    [[nodiscard]] auto cumsum() const -> std::expected<Frame, Error>;
    /// Fails at collect time when a group holds a value <= 0.
    [[nodiscard]] auto cumprod() const -> std::expected<Frame, Error>;

    // ─── Grouped map ─────────────────────────────────────────────────────────

    /// Run `func` once per group; its output columns are renamed positionally
    /// to `schema`. The result has no index.
    [[nodiscard]] auto apply(ApplyFn func, const std::optional<Schema>& schema) const
        -> std::expected<Frame, Error>;

    /// Run `func` on every aggregated column of every group. The result keeps
    /// the parent's rows, index and row order and declares each column as
    /// `return_kind`.
    [[nodiscard]] auto transform(TransformFn func, std::optional<ScalarKind> return_kind) const
        -> std::expected<Frame, Error>;

    /// Keep the rows of the groups for which `func` returns true, in the
    /// parent's row order.
    [[nodiscard]] auto filter(FilterFn func) const -> std::expected<Frame, Error>;

    /// Dispatch a reduction, `size` or cumulative op by its pandas name.
    [[nodiscard]] auto call(std::string_view name) const -> std::expected<Frame, Error>;

   private:
    friend auto group_by(const Frame& frame, const std::vector<GroupKeyInput>& keys)
        -> std::expected<GroupBy, Error>;

    GroupBy(Frame parent, GroupKey keys, std::optional<std::vector<std::string>> columns,
            bool series);

    [[nodiscard]] auto reduce(GroupByOp op) const -> std::expected<Frame, Error>;
    [[nodiscard]] auto cumulative(GroupByOp op) const -> std::expected<Frame, Error>;
    /// Data columns handed to apply/filter functions.
    [[nodiscard]] auto local_columns() const -> std::vector<std::string>;

    Frame parent_;
    GroupKey keys_;
    std::optional<std::vector<std::string>> columns_;
    bool series_ = false;
};

/// `frame.groupby(keys)`. Each key is a data or index column of `frame`, an
/// expression over its columns, or a single-column frame with the same rows
/// (`df.B.groupby(df.A)`).
[[nodiscard]] auto group_by(const Frame& frame, const std::vector<GroupKeyInput>& keys)
    -> std::expected<GroupBy, Error>;

}  // namespace kodiak
