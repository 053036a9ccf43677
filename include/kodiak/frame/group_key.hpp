#pragma once

#include <kodiak/core/error.hpp>
#include <kodiak/frame/frame.hpp>
#include <kodiak/frame/metadata.hpp>
#include <kodiak/ir/node.hpp>

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace kodiak {

/// A grouping expression over the grouped frame's columns.
struct KeyExpr {
    ir::Expr expr;
    /// Index level name of the key in grouped output.
    std::optional<std::string> name;
};

/// What a group key reads: a column of the grouped frame, an expression over
/// its columns, or the data column of a frame with the same rows.
struct GroupKeyInput {
    GroupKeyInput(std::string column)
        : source(std::in_place_type<std::string>, std::move(column)) {}
    GroupKeyInput(const char* column) : source(std::in_place_type<std::string>, column) {}
    GroupKeyInput(KeyExpr expr) : source(std::in_place_type<KeyExpr>, std::move(expr)) {}
    GroupKeyInput(Frame frame) : source(std::in_place_type<Frame>, std::move(frame)) {}

    std::variant<std::string, KeyExpr, Frame> source;
};

/// One grouping expression bound to its synthesized alias.
struct GroupKeyEntry {
    /// Key expression over the GroupKey's source plan.
    ir::Expr expr;
    /// Column of the grouped frame the key reads, when it is a plain column.
    std::optional<std::string> source_column;
    /// `__index_level_{i}__`, the key's id in grouped output.
    std::string alias;
    /// Name the key shows as an index level of the result.
    std::optional<std::string> display_name;
    ScalarKind kind = ScalarKind::Int;
};

/// Ordered grouping keys of a GroupBy. Order is significant.
class GroupKey {
   public:
    /// Resolve `keys` against `frame`.
    ///
    /// Fails with Configuration on an empty list, SchemaResolution on an
    /// unknown column and TypeMismatch on a key frame that is not a single
    /// column with the same rows as `frame`.
    [[nodiscard]] static auto make(const Frame& frame, const std::vector<GroupKeyInput>& keys)
        -> std::expected<GroupKey, Error>;

    [[nodiscard]] auto entries() const noexcept -> const std::vector<GroupKeyEntry>& {
        return entries_;
    }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return entries_.size(); }

    /// Plan the key expressions read: the grouped frame's plan, plus the key
    /// columns taken from other frames.
    [[nodiscard]] auto source() const noexcept -> const ir::NodePtr& { return source_; }

    /// True when `column` is the source of one of the keys.
    [[nodiscard]] auto contains(std::string_view column) const noexcept -> bool;

    /// Key expressions over the source plan.
    [[nodiscard]] auto exprs() const -> std::vector<ir::Expr>;
    /// Key expressions bound to their aliases, for an Aggregate node.
    [[nodiscard]] auto fields() const -> std::vector<ir::FieldSpec>;
    /// The keys as the index of a grouped result.
    [[nodiscard]] auto index_columns() const -> std::vector<IndexColumn>;
    /// Alias fields of a grouped result.
    [[nodiscard]] auto schema() const -> Schema;
    /// Display names, for logging.
    [[nodiscard]] auto names() const -> std::vector<std::string>;

   private:
    GroupKey(std::vector<GroupKeyEntry> entries, ir::NodePtr source)
        : entries_(std::move(entries)), source_(std::move(source)) {}

    std::vector<GroupKeyEntry> entries_;
    ir::NodePtr source_;
};

/// Aggregate functions requested for one source column.
struct AggRequest {
    std::string column;
    std::vector<std::string> functions;
};

/// Ordered column -> functions mapping for GroupBy::aggregate.
using AggregationSpec = std::vector<AggRequest>;

/// Aggregate function for a pandas name (`count`, `sum`, ..., `nunique`).
[[nodiscard]] auto parse_agg_function(std::string_view name) noexcept
    -> std::optional<ir::AggFunc>;

/// Physical id of the (column, function) output of a multi-function spec.
[[nodiscard]] auto agg_output_id(std::string_view column, std::string_view function)
    -> std::string;

}  // namespace kodiak
