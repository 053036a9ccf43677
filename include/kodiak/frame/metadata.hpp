#pragma once

#include <kodiak/core/error.hpp>
#include <kodiak/core/schema.hpp>

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kodiak {

/// A physical column carrying row-label identity, with an optional display name.
struct IndexColumn {
    std::string column;
    std::optional<std::string> name;

    auto operator==(const IndexColumn&) const -> bool = default;
};

/// Hierarchical column label: one string per level.
using ColumnLabel = std::vector<std::string>;

/// Fields to replace in FrameMetadata::copy. Unset fields are kept.
struct MetadataOverrides {
    std::optional<std::vector<IndexColumn>> index_columns;
    std::optional<std::vector<std::string>> data_columns;
    /// Set to `std::optional<...>{}` to drop the labels.
    std::optional<std::optional<std::vector<ColumnLabel>>> column_labels;
    std::optional<Schema> schema;
};

/// Describes how a plan's output columns map onto a label-indexed frame.
///
/// The paired plan outputs the index columns followed by the data columns,
/// in the order recorded here. Instances are immutable and always valid:
/// the only way to change one is `copy`, which re-checks the invariants.
class FrameMetadata {
   public:
    /// Validated construction.
    ///
    /// Fails with a Configuration error when physical ids repeat, when labels
    /// do not align with the data columns or disagree on their level count, or
    /// when an index or data column has no declared kind in `schema`.
    [[nodiscard]] static auto make(std::vector<IndexColumn> index_columns,
                                   std::vector<std::string> data_columns,
                                   std::optional<std::vector<ColumnLabel>> column_labels,
                                   Schema schema) -> std::expected<FrameMetadata, Error>;

    [[nodiscard]] auto index_columns() const noexcept -> const std::vector<IndexColumn>& {
        return index_columns_;
    }
    [[nodiscard]] auto data_columns() const noexcept -> const std::vector<std::string>& {
        return data_columns_;
    }
    [[nodiscard]] auto column_labels() const noexcept
        -> const std::optional<std::vector<ColumnLabel>>& {
        return column_labels_;
    }
    /// Declared kinds in plan output order: index columns, then data columns.
    [[nodiscard]] auto schema() const noexcept -> const Schema& { return schema_; }

    [[nodiscard]] auto index_names() const -> std::vector<std::optional<std::string>>;
    /// Physical ids of the index columns.
    [[nodiscard]] auto index_ids() const -> std::vector<std::string>;
    /// Physical ids of every output column: index ids then data columns.
    [[nodiscard]] auto output_columns() const -> std::vector<std::string>;

    [[nodiscard]] auto declared_type(std::string_view column) const
        -> std::expected<ScalarKind, Error>;

    [[nodiscard]] auto is_index_column(std::string_view column) const noexcept -> bool;
    [[nodiscard]] auto is_data_column(std::string_view column) const noexcept -> bool;

    /// Number of label levels; 1 when the frame has no hierarchical labels.
    [[nodiscard]] auto label_levels() const noexcept -> std::size_t;
    /// Label of a data column; its physical id when labels are absent.
    [[nodiscard]] auto label_of(std::string_view column) const -> ColumnLabel;

    [[nodiscard]] auto copy(MetadataOverrides overrides) const
        -> std::expected<FrameMetadata, Error>;

    /// Metadata for a projection onto `columns` (existing data columns, new order).
    /// Labels of the kept columns follow them.
    [[nodiscard]] auto with_data_columns(const std::vector<std::string>& columns) const
        -> std::expected<FrameMetadata, Error>;

    auto operator==(const FrameMetadata&) const -> bool = default;

   private:
    FrameMetadata() = default;

    std::vector<IndexColumn> index_columns_;
    std::vector<std::string> data_columns_;
    std::optional<std::vector<ColumnLabel>> column_labels_;
    Schema schema_;
};

}  // namespace kodiak
