#include <kodiak/frame/metadata.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <unordered_set>

namespace kodiak {

namespace {

auto config_error(std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = ErrorKind::Configuration, .message = std::move(message)});
}

}  // namespace

auto FrameMetadata::make(std::vector<IndexColumn> index_columns,
                         std::vector<std::string> data_columns,
                         std::optional<std::vector<ColumnLabel>> column_labels, Schema schema)
    -> std::expected<FrameMetadata, Error> {
    std::unordered_set<std::string> seen;
    auto check_unique = [&](const std::string& column) -> bool {
        return seen.insert(column).second;
    };
    for (const auto& index : index_columns) {
        if (!check_unique(index.column)) {
            return config_error(fmt::format("duplicate column id: {}", index.column));
        }
    }
    for (const auto& column : data_columns) {
        if (!check_unique(column)) {
            return config_error(fmt::format("duplicate column id: {}", column));
        }
    }

    if (column_labels.has_value()) {
        if (column_labels->size() != data_columns.size()) {
            return config_error(fmt::format("{} column labels for {} data columns",
                                            column_labels->size(), data_columns.size()));
        }
        if (!column_labels->empty()) {
            const std::size_t levels = column_labels->front().size();
            if (levels == 0) {
                return config_error("column labels need at least one level");
            }
            for (const auto& label : *column_labels) {
                if (label.size() != levels) {
                    return config_error(
                        fmt::format("column labels mix {} and {} levels", levels, label.size()));
                }
            }
        }
    }

    // Keep the declared kinds in output order.
    Schema ordered;
    ordered.reserve(index_columns.size() + data_columns.size());
    auto declare = [&](const std::string& column) -> bool {
        auto pos = field_index(schema, column);
        if (pos == schema.size()) {
            return false;
        }
        ordered.push_back(schema[pos]);
        return true;
    };
    for (const auto& index : index_columns) {
        if (!declare(index.column)) {
            return config_error(fmt::format("index column {} has no declared type", index.column));
        }
    }
    for (const auto& column : data_columns) {
        if (!declare(column)) {
            return config_error(fmt::format("data column {} has no declared type", column));
        }
    }

    FrameMetadata out;
    out.index_columns_ = std::move(index_columns);
    out.data_columns_ = std::move(data_columns);
    out.column_labels_ = std::move(column_labels);
    out.schema_ = std::move(ordered);
    return out;
}

auto FrameMetadata::index_names() const -> std::vector<std::optional<std::string>> {
    std::vector<std::optional<std::string>> names;
    names.reserve(index_columns_.size());
    for (const auto& index : index_columns_) {
        names.push_back(index.name);
    }
    return names;
}

auto FrameMetadata::index_ids() const -> std::vector<std::string> {
    std::vector<std::string> ids;
    ids.reserve(index_columns_.size());
    for (const auto& index : index_columns_) {
        ids.push_back(index.column);
    }
    return ids;
}

auto FrameMetadata::output_columns() const -> std::vector<std::string> {
    auto columns = index_ids();
    columns.insert(columns.end(), data_columns_.begin(), data_columns_.end());
    return columns;
}

auto FrameMetadata::declared_type(std::string_view column) const
    -> std::expected<ScalarKind, Error> {
    auto pos = field_index(schema_, column);
    if (pos == schema_.size()) {
        return std::unexpected(
            Error{.kind = ErrorKind::SchemaResolution,
                  .message = fmt::format("no declared type for column {}", column)});
    }
    return schema_[pos].kind;
}

auto FrameMetadata::is_index_column(std::string_view column) const noexcept -> bool {
    return std::any_of(index_columns_.begin(), index_columns_.end(),
                       [&](const IndexColumn& index) { return index.column == column; });
}

auto FrameMetadata::is_data_column(std::string_view column) const noexcept -> bool {
    return std::find(data_columns_.begin(), data_columns_.end(), column) != data_columns_.end();
}

auto FrameMetadata::label_levels() const noexcept -> std::size_t {
    if (!column_labels_.has_value() || column_labels_->empty()) {
        return 1;
    }
    return column_labels_->front().size();
}

auto FrameMetadata::label_of(std::string_view column) const -> ColumnLabel {
    if (column_labels_.has_value()) {
        for (std::size_t i = 0; i < data_columns_.size(); ++i) {
            if (data_columns_[i] == column) {
                return (*column_labels_)[i];
            }
        }
    }
    return ColumnLabel{std::string(column)};
}

auto FrameMetadata::copy(MetadataOverrides overrides) const
    -> std::expected<FrameMetadata, Error> {
    // Kinds of the current columns stay available to the replacement lists.
    Schema schema = schema_;
    if (overrides.schema.has_value()) {
        for (auto& field : *overrides.schema) {
            auto pos = field_index(schema, field.name);
            if (pos == schema.size()) {
                schema.push_back(std::move(field));
            } else {
                schema[pos].kind = field.kind;
            }
        }
    }
    return make(overrides.index_columns.value_or(index_columns_),
                overrides.data_columns.value_or(data_columns_),
                overrides.column_labels.value_or(column_labels_), std::move(schema));
}

auto FrameMetadata::with_data_columns(const std::vector<std::string>& columns) const
    -> std::expected<FrameMetadata, Error> {
    std::optional<std::vector<ColumnLabel>> labels;
    if (column_labels_.has_value()) {
        labels.emplace();
        labels->reserve(columns.size());
    }
    for (const auto& column : columns) {
        if (!is_data_column(column)) {
            return std::unexpected(
                Error{.kind = ErrorKind::SchemaResolution,
                      .message = fmt::format("{} is not a data column", column)});
        }
        if (labels.has_value()) {
            labels->push_back(label_of(column));
        }
    }
    return copy(MetadataOverrides{.index_columns = std::nullopt,
                                  .data_columns = columns,
                                  .column_labels = std::move(labels),
                                  .schema = std::nullopt});
}

}  // namespace kodiak
