#include <kodiak/frame/frame.hpp>
#include <kodiak/ir/builder.hpp>
#include <kodiak/ir/types.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <numeric>

namespace kodiak {

auto to_local_frame(const runtime::Table& table, const FrameMetadata& metadata)
    -> std::expected<LocalFrame, Error> {
    auto missing = [](const std::string& column) {
        return std::unexpected(
            Error{.kind = ErrorKind::SchemaResolution,
                  .message = fmt::format("plan output lacks column {}", column)});
    };
    LocalFrame local;
    for (const auto& index : metadata.index_columns()) {
        const auto* entry = table.find_entry(index.column);
        if (entry == nullptr) {
            return missing(index.column);
        }
        runtime::ColumnEntry renamed = *entry;
        renamed.name = index.name.value_or(index.column);
        local.index.add_entry(std::move(renamed));
    }
    for (const auto& column : metadata.data_columns()) {
        const auto* entry = table.find_entry(column);
        if (entry == nullptr) {
            return missing(column);
        }
        local.data.add_entry(*entry);
    }
    return local;
}

auto display_table(const LocalFrame& local) -> runtime::Table {
    runtime::Table table;
    for (const auto& entry : local.index.columns) {
        table.add_entry(entry);
    }
    for (const auto& entry : local.data.columns) {
        table.add_entry(entry);
    }
    return table;
}

Frame::Frame(ir::NodePtr plan, FrameMetadata metadata,
             std::shared_ptr<const runtime::TableRegistry> sources,
             std::optional<std::string> series_name)
    : plan_(std::move(plan)),
      metadata_(std::move(metadata)),
      sources_(std::move(sources)),
      series_name_(std::move(series_name)) {}

auto Frame::from_table(std::string name, runtime::Table table,
                       const std::vector<std::string>& index_columns)
    -> std::expected<Frame, Error> {
    for (const auto& column : index_columns) {
        if (table.find_entry(column) == nullptr) {
            return std::unexpected(Error{
                .kind = ErrorKind::SchemaResolution,
                .message = fmt::format("index column not found: {} (available: {})", column,
                                       ir::format_columns(table.schema()))});
        }
    }

    std::vector<IndexColumn> index;
    if (index_columns.empty()) {
        if (table.find_entry(kDefaultIndexColumn) != nullptr) {
            return std::unexpected(
                Error{.kind = ErrorKind::Configuration,
                      .message = fmt::format("column name {} is reserved", kDefaultIndexColumn)});
        }
        std::vector<std::int64_t> sequence(table.rows());
        std::iota(sequence.begin(), sequence.end(), std::int64_t{0});
        table.add_column(kDefaultIndexColumn, Column<std::int64_t>{std::move(sequence)});
        index.push_back(IndexColumn{.column = kDefaultIndexColumn, .name = std::nullopt});
    } else {
        for (const auto& column : index_columns) {
            index.push_back(IndexColumn{.column = column, .name = column});
        }
    }

    std::vector<std::string> data;
    for (const auto& entry : table.columns) {
        bool is_index = std::any_of(index.begin(), index.end(), [&](const IndexColumn& i) {
            return i.column == entry.name;
        });
        if (!is_index) {
            data.push_back(entry.name);
        }
    }

    auto metadata = FrameMetadata::make(std::move(index), std::move(data), std::nullopt,
                                        table.schema());
    if (!metadata) {
        return std::unexpected(metadata.error());
    }

    std::vector<ir::ColumnRef> output;
    for (const auto& column : metadata->output_columns()) {
        output.push_back(ir::ColumnRef{.name = column});
    }
    ir::Builder builder;
    auto plan = builder.project(builder.scan(name), std::move(output));

    auto sources = std::make_shared<runtime::TableRegistry>();
    sources->emplace(std::move(name), std::move(table));
    return Frame(std::move(plan), std::move(*metadata), std::move(sources));
}

auto Frame::aligned_with(const Frame& other) const noexcept -> bool {
    return &ir::row_anchor(*plan_) == &ir::row_anchor(*other.plan_);
}

auto Frame::derive(ir::NodePtr plan, FrameMetadata metadata,
                   std::optional<std::string> series_name) const -> Frame {
    return Frame(std::move(plan), std::move(metadata), sources_, std::move(series_name));
}

auto Frame::collect(const runtime::ExecOptions& options) const
    -> std::expected<runtime::Table, Error> {
    spdlog::debug("collect plan node {} ({} index, {} data columns)", plan_->id(),
                  metadata_.index_columns().size(), metadata_.data_columns().size());
    return runtime::interpret(*plan_, *sources_, options);
}

auto Frame::to_local(const runtime::ExecOptions& options) const
    -> std::expected<LocalFrame, Error> {
    auto table = collect(options);
    if (!table) {
        return std::unexpected(table.error());
    }
    return to_local_frame(*table, metadata_);
}

}  // namespace kodiak
