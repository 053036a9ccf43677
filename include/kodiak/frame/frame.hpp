#pragma once

#include <kodiak/core/error.hpp>
#include <kodiak/frame/metadata.hpp>
#include <kodiak/ir/node.hpp>
#include <kodiak/runtime/interpreter.hpp>
#include <kodiak/runtime/table.hpp>

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kodiak {

/// Physical id of the synthesized row-sequence index.
inline constexpr const char* kDefaultIndexColumn = "__index_level_0__";

/// A materialized frame: index columns (named by their display names) and
/// data columns, split into two tables of equal row count.
struct LocalFrame {
    runtime::Table index;
    runtime::Table data;
};

/// Split a table holding a frame's plan output into index and data parts.
/// Index columns without a display name keep their physical id.
[[nodiscard]] auto to_local_frame(const runtime::Table& table, const FrameMetadata& metadata)
    -> std::expected<LocalFrame, Error>;

/// One table for display: index levels under their display names, then data.
/// A data column named like an index level replaces it.
[[nodiscard]] auto display_table(const LocalFrame& local) -> runtime::Table;

/// A lazily evaluated, label-indexed frame: a plan paired with the metadata
/// describing its output, plus the source tables its scans read.
///
/// A frame tagged with a series name is Series-like: exactly one data column.
class Frame {
   public:
    Frame(ir::NodePtr plan, FrameMetadata metadata,
          std::shared_ptr<const runtime::TableRegistry> sources,
          std::optional<std::string> series_name = std::nullopt);

    /// Frame over `table` registered as source `name`.
    ///
    /// `index_columns` become the index, every other column is data. With no
    /// index columns an int64 row-sequence index `__index_level_0__` is added.
    [[nodiscard]] static auto from_table(std::string name, runtime::Table table,
                                         const std::vector<std::string>& index_columns = {})
        -> std::expected<Frame, Error>;

    [[nodiscard]] auto plan() const noexcept -> const ir::NodePtr& { return plan_; }
    [[nodiscard]] auto metadata() const noexcept -> const FrameMetadata& { return metadata_; }
    [[nodiscard]] auto sources() const noexcept
        -> const std::shared_ptr<const runtime::TableRegistry>& {
        return sources_;
    }
    [[nodiscard]] auto is_series() const noexcept -> bool { return series_name_.has_value(); }
    [[nodiscard]] auto series_name() const noexcept -> const std::optional<std::string>& {
        return series_name_;
    }

    /// True when both plans produce the same rows in the same order, so a
    /// column of `other` lines up with this frame by position.
    [[nodiscard]] auto aligned_with(const Frame& other) const noexcept -> bool;

    /// New frame over the same sources. The pair must satisfy the pairing invariant.
    [[nodiscard]] auto derive(ir::NodePtr plan, FrameMetadata metadata,
                              std::optional<std::string> series_name = std::nullopt) const
        -> Frame;

    /// Execute the plan; columns come back as index ids then data columns.
    [[nodiscard]] auto collect(const runtime::ExecOptions& options = {}) const
        -> std::expected<runtime::Table, Error>;

    [[nodiscard]] auto to_local(const runtime::ExecOptions& options = {}) const
        -> std::expected<LocalFrame, Error>;

   private:
    ir::NodePtr plan_;
    FrameMetadata metadata_;
    std::shared_ptr<const runtime::TableRegistry> sources_;
    std::optional<std::string> series_name_;
};

}  // namespace kodiak
