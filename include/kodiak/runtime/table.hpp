#pragma once

#include <kodiak/core/bool.hpp>
#include <kodiak/core/column.hpp>
#include <kodiak/core/schema.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace kodiak::runtime {

using ColumnValue =
    std::variant<Column<std::int64_t>, Column<double>, Column<std::string>, Column<Bool>>;
using ScalarValue = std::variant<std::int64_t, double, std::string, Bool>;

struct ColumnEntry {
    std::string name;
    std::shared_ptr<ColumnValue> column;
    // Validity bitmap: true = valid (not null), false = null.
    // nullopt means every row is valid, the common case, with zero overhead.
    std::optional<std::vector<bool>> validity;
};

/// Returns true if row `row` of `entry` is null.
[[nodiscard]] inline auto is_null(const ColumnEntry& entry, std::size_t row) -> bool {
    return entry.validity.has_value() && !(*entry.validity)[row];
}

struct Table {
    std::vector<ColumnEntry> columns;
    std::unordered_map<std::string, std::size_t> index;

    void add_column(std::string name, ColumnValue column);
    /// Add a column with an explicit validity bitmap (true = valid, false = null).
    void add_column(std::string name, ColumnValue column, std::vector<bool> validity);
    /// Add or replace a column, sharing the storage of `entry`.
    void add_entry(ColumnEntry entry);
    [[nodiscard]] auto find(const std::string& name) const -> const ColumnValue*;
    [[nodiscard]] auto find_entry(const std::string& name) const -> const ColumnEntry*;
    [[nodiscard]] auto rows() const noexcept -> std::size_t;
    [[nodiscard]] auto schema() const -> Schema;
};

using TableRegistry = std::unordered_map<std::string, Table>;

[[nodiscard]] auto kind_of(const ColumnValue& column) noexcept -> ScalarKind;
[[nodiscard]] auto kind_of(const ScalarValue& value) noexcept -> ScalarKind;
[[nodiscard]] auto column_size(const ColumnValue& column) -> std::size_t;
[[nodiscard]] auto make_empty_column(ScalarKind kind) -> ColumnValue;

/// Value at `row`, or nullopt when the row is null.
[[nodiscard]] auto cell(const ColumnEntry& entry, std::size_t row) -> std::optional<ScalarValue>;

/// Incrementally builds a column of a fixed kind, tracking nulls.
class ColumnBuilder {
   public:
    explicit ColumnBuilder(ScalarKind kind);

    void append(const std::optional<ScalarValue>& value);
    void append_null();
    void append_from(const ColumnEntry& entry, std::size_t row);
    void reserve(std::size_t rows);

    [[nodiscard]] auto kind() const noexcept -> ScalarKind { return kind_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return validity_.size(); }

    /// Move the built column into `name`.
    [[nodiscard]] auto finish(std::string name) && -> ColumnEntry;

   private:
    ScalarKind kind_;
    ColumnValue column_;
    std::vector<bool> validity_;
    bool has_nulls_ = false;
};

}  // namespace kodiak::runtime
