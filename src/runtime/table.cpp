#include <kodiak/runtime/table.hpp>

#include <stdexcept>
#include <type_traits>

namespace kodiak::runtime {

void Table::add_column(std::string name, ColumnValue column) {
    add_entry(ColumnEntry{.name = std::move(name),
                          .column = std::make_shared<ColumnValue>(std::move(column)),
                          .validity = std::nullopt});
}

void Table::add_column(std::string name, ColumnValue column, std::vector<bool> validity) {
    add_entry(ColumnEntry{.name = std::move(name),
                          .column = std::make_shared<ColumnValue>(std::move(column)),
                          .validity = std::move(validity)});
}

void Table::add_entry(ColumnEntry entry) {
    if (auto it = index.find(entry.name); it != index.end()) {
        // Reseat the shared_ptr rather than mutating shared data (copy-on-write).
        columns[it->second] = std::move(entry);
        return;
    }
    std::size_t pos = columns.size();
    columns.push_back(std::move(entry));
    index[columns.back().name] = pos;
}

auto Table::find(const std::string& name) const -> const ColumnValue* {
    if (auto it = index.find(name); it != index.end()) {
        return columns[it->second].column.get();
    }
    return nullptr;
}

auto Table::find_entry(const std::string& name) const -> const ColumnEntry* {
    if (auto it = index.find(name); it != index.end()) {
        return &columns[it->second];
    }
    return nullptr;
}

auto Table::rows() const noexcept -> std::size_t {
    if (columns.empty()) {
        return 0;
    }
    return column_size(*columns.front().column);
}

auto Table::schema() const -> Schema {
    Schema out;
    out.reserve(columns.size());
    for (const auto& entry : columns) {
        out.push_back(Field{.name = entry.name, .kind = kind_of(*entry.column)});
    }
    return out;
}

auto kind_of(const ColumnValue& column) noexcept -> ScalarKind {
    switch (column.index()) {
        case 0:
            return ScalarKind::Int;
        case 1:
            return ScalarKind::Double;
        case 2:
            return ScalarKind::String;
        default:
            return ScalarKind::Bool;
    }
}

auto kind_of(const ScalarValue& value) noexcept -> ScalarKind {
    switch (value.index()) {
        case 0:
            return ScalarKind::Int;
        case 1:
            return ScalarKind::Double;
        case 2:
            return ScalarKind::String;
        default:
            return ScalarKind::Bool;
    }
}

auto column_size(const ColumnValue& column) -> std::size_t {
    return std::visit([](const auto& col) { return col.size(); }, column);
}

auto make_empty_column(ScalarKind kind) -> ColumnValue {
    switch (kind) {
        case ScalarKind::Int:
            return Column<std::int64_t>{};
        case ScalarKind::Double:
            return Column<double>{};
        case ScalarKind::String:
            return Column<std::string>{};
        case ScalarKind::Bool:
            return Column<Bool>{};
    }
    return Column<std::int64_t>{};
}

auto cell(const ColumnEntry& entry, std::size_t row) -> std::optional<ScalarValue> {
    if (is_null(entry, row)) {
        return std::nullopt;
    }
    return std::visit([row](const auto& col) -> ScalarValue { return col[row]; }, *entry.column);
}

// ─── ColumnBuilder ────────────────────────────────────────────────────────────

ColumnBuilder::ColumnBuilder(ScalarKind kind) : kind_(kind), column_(make_empty_column(kind)) {}

void ColumnBuilder::append(const std::optional<ScalarValue>& value) {
    if (!value.has_value()) {
        append_null();
        return;
    }
    std::visit(
        [&](auto& col) {
            using T = typename std::decay_t<decltype(col)>::value_type;
            if (const auto* exact = std::get_if<T>(&*value)) {
                col.push_back(*exact);
                return;
            }
            if constexpr (std::is_same_v<T, double>) {
                if (const auto* widened = std::get_if<std::int64_t>(&*value)) {
                    col.push_back(static_cast<double>(*widened));
                    return;
                }
            }
            throw std::runtime_error("column type mismatch: cannot append " +
                                     std::string(to_string(kind_of(*value))) + " to " +
                                     std::string(to_string(kind_)) + " column");
        },
        column_);
    validity_.push_back(true);
}

void ColumnBuilder::append_null() {
    std::visit([](auto& col) { col.emplace_back(); }, column_);
    validity_.push_back(false);
    has_nulls_ = true;
}

void ColumnBuilder::append_from(const ColumnEntry& entry, std::size_t row) {
    append(cell(entry, row));
}

void ColumnBuilder::reserve(std::size_t rows) {
    std::visit([rows](auto& col) { col.reserve(rows); }, column_);
    validity_.reserve(rows);
}

auto ColumnBuilder::finish(std::string name) && -> ColumnEntry {
    ColumnEntry entry{.name = std::move(name),
                      .column = std::make_shared<ColumnValue>(std::move(column_)),
                      .validity = std::nullopt};
    if (has_nulls_) {
        entry.validity = std::move(validity_);
    }
    return entry;
}

}  // namespace kodiak::runtime
