#include <kodiak/frame/group_key.hpp>
#include <kodiak/ir/builder.hpp>
#include <kodiak/ir/types.hpp>
#include <kodiak/runtime/ops.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <array>
#include <utility>

namespace kodiak {

namespace {

auto key_error(ErrorKind kind, std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{.kind = kind, .message = std::move(message)});
}

/// True when `key` is just a column of `frame` selected by `loc`.
auto projects_frame(const Frame& frame, const Frame& key) -> bool {
    const auto* project = dynamic_cast<const ir::ProjectNode*>(key.plan().get());
    return project != nullptr && project->children().front() == frame.plan();
}

}  // namespace

auto GroupKey::make(const Frame& frame, const std::vector<GroupKeyInput>& keys)
    -> std::expected<GroupKey, Error> {
    if (keys.empty()) {
        return key_error(ErrorKind::Configuration, "no group keys passed");
    }
    const auto& metadata = frame.metadata();
    ir::Builder builder;
    ir::NodePtr source = frame.plan();
    std::vector<GroupKeyEntry> entries;
    std::vector<std::string> unknown;

    auto add_column = [&](const std::string& column) -> std::expected<void, Error> {
        std::optional<std::string> display = column;
        if (metadata.is_index_column(column)) {
            for (const auto& index : metadata.index_columns()) {
                if (index.column == column) {
                    display = index.name;
                }
            }
        } else if (!metadata.is_data_column(column)) {
            unknown.push_back(column);
            return {};
        }
        auto kind = metadata.declared_type(column);
        if (!kind) {
            return std::unexpected(kind.error());
        }
        entries.push_back(GroupKeyEntry{.expr = ops::col_ref(column),
                                        .source_column = column,
                                        .alias = fmt::format("__index_level_{}__", entries.size()),
                                        .display_name = std::move(display),
                                        .kind = *kind});
        return {};
    };

    for (const auto& key : keys) {
        std::expected<void, Error> added;
        if (const auto* column = std::get_if<std::string>(&key.source)) {
            added = add_column(*column);
        } else if (const auto* expr = std::get_if<KeyExpr>(&key.source)) {
            auto kind = ir::infer_kind(expr->expr, metadata.schema());
            if (!kind) {
                return std::unexpected(kind.error());
            }
            entries.push_back(
                GroupKeyEntry{.expr = expr->expr,
                              .source_column = std::nullopt,
                              .alias = fmt::format("__index_level_{}__", entries.size()),
                              .display_name = expr->name,
                              .kind = *kind});
        } else {
            const auto& other = std::get<Frame>(key.source);
            const auto& data = other.metadata().data_columns();
            if (data.size() != 1) {
                return key_error(ErrorKind::TypeMismatch,
                                 fmt::format("a group key frame needs one data column, got {}",
                                             data.size()));
            }
            if (!frame.aligned_with(other)) {
                return key_error(ErrorKind::TypeMismatch,
                                 fmt::format("group key {} comes from a frame with different rows",
                                             data.front()));
            }
            if (projects_frame(frame, other) && metadata.is_data_column(data.front())) {
                added = add_column(data.front());
            } else {
                auto kind = other.metadata().declared_type(data.front());
                if (!kind) {
                    return std::unexpected(kind.error());
                }
                // The key's values ride along as a hidden column of the source plan.
                auto hidden = fmt::format("__group_key_{}__", entries.size());
                source = builder.zip(std::move(source), other.plan(), data.front(), hidden);
                entries.push_back(
                    GroupKeyEntry{.expr = ops::col_ref(hidden),
                                  .source_column = std::nullopt,
                                  .alias = fmt::format("__index_level_{}__", entries.size()),
                                  .display_name = data.front(),
                                  .kind = *kind});
            }
        }
        if (!added) {
            return std::unexpected(added.error());
        }
    }
    if (!unknown.empty()) {
        return key_error(ErrorKind::SchemaResolution,
                         fmt::format("group key not found: {} (available: {})",
                                     fmt::join(unknown, ", "),
                                     fmt::join(metadata.output_columns(), ", ")));
    }
    return GroupKey(std::move(entries), std::move(source));
}

auto GroupKey::contains(std::string_view column) const noexcept -> bool {
    return std::any_of(entries_.begin(), entries_.end(), [&](const GroupKeyEntry& entry) {
        return entry.source_column.has_value() && *entry.source_column == column;
    });
}

auto GroupKey::exprs() const -> std::vector<ir::Expr> {
    std::vector<ir::Expr> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(entry.expr);
    }
    return out;
}

auto GroupKey::fields() const -> std::vector<ir::FieldSpec> {
    std::vector<ir::FieldSpec> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(ops::make_field(entry.alias, entry.expr));
    }
    return out;
}

auto GroupKey::index_columns() const -> std::vector<IndexColumn> {
    std::vector<IndexColumn> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(IndexColumn{.column = entry.alias, .name = entry.display_name});
    }
    return out;
}

auto GroupKey::schema() const -> Schema {
    Schema out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(Field{.name = entry.alias, .kind = entry.kind});
    }
    return out;
}

auto GroupKey::names() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(entry.display_name.value_or(entry.alias));
    }
    return out;
}

auto parse_agg_function(std::string_view name) noexcept -> std::optional<ir::AggFunc> {
    static constexpr std::array<std::pair<std::string_view, ir::AggFunc>, 10> kFunctions{{
        {"count", ir::AggFunc::Count},
        {"sum", ir::AggFunc::Sum},
        {"mean", ir::AggFunc::Mean},
        {"min", ir::AggFunc::Min},
        {"max", ir::AggFunc::Max},
        {"first", ir::AggFunc::First},
        {"last", ir::AggFunc::Last},
        {"std", ir::AggFunc::Std},
        {"var", ir::AggFunc::Var},
        {"nunique", ir::AggFunc::CountDistinct},
    }};
    for (const auto& [key, func] : kFunctions) {
        if (key == name) {
            return func;
        }
    }
    return std::nullopt;
}

auto agg_output_id(std::string_view column, std::string_view function) -> std::string {
    return fmt::format("('{}', '{}')", column, function);
}

}  // namespace kodiak
