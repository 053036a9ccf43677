#pragma once

#include <kodiak/ir/node.hpp>

#include <atomic>

namespace kodiak::ir {

/// Factory for constructing IR nodes with unique IDs.
///
/// IDs come from one process-wide atomic counter, so nodes built by different
/// builders can be combined in one plan without colliding.
class Builder {
   public:
    Builder() = default;

    [[nodiscard]] auto scan(std::string source_name) -> NodePtr {
        return std::make_shared<const ScanNode>(next_id(), std::move(source_name));
    }

    [[nodiscard]] auto filter(NodePtr child, FilterExprPtr predicate) -> NodePtr {
        return std::make_shared<const FilterNode>(next_id(), std::move(child),
                                                  std::move(predicate));
    }

    [[nodiscard]] auto project(NodePtr child, std::vector<ColumnRef> columns) -> NodePtr {
        return std::make_shared<const ProjectNode>(next_id(), std::move(child),
                                                   std::move(columns));
    }

    [[nodiscard]] auto update(NodePtr child, std::vector<FieldSpec> fields) -> NodePtr {
        return std::make_shared<const UpdateNode>(next_id(), std::move(child), std::move(fields));
    }

    [[nodiscard]] auto aggregate(NodePtr child, std::vector<FieldSpec> group_by,
                                 std::vector<AggSpec> aggregations) -> NodePtr {
        return std::make_shared<const AggregateNode>(next_id(), std::move(child),
                                                     std::move(group_by),
                                                     std::move(aggregations));
    }

    [[nodiscard]] auto order(NodePtr child, std::vector<OrderKey> keys) -> NodePtr {
        return std::make_shared<const OrderNode>(next_id(), std::move(child), std::move(keys));
    }

    [[nodiscard]] auto window(NodePtr child, std::vector<Expr> partition_by,
                              std::vector<CumSpec> fields) -> NodePtr {
        return std::make_shared<const WindowNode>(next_id(), std::move(child),
                                                  std::move(partition_by), std::move(fields));
    }

    [[nodiscard]] auto group_map(NodePtr child, std::vector<Expr> group_by, GroupMapFn func,
                                 Schema schema, GroupMapRows rows = GroupMapRows::Any)
        -> NodePtr {
        return std::make_shared<const GroupMapNode>(next_id(), std::move(child),
                                                    std::move(group_by), std::move(func),
                                                    std::move(schema), rows);
    }

    [[nodiscard]] auto zip(NodePtr left, NodePtr right, std::string column, std::string alias)
        -> NodePtr {
        return std::make_shared<const ZipNode>(next_id(), std::move(left), std::move(right),
                                               std::move(column), std::move(alias));
    }

   private:
    [[nodiscard]] static auto next_id() -> NodeId {
        static std::atomic<NodeId> counter{1};
        return counter.fetch_add(1, std::memory_order_relaxed);
    }
};

}  // namespace kodiak::ir
