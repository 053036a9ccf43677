#pragma once

#include <kodiak/core/bool.hpp>
#include <kodiak/core/schema.hpp>
#include <kodiak/runtime/table.hpp>

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace kodiak::ir {

/// Unique identifier for IR nodes.
using NodeId = std::uint64_t;

/// Plans are immutable once built; subtrees are shared between frames.
class Node;
using NodePtr = std::shared_ptr<const Node>;

/// Column reference in the IR.
struct ColumnRef {
    std::string name;
};

/// Expression node for computed fields.
struct Expr;
using ExprPtr = std::shared_ptr<const Expr>;

using LiteralValue = std::variant<std::int64_t, double, std::string, Bool>;

struct Literal {
    LiteralValue value;
};

enum class ArithmeticOp : std::uint8_t {
    Add,
    Sub,
    Mul,
    Div,
    Mod,
};

struct BinaryExpr {
    ArithmeticOp op = ArithmeticOp::Add;
    ExprPtr left;
    ExprPtr right;
};

/// Scalar functions the engine evaluates column-wise.
enum class Builtin : std::uint8_t {
    /// double NaN -> null; other kinds pass through.
    NanToNull,
    /// Cast to bool: non-zero numbers and non-empty strings are true.
    ToBool,
    /// First non-null argument.
    Coalesce,
    Log,
    Exp,
    /// Fails evaluation when a non-null value is <= 0.
    CheckPositive,
};

struct CallExpr {
    Builtin callee = Builtin::NanToNull;
    std::vector<ExprPtr> args;
};

struct Expr {
    std::variant<ColumnRef, Literal, BinaryExpr, CallExpr> node;
};

/// A computed field: an alias mapped to an expression.
struct FieldSpec {
    std::string alias;
    Expr expr;
};

struct OrderKey {
    std::string name;
    bool ascending = true;
};

/// Supported comparison operators for filter predicates.
enum class CompareOp : std::uint8_t {
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
};

/// Supported aggregation functions.
enum class AggFunc : std::uint8_t {
    Count,
    CountDistinct,
    Sum,
    Mean,
    Min,
    Max,
    First,
    Last,
    Std,
    Var,
};

/// Running (cumulative) functions evaluated by a Window node.
enum class CumFunc : std::uint8_t {
    Sum,
    Min,
    Max,
};

/// Filter expression tree: value leaves and boolean nodes.
struct FilterExpr;
using FilterExprPtr = std::shared_ptr<const FilterExpr>;

/// Column reference in a filter expression.
struct FilterColumn {
    std::string name;
};
/// Literal value in a filter expression. A Bool literal is a constant predicate.
struct FilterLiteral {
    LiteralValue value;
};
/// Comparison between two value expressions; produces a bool.
struct FilterCmp {
    CompareOp op;
    FilterExprPtr left, right;
};
/// Logical AND of two boolean expressions.
struct FilterAnd {
    FilterExprPtr left, right;
};
/// Logical OR of two boolean expressions.
struct FilterOr {
    FilterExprPtr left, right;
};
/// Logical NOT of a boolean expression.
struct FilterNot {
    FilterExprPtr operand;
};
/// Membership test of a value expression against a literal set.
struct FilterIn {
    FilterExprPtr value;
    std::vector<LiteralValue> set;
};

struct FilterExpr {
    std::variant<FilterColumn, FilterLiteral, FilterCmp, FilterAnd, FilterOr, FilterNot, FilterIn>
        node;
};

/// Aggregation specification: apply function to an expression, store as alias.
struct AggSpec {
    AggFunc func = AggFunc::Sum;
    Expr arg;
    std::string alias;
};

/// Cumulative specification: running function over an expression, store as alias.
struct CumSpec {
    CumFunc func = CumFunc::Sum;
    Expr arg;
    std::string alias;
};

/// Function run once per group by a GroupMap node. Receives every input
/// column for the rows of one group and returns a table matching the
/// node's declared schema.
using GroupMapFn = std::function<std::expected<runtime::Table, std::string>(const runtime::Table&)>;

/// Row contract of a GroupMap function's output.
enum class GroupMapRows : std::uint8_t {
    /// Any number of rows; results are concatenated in group order.
    Any,
    /// Exactly the group's rows, in order; output keeps the child's row order.
    Aligned,
    /// All of the group's rows or none; output keeps the child's row order.
    Subset,
};

/// IR node types.
enum class NodeKind : std::uint8_t {
    Scan,
    Filter,
    Project,
    Update,
    Aggregate,
    Order,
    Window,
    GroupMap,
    Zip,
};

/// Base IR node for the query plan.
///
/// Represents a single relational operation in the query DAG. Children are
/// fixed at construction and shared, so rewriting a plan means building new
/// nodes on top of existing subtrees.
class Node {
   public:
    Node(NodeKind kind, NodeId id, std::vector<NodePtr> children = {})
        : kind_(kind), id_(id), children_(std::move(children)) {}
    virtual ~Node() = default;

    Node(const Node&) = delete;
    auto operator=(const Node&) -> Node& = delete;
    Node(Node&&) = delete;
    auto operator=(Node&&) -> Node& = delete;

    [[nodiscard]] auto kind() const noexcept -> NodeKind { return kind_; }
    [[nodiscard]] auto id() const noexcept -> NodeId { return id_; }
    [[nodiscard]] auto children() const noexcept -> const std::vector<NodePtr>& {
        return children_;
    }

   private:
    NodeKind kind_;
    NodeId id_;
    std::vector<NodePtr> children_;
};

/// Scan node: reads from a named source.
class ScanNode final : public Node {
   public:
    ScanNode(NodeId id, std::string source_name)
        : Node(NodeKind::Scan, id), source_name_(std::move(source_name)) {}

    [[nodiscard]] auto source_name() const noexcept -> const std::string& { return source_name_; }

   private:
    std::string source_name_;
};

/// Filter node: keeps the rows of its child for which the predicate is true.
class FilterNode final : public Node {
   public:
    FilterNode(NodeId id, NodePtr child, FilterExprPtr predicate)
        : Node(NodeKind::Filter, id, {std::move(child)}), predicate_(std::move(predicate)) {}

    [[nodiscard]] auto predicate() const noexcept -> const FilterExpr& { return *predicate_; }

   private:
    FilterExprPtr predicate_;
};

/// Project node: selects a subset of columns, in the given order.
class ProjectNode final : public Node {
   public:
    ProjectNode(NodeId id, NodePtr child, std::vector<ColumnRef> columns)
        : Node(NodeKind::Project, id, {std::move(child)}), columns_(std::move(columns)) {}

    [[nodiscard]] auto columns() const noexcept -> const std::vector<ColumnRef>& {
        return columns_;
    }

   private:
    std::vector<ColumnRef> columns_;
};

/// Update node: adds or replaces columns while retaining all existing ones.
/// A replaced column keeps its position.
class UpdateNode final : public Node {
   public:
    UpdateNode(NodeId id, NodePtr child, std::vector<FieldSpec> fields)
        : Node(NodeKind::Update, id, {std::move(child)}), fields_(std::move(fields)) {}

    [[nodiscard]] auto fields() const noexcept -> const std::vector<FieldSpec>& { return fields_; }

   private:
    std::vector<FieldSpec> fields_;
};

/// Aggregate node: groups by key expressions and aggregates.
///
/// Output columns are the key aliases followed by the aggregation aliases,
/// one row per distinct key in first-appearance order. With no aggregations
/// the output is the distinct key set.
class AggregateNode final : public Node {
   public:
    AggregateNode(NodeId id, NodePtr child, std::vector<FieldSpec> group_by,
                  std::vector<AggSpec> aggregations)
        : Node(NodeKind::Aggregate, id, {std::move(child)}),
          group_by_(std::move(group_by)),
          aggregations_(std::move(aggregations)) {}

    [[nodiscard]] auto group_by() const noexcept -> const std::vector<FieldSpec>& {
        return group_by_;
    }
    [[nodiscard]] auto aggregations() const noexcept -> const std::vector<AggSpec>& {
        return aggregations_;
    }

   private:
    std::vector<FieldSpec> group_by_;
    std::vector<AggSpec> aggregations_;
};

/// Order node: stable sort by one or more keys.
class OrderNode final : public Node {
   public:
    OrderNode(NodeId id, NodePtr child, std::vector<OrderKey> keys)
        : Node(NodeKind::Order, id, {std::move(child)}), keys_(std::move(keys)) {}

    [[nodiscard]] auto keys() const noexcept -> const std::vector<OrderKey>& { return keys_; }

   private:
    std::vector<OrderKey> keys_;
};

/// Window node: running functions partitioned by key expressions.
///
/// Rows are visited in the child's row order; each field is added (or
/// replaces a column of the same name) like an update.
class WindowNode final : public Node {
   public:
    WindowNode(NodeId id, NodePtr child, std::vector<Expr> partition_by,
               std::vector<CumSpec> fields)
        : Node(NodeKind::Window, id, {std::move(child)}),
          partition_by_(std::move(partition_by)),
          fields_(std::move(fields)) {}

    [[nodiscard]] auto partition_by() const noexcept -> const std::vector<Expr>& {
        return partition_by_;
    }
    [[nodiscard]] auto fields() const noexcept -> const std::vector<CumSpec>& { return fields_; }

   private:
    std::vector<Expr> partition_by_;
    std::vector<CumSpec> fields_;
};

/// GroupMap node: runs a function once per group and concatenates the results.
///
/// The output schema is declared up front so that consumers can plan on it
/// without evaluating the function.
class GroupMapNode final : public Node {
   public:
    GroupMapNode(NodeId id, NodePtr child, std::vector<Expr> group_by, GroupMapFn func,
                 Schema schema, GroupMapRows rows = GroupMapRows::Any)
        : Node(NodeKind::GroupMap, id, {std::move(child)}),
          group_by_(std::move(group_by)),
          func_(std::move(func)),
          schema_(std::move(schema)),
          rows_(rows) {}

    [[nodiscard]] auto group_by() const noexcept -> const std::vector<Expr>& { return group_by_; }
    [[nodiscard]] auto func() const noexcept -> const GroupMapFn& { return func_; }
    [[nodiscard]] auto schema() const noexcept -> const Schema& { return schema_; }
    [[nodiscard]] auto rows() const noexcept -> GroupMapRows { return rows_; }

   private:
    std::vector<Expr> group_by_;
    GroupMapFn func_;
    Schema schema_;
    GroupMapRows rows_;
};

/// Zip node: joins two children by row position.
///
/// Column `column` of the right child is added to the left child as `alias`
/// (replacing a column of that name). Both children must produce the same
/// number of rows.
class ZipNode final : public Node {
   public:
    ZipNode(NodeId id, NodePtr left, NodePtr right, std::string column, std::string alias)
        : Node(NodeKind::Zip, id, {std::move(left), std::move(right)}),
          column_(std::move(column)),
          alias_(std::move(alias)) {}

    [[nodiscard]] auto column() const noexcept -> const std::string& { return column_; }
    [[nodiscard]] auto alias() const noexcept -> const std::string& { return alias_; }

   private:
    std::string column_;
    std::string alias_;
};

/// True when `node` yields its first child's rows, in the same order.
[[nodiscard]] inline auto preserves_rows(const Node& node) noexcept -> bool {
    switch (node.kind()) {
        case NodeKind::Project:
        case NodeKind::Update:
        case NodeKind::Window:
        case NodeKind::Zip:
            return true;
        case NodeKind::GroupMap:
            return static_cast<const GroupMapNode&>(node).rows() == GroupMapRows::Aligned;
        default:
            return false;
    }
}

/// The nearest node under `node` (or `node` itself) that does not preserve
/// its child's rows. Plans with the same anchor produce the same rows.
[[nodiscard]] inline auto row_anchor(const Node& node) noexcept -> const Node& {
    const Node* current = &node;
    while (preserves_rows(*current)) {
        current = current->children().front().get();
    }
    return *current;
}

}  // namespace kodiak::ir
