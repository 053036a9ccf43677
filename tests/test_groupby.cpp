#include <kodiak/frame/group_by.hpp>
#include <kodiak/frame/locator.hpp>
#include <kodiak/runtime/ops.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>
#include <numeric>

namespace {

using namespace kodiak;

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

auto frame_of(runtime::Table table) -> Frame {
    auto frame = Frame::from_table("t", std::move(table));
    REQUIRE(frame.has_value());
    return std::move(frame.value());
}

auto require_group_by(const Frame& frame, const std::vector<GroupKeyInput>& keys) -> GroupBy {
    auto grouped = group_by(frame, keys);
    REQUIRE(grouped.has_value());
    return std::move(grouped.value());
}

auto require_local(const std::expected<Frame, Error>& frame) -> LocalFrame {
    REQUIRE(frame.has_value());
    auto local = frame->to_local();
    REQUIRE(local.has_value());
    return std::move(local.value());
}

template <typename T>
auto column(const runtime::Table& table, const char* name) -> const Column<T>& {
    const auto* col = std::get_if<Column<T>>(table.find(name));
    REQUIRE(col != nullptr);
    return *col;
}

template <typename T>
auto values(const Column<T>& col) -> std::vector<T> {
    return {col.begin(), col.end()};
}

auto require_error(const std::expected<Frame, Error>& frame, ErrorKind kind) {
    REQUIRE_FALSE(frame.has_value());
    REQUIRE(frame.error().kind == kind);
}

auto foo_bar() -> Frame {
    runtime::Table table;
    table.add_column("A", Column<std::string>{"foo", "bar", "foo", "bar", "foo", "bar"});
    table.add_column("B", Column<std::int64_t>{1, 2, 3, 4, 5, 6});
    return frame_of(std::move(table));
}

/// Mean of the int64 column B of one group.
auto mean_of_b(const LocalFrame& group) -> std::expected<double, std::string> {
    const auto* b = std::get_if<Column<std::int64_t>>(group.data.find("B"));
    if (b == nullptr || b->empty()) {
        return std::unexpected("B missing");
    }
    double total = std::accumulate(b->begin(), b->end(), 0.0);
    return total / static_cast<double>(b->size());
}

}  // namespace

TEST_CASE("Groupby aggregate with min and sum", "[frame][groupby]") {
    runtime::Table table;
    table.add_column("A", Column<std::int64_t>{1, 1, 2, 2});
    table.add_column("B", Column<std::int64_t>{1, 2, 3, 4});
    table.add_column("C", Column<double>{0.362, 0.227, 1.267, -0.562});
    auto grouped = require_group_by(frame_of(std::move(table)), {"A"});

    auto result = grouped.aggregate({AggRequest{.column = "B", .functions = {"min"}},
                                     AggRequest{.column = "C", .functions = {"sum"}}});
    REQUIRE(result.has_value());
    REQUIRE(result->metadata().index_names().front() == std::optional<std::string>("A"));
    REQUIRE_FALSE(result->metadata().column_labels().has_value());

    auto local = require_local(result);
    const auto& keys = column<std::int64_t>(local.index, "A");
    REQUIRE(keys[0] == 1);
    REQUIRE(keys[1] == 2);
    const auto& b = column<std::int64_t>(local.data, "B");
    REQUIRE(b[0] == 1);
    REQUIRE(b[1] == 3);
    const auto& c = column<double>(local.data, "C");
    REQUIRE(c[0] == Catch::Approx(0.589));
    REQUIRE(c[1] == Catch::Approx(0.705));
}

TEST_CASE("Groupby aggregate with several functions per column", "[frame][groupby]") {
    runtime::Table table;
    table.add_column("A", Column<std::int64_t>{1, 1, 2});
    table.add_column("B", Column<double>{1.0, 3.0, 5.0});
    auto grouped = require_group_by(frame_of(std::move(table)), {"A"});

    auto result =
        grouped.aggregate({AggRequest{.column = "B", .functions = {"min", "max", "nunique"}}});
    REQUIRE(result.has_value());
    const auto& md = result->metadata();
    REQUIRE(md.data_columns() ==
            std::vector<std::string>{"('B', 'min')", "('B', 'max')", "('B', 'nunique')"});
    REQUIRE(md.label_levels() == 2);
    REQUIRE(md.label_of("('B', 'max')") == ColumnLabel{"B", "max"});

    auto local = require_local(result);
    REQUIRE(column<double>(local.data, "('B', 'max')")[0] == 3.0);
    REQUIRE(column<std::int64_t>(local.data, "('B', 'nunique')")[0] == 2);
}

TEST_CASE("Groupby aggregate rejects malformed specs", "[frame][groupby]") {
    auto grouped = require_group_by(foo_bar(), {"A"});

    require_error(grouped.aggregate({}), ErrorKind::Configuration);
    require_error(grouped.aggregate({AggRequest{.column = "B", .functions = {}}}),
                  ErrorKind::Configuration);
    require_error(grouped.aggregate({AggRequest{.column = "B", .functions = {"median"}}}),
                  ErrorKind::Configuration);
    require_error(grouped.aggregate({AggRequest{.column = "B", .functions = {"sum"}},
                                     AggRequest{.column = "B", .functions = {"max"}}}),
                  ErrorKind::Configuration);
    require_error(grouped.aggregate({AggRequest{.column = "Z", .functions = {"sum"}}}),
                  ErrorKind::SchemaResolution);
}

TEST_CASE("Groupby count excludes NaN", "[frame][groupby]") {
    runtime::Table table;
    table.add_column("A", Column<std::int64_t>{1, 1, 2, 1, 2});
    table.add_column("B", Column<double>{kNaN, 2.0, 3.0, 4.0, 5.0});
    table.add_column("C", Column<std::int64_t>{1, 2, 1, 1, 2});
    auto grouped = require_group_by(frame_of(std::move(table)), {"A"});

    auto local = require_local(grouped.count());
    const auto& keys = column<std::int64_t>(local.index, "A");
    REQUIRE(keys[0] == 1);
    REQUIRE(keys[1] == 2);
    const auto& b = column<std::int64_t>(local.data, "B");
    REQUIRE(b[0] == 2);
    REQUIRE(b[1] == 2);
    const auto& c = column<std::int64_t>(local.data, "C");
    REQUIRE(c[0] == 3);
    REQUIRE(c[1] == 2);
}

TEST_CASE("Groupby reductions sort by key", "[frame][groupby]") {
    runtime::Table table;
    table.add_column("A", Column<std::string>{"z", "a", "z", "a"});
    table.add_column("S", Column<std::string>{"p", "q", "r", "s"});
    table.add_column("B", Column<double>{1.0, 2.0, 3.0, 6.0});
    auto grouped = require_group_by(frame_of(std::move(table)), {"A"});

    SECTION("numeric-only reductions skip string columns") {
        auto result = grouped.mean();
        REQUIRE(result.has_value());
        REQUIRE(result->metadata().data_columns() == std::vector<std::string>{"B"});

        auto local = require_local(result);
        const auto& keys = column<std::string>(local.index, "A");
        REQUIRE(keys[0] == "a");
        REQUIRE(keys[1] == "z");
        const auto& b = column<double>(local.data, "B");
        REQUIRE(b[0] == Catch::Approx(4.0));
        REQUIRE(b[1] == Catch::Approx(2.0));
    }

    SECTION("max keeps every column") {
        auto local = require_local(grouped.max());
        REQUIRE(column<std::string>(local.data, "S")[0] == "s");
        REQUIRE(column<double>(local.data, "B")[1] == 3.0);
    }

    SECTION("first and last") {
        auto first = require_local(grouped.first());
        REQUIRE(column<std::string>(first.data, "S")[0] == "q");
        auto last = require_local(grouped.last());
        REQUIRE(column<std::string>(last.data, "S")[1] == "r");
    }

    SECTION("sample statistics") {
        auto var = require_local(grouped.var());
        REQUIRE(column<double>(var.data, "B")[0] == Catch::Approx(8.0));
        auto deviation = require_local(grouped.stddev());
        REQUIRE(column<double>(deviation.data, "B")[1] == Catch::Approx(std::sqrt(2.0)));
    }

    SECTION("sum keeps the column kind") {
        auto local = require_local(grouped.sum());
        REQUIRE(column<double>(local.data, "B")[0] == Catch::Approx(8.0));
    }
}

TEST_CASE("Groupby all and any", "[frame][groupby]") {
    runtime::Table table;
    table.add_column("A", Column<std::int64_t>{1, 1, 2, 2});
    table.add_column("B", Column<std::int64_t>{1, 0, 2, 3});
    auto grouped = require_group_by(frame_of(std::move(table)), {"A"});

    auto all = require_local(grouped.all());
    const auto& all_b = column<Bool>(all.data, "B");
    REQUIRE_FALSE(all_b[0].value);
    REQUIRE(all_b[1].value);

    auto any = require_local(grouped.any());
    const auto& any_b = column<Bool>(any.data, "B");
    REQUIRE(any_b[0].value);
    REQUIRE(any_b[1].value);
}

TEST_CASE("Groupby size is series-like", "[frame][groupby]") {
    auto grouped = require_group_by(foo_bar(), {"A"});

    auto result = grouped.size();
    REQUIRE(result.has_value());
    REQUIRE(result->is_series());
    REQUIRE(result->metadata().data_columns() == std::vector<std::string>{"count"});

    auto local = require_local(result);
    REQUIRE(column<std::string>(local.index, "A")[0] == "bar");
    REQUIRE(column<std::int64_t>(local.data, "count")[0] == 3);

    auto narrowed = grouped.narrow("B");
    REQUIRE(narrowed.has_value());
    auto named = narrowed->size();
    REQUIRE(named.has_value());
    REQUIRE(named->series_name() == std::optional<std::string>("B"));
}

TEST_CASE("Groupby narrow selects the aggregated columns", "[frame][groupby]") {
    runtime::Table table;
    table.add_column("A", Column<std::int64_t>{1, 1, 2});
    table.add_column("B", Column<std::int64_t>{1, 2, 3});
    table.add_column("C", Column<std::int64_t>{4, 5, 6});
    auto grouped = require_group_by(frame_of(std::move(table)), {"A"});

    SECTION("single column gives a series") {
        auto narrowed = grouped.narrow("C");
        REQUIRE(narrowed.has_value());
        REQUIRE(narrowed->is_series());
        auto result = narrowed->sum();
        REQUIRE(result.has_value());
        REQUIRE(result->series_name() == std::optional<std::string>("C"));
        auto local = require_local(result);
        REQUIRE(column<std::int64_t>(local.data, "C")[0] == 9);
    }

    SECTION("column list gives a frame") {
        auto narrowed = grouped.narrow(std::vector<std::string>{"C", "B"});
        REQUIRE(narrowed.has_value());
        REQUIRE_FALSE(narrowed->is_series());
        REQUIRE(narrowed->agg_columns() == std::vector<std::string>{"C", "B"});
    }

    SECTION("errors") {
        auto series = grouped.narrow("C");
        REQUIRE(series.has_value());
        auto twice = series->narrow("B");
        REQUIRE_FALSE(twice.has_value());
        REQUIRE(twice.error().kind == ErrorKind::IndexingShape);

        auto unknown = grouped.narrow("Z");
        REQUIRE_FALSE(unknown.has_value());
        REQUIRE(unknown.error().kind == ErrorKind::SchemaResolution);
    }
}

TEST_CASE("Groupby keys must resolve", "[frame][groupby]") {
    auto frame = foo_bar();

    auto none = group_by(frame, {});
    REQUIRE_FALSE(none.has_value());
    REQUIRE(none.error().kind == ErrorKind::Configuration);

    auto unknown = group_by(frame, {"Z"});
    REQUIRE_FALSE(unknown.has_value());
    REQUIRE(unknown.error().kind == ErrorKind::SchemaResolution);
    REQUIRE(unknown.error().message.find("Z") != std::string::npos);
}

TEST_CASE("Groupby by an expression key", "[frame][groupby]") {
    auto frame = foo_bar();
    auto parity = ops::binop(ir::ArithmeticOp::Mod, ops::col_ref("B"), ops::int_lit(2));
    auto grouped = require_group_by(frame, {KeyExpr{.expr = parity, .name = "parity"}});

    REQUIRE(grouped.agg_columns() == std::vector<std::string>{"A", "B"});
    auto local = require_local(grouped.sum());
    REQUIRE(values(column<std::int64_t>(local.index, "parity")) == std::vector<std::int64_t>{0, 1});
    REQUIRE(values(column<std::int64_t>(local.data, "B")) == std::vector<std::int64_t>{12, 9});

    auto unknown = group_by(frame, {KeyExpr{.expr = ops::col_ref("Z"), .name = std::nullopt}});
    REQUIRE_FALSE(unknown.has_value());
    REQUIRE(unknown.error().kind == ErrorKind::SchemaResolution);
}

TEST_CASE("Groupby display table shows key names", "[frame][groupby]") {
    auto frame = foo_bar();
    auto parity = ops::binop(ir::ArithmeticOp::Mod, ops::col_ref("B"), ops::int_lit(2));
    auto grouped = require_group_by(frame, {KeyExpr{.expr = parity, .name = "parity"}});
    auto b = grouped.narrow("B");
    REQUIRE(b.has_value());

    auto shown = display_table(require_local(b->sum()));
    REQUIRE(shown.columns.size() == 2);
    REQUIRE(shown.columns[0].name == "parity");
    REQUIRE(shown.columns[1].name == "B");
    REQUIRE(values(column<std::int64_t>(shown, "parity")) == std::vector<std::int64_t>{0, 1});
    REQUIRE(shown.find(kDefaultIndexColumn) == nullptr);

    auto by_a = require_group_by(frame, {"A"});
    shown = display_table(require_local(by_a.size()));
    REQUIRE(shown.columns[0].name == "A");
    REQUIRE(values(column<std::string>(shown, "A")) == std::vector<std::string>{"bar", "foo"});
}

TEST_CASE("Groupby a series by a column of its frame", "[frame][groupby]") {
    auto frame = foo_bar();
    auto a = locate(frame, All{}, ir::ColumnRef{.name = "A"});
    auto b = locate(frame, All{}, ir::ColumnRef{.name = "B"});
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());

    auto grouped = require_group_by(*b, {*a});
    REQUIRE(grouped.is_series());
    auto sums = grouped.sum();
    REQUIRE(sums.has_value());
    REQUIRE(sums->series_name() == std::optional<std::string>("B"));
    auto local = require_local(sums);
    REQUIRE(values(column<std::string>(local.index, "A")) ==
            std::vector<std::string>{"bar", "foo"});
    REQUIRE(values(column<std::int64_t>(local.data, "B")) == std::vector<std::int64_t>{12, 9});

    auto running = require_local(grouped.cumsum());
    REQUIRE(values(column<std::int64_t>(running.data, "B")) ==
            std::vector<std::int64_t>{1, 2, 4, 6, 9, 12});
}

TEST_CASE("Groupby by a series of the same frame drops it from the columns",
          "[frame][groupby]") {
    auto frame = foo_bar();
    auto a = locate(frame, All{}, ir::ColumnRef{.name = "A"});
    REQUIRE(a.has_value());

    auto grouped = require_group_by(frame, {*a});
    REQUIRE(grouped.agg_columns() == std::vector<std::string>{"B"});
    auto local = require_local(grouped.size());
    REQUIRE(values(column<std::int64_t>(local.data, "count")) == std::vector<std::int64_t>{3, 3});
}

TEST_CASE("Groupby key frames must share rows", "[frame][groupby]") {
    auto frame = foo_bar();
    runtime::Table other;
    other.add_column("K", Column<std::int64_t>{1, 1, 1, 2, 2, 2});
    auto stranger = frame_of(std::move(other));

    auto mismatched = group_by(frame, {stranger});
    REQUIRE_FALSE(mismatched.has_value());
    REQUIRE(mismatched.error().kind == ErrorKind::TypeMismatch);

    auto filtered = locate(frame,
                           Predicate{.expr = ops::filter_cmp(ir::CompareOp::Gt,
                                                             ops::filter_col("B"),
                                                             ops::filter_int(2))},
                           ir::ColumnRef{.name = "A"});
    REQUIRE(filtered.has_value());
    auto fewer = group_by(frame, {*filtered});
    REQUIRE_FALSE(fewer.has_value());
    REQUIRE(fewer.error().kind == ErrorKind::TypeMismatch);

    auto wide = group_by(frame, {frame});
    REQUIRE_FALSE(wide.has_value());
    REQUIRE(wide.error().kind == ErrorKind::TypeMismatch);
}

TEST_CASE("Groupby on an index column uses the index name", "[frame][groupby]") {
    runtime::Table table;
    table.add_column("day", Column<std::int64_t>{2, 1, 2});
    table.add_column("v", Column<std::int64_t>{10, 20, 30});
    auto frame = Frame::from_table("t", std::move(table), {"day"});
    REQUIRE(frame.has_value());
    auto grouped = require_group_by(*frame, {"day"});

    auto local = require_local(grouped.sum());
    const auto& days = column<std::int64_t>(local.index, "day");
    REQUIRE(days[0] == 1);
    REQUIRE(days[1] == 2);
    REQUIRE(column<std::int64_t>(local.data, "v")[1] == 40);
}

TEST_CASE("Groupby cumprod over rows in order", "[frame][groupby]") {
    runtime::Table table;
    table.add_column("A", Column<std::int64_t>{1, 1, 1, 4});
    table.add_column("B", Column<double>{kNaN, 0.1, 20.0, 10.0});
    auto grouped = require_group_by(frame_of(std::move(table)), {"A"});

    auto result = grouped.cumprod();
    REQUIRE(result.has_value());
    REQUIRE(result->metadata().data_columns() == std::vector<std::string>{"B"});

    auto local = require_local(result);
    const auto* b = local.data.find_entry("B");
    REQUIRE(b != nullptr);
    REQUIRE(runtime::is_null(*b, 0));
    const auto& values = std::get<Column<double>>(*b->column);
    REQUIRE(values[1] == Catch::Approx(0.1));
    REQUIRE(values[2] == Catch::Approx(2.0));
    REQUIRE(values[3] == Catch::Approx(10.0));

    const auto& index = column<std::int64_t>(local.index, kDefaultIndexColumn);
    REQUIRE(index[3] == 3);
}

TEST_CASE("Groupby cumprod fails the job on a non-positive value", "[frame][groupby]") {
    runtime::Table table;
    table.add_column("A", Column<std::int64_t>{1, 1, 1, 4});
    table.add_column("B", Column<double>{kNaN, 0.1, -20.0, 10.0});
    auto grouped = require_group_by(frame_of(std::move(table)), {"A"});

    // Building the plan succeeds; the violation surfaces when it runs.
    auto result = grouped.cumprod();
    REQUIRE(result.has_value());
    auto collected = result->collect();
    REQUIRE_FALSE(collected.has_value());
    REQUIRE(collected.error().kind == ErrorKind::RuntimeComputation);
}

TEST_CASE("Groupby cumsum, cummax and cummin", "[frame][groupby]") {
    runtime::Table table;
    table.add_column("A", Column<std::string>{"x", "y", "x", "y", "x"});
    table.add_column("B", Column<std::int64_t>{3, 1, 1, 5, 4});
    auto grouped = require_group_by(frame_of(std::move(table)), {"A"});

    auto sum = require_local(grouped.cumsum());
    const auto& sums = column<std::int64_t>(sum.data, "B");
    REQUIRE(sums[0] == 3);
    REQUIRE(sums[2] == 4);
    REQUIRE(sums[3] == 6);
    REQUIRE(sums[4] == 8);

    auto max = require_local(grouped.cummax());
    REQUIRE(column<std::int64_t>(max.data, "B")[2] == 3);
    REQUIRE(column<std::int64_t>(max.data, "B")[4] == 4);

    auto min = require_local(grouped.cummin());
    REQUIRE(column<std::int64_t>(min.data, "B")[4] == 1);
}

TEST_CASE("Groupby cumsum rejects string columns", "[frame][groupby]") {
    runtime::Table table;
    table.add_column("A", Column<std::int64_t>{1, 1});
    table.add_column("S", Column<std::string>{"a", "b"});
    auto grouped = require_group_by(frame_of(std::move(table)), {"A"});

    require_error(grouped.cumsum(), ErrorKind::Configuration);
    REQUIRE(grouped.cummax().has_value());
}

TEST_CASE("Groupby filter keeps whole groups in order", "[frame][groupby]") {
    auto grouped = require_group_by(foo_bar(), {"A"});

    auto result = grouped.filter([](const LocalFrame& group) -> std::expected<bool, std::string> {
        auto mean = mean_of_b(group);
        if (!mean) {
            return std::unexpected(mean.error());
        }
        return *mean > 3.0;
    });
    REQUIRE(result.has_value());

    auto local = require_local(result);
    const auto& index = column<std::int64_t>(local.index, kDefaultIndexColumn);
    REQUIRE(index.size() == 3);
    REQUIRE(index[0] == 1);
    REQUIRE(index[1] == 3);
    REQUIRE(index[2] == 5);
    const auto& names = column<std::string>(local.data, "A");
    REQUIRE(names[0] == "bar");
    REQUIRE(names[2] == "bar");
}

TEST_CASE("Groupby filter keeps interleaved groups in row order", "[frame][groupby]") {
    runtime::Table table;
    table.add_column("A", Column<std::string>{"foo", "bar", "foo", "bar", "baz"});
    table.add_column("B", Column<std::int64_t>{1, 2, 3, 4, 5});
    auto grouped = require_group_by(frame_of(std::move(table)), {"A"});

    auto keep_all = require_local(grouped.filter(
        [](const LocalFrame&) -> std::expected<bool, std::string> { return true; }));
    REQUIRE(values(column<std::int64_t>(keep_all.index, kDefaultIndexColumn)) ==
            std::vector<std::int64_t>{0, 1, 2, 3, 4});

    auto no_bar = require_local(
        grouped.filter([](const LocalFrame& group) -> std::expected<bool, std::string> {
            const auto* a = std::get_if<Column<std::string>>(group.data.find("A"));
            if (a == nullptr) {
                return std::unexpected("A missing");
            }
            return (*a)[0] != "bar";
        }));
    REQUIRE(values(column<std::int64_t>(no_bar.index, kDefaultIndexColumn)) ==
            std::vector<std::int64_t>{0, 2, 4});
    REQUIRE(values(column<std::int64_t>(no_bar.data, "B")) == std::vector<std::int64_t>{1, 3, 5});
}

TEST_CASE("Groupby apply runs once per group", "[frame][groupby]") {
    auto grouped = require_group_by(foo_bar(), {"A"});
    Schema schema{Field{.name = "total", .kind = ScalarKind::Int}};

    auto result = grouped.apply(
        [](const LocalFrame& group) -> std::expected<runtime::Table, std::string> {
            const auto* b = std::get_if<Column<std::int64_t>>(group.data.find("B"));
            if (b == nullptr) {
                return std::unexpected("B missing");
            }
            runtime::Table out;
            out.add_column("sum_of_b",
                           Column<std::int64_t>{std::accumulate(b->begin(), b->end(),
                                                                std::int64_t{0})});
            return out;
        },
        schema);
    REQUIRE(result.has_value());
    REQUIRE(result->metadata().index_columns().empty());

    auto local = require_local(result);
    const auto& totals = column<std::int64_t>(local.data, "total");
    REQUIRE(totals.size() == 2);
    REQUIRE(totals[0] == 9);
    REQUIRE(totals[1] == 12);
}

TEST_CASE("Groupby apply reports a wrong column count", "[frame][groupby]") {
    auto grouped = require_group_by(foo_bar(), {"A"});
    Schema schema{Field{.name = "x", .kind = ScalarKind::Int},
                  Field{.name = "y", .kind = ScalarKind::Int}};

    auto result = grouped.apply(
        [](const LocalFrame&) -> std::expected<runtime::Table, std::string> {
            runtime::Table out;
            out.add_column("x", Column<std::int64_t>{1});
            return out;
        },
        schema);
    REQUIRE(result.has_value());
    auto collected = result->collect();
    REQUIRE_FALSE(collected.has_value());
    REQUIRE(collected.error().kind == ErrorKind::RuntimeComputation);
}

TEST_CASE("Groupby transform keeps the parent index", "[frame][groupby]") {
    auto grouped = require_group_by(foo_bar(), {"A"});

    auto result = grouped.transform(
        [](const runtime::ColumnEntry& entry) -> std::expected<runtime::ColumnEntry, std::string> {
            const auto* b = std::get_if<Column<std::int64_t>>(entry.column.get());
            if (b == nullptr) {
                return std::unexpected("expected int64 column");
            }
            auto doubled =
                b->transform([](std::int64_t v) { return static_cast<double>(v) * 2.0; });
            return runtime::ColumnEntry{.name = entry.name,
                                        .column = std::make_shared<runtime::ColumnValue>(
                                            std::move(doubled)),
                                        .validity = std::nullopt};
        },
        ScalarKind::Double);
    REQUIRE(result.has_value());
    REQUIRE(result->metadata().data_columns() == std::vector<std::string>{"B"});
    REQUIRE(result->metadata().declared_type("B").value() == ScalarKind::Double);

    auto local = require_local(result);
    const auto& index = column<std::int64_t>(local.index, kDefaultIndexColumn);
    const auto& b = column<double>(local.data, "B");
    REQUIRE(index.size() == 6);
    for (std::size_t row = 0; row < index.size(); ++row) {
        REQUIRE(index[row] == static_cast<std::int64_t>(row));
        REQUIRE(b[row] == Catch::Approx(static_cast<double>(index[row] + 1) * 2.0));
    }
}

TEST_CASE("Groupby transform rejects a column of another length", "[frame][groupby]") {
    auto grouped = require_group_by(foo_bar(), {"A"});

    auto result = grouped.transform(
        [](const runtime::ColumnEntry&) -> std::expected<runtime::ColumnEntry, std::string> {
            return runtime::ColumnEntry{
                .name = "B",
                .column = std::make_shared<runtime::ColumnValue>(Column<double>{1.0}),
                .validity = std::nullopt};
        },
        ScalarKind::Double);
    REQUIRE(result.has_value());
    auto collected = result->collect();
    REQUIRE_FALSE(collected.has_value());
    REQUIRE(collected.error().message.find("same length") != std::string::npos);
}

TEST_CASE("Groupby grouped functions need a declared schema and a callable",
          "[frame][groupby]") {
    auto grouped = require_group_by(foo_bar(), {"A"});
    ApplyFn apply = [](const LocalFrame&) -> std::expected<runtime::Table, std::string> {
        return runtime::Table{};
    };
    TransformFn transform =
        [](const runtime::ColumnEntry& entry) -> std::expected<runtime::ColumnEntry, std::string> {
        return entry;
    };

    require_error(grouped.apply(apply, std::nullopt), ErrorKind::Configuration);
    require_error(grouped.apply(apply, Schema{}), ErrorKind::Configuration);
    require_error(grouped.transform(transform, std::nullopt), ErrorKind::Configuration);
    require_error(grouped.apply(ApplyFn{}, Schema{Field{.name = "x", .kind = ScalarKind::Int}}),
                  ErrorKind::TypeMismatch);
    require_error(grouped.filter(FilterFn{}), ErrorKind::TypeMismatch);
}

TEST_CASE("Groupby call dispatches by name", "[frame][groupby]") {
    auto grouped = require_group_by(foo_bar(), {"A"});

    auto sum = grouped.call("sum");
    REQUIRE(sum.has_value());
    auto local = require_local(sum);
    REQUIRE(column<std::int64_t>(local.data, "B")[0] == 12);

    REQUIRE(grouped.call("cumsum").has_value());
    REQUIRE(grouped.call("size").has_value());

    auto median = grouped.call("median");
    require_error(median, ErrorKind::NotImplemented);
    REQUIRE(median.error().message.find("pd.DataFrameGroupBy.median") != std::string::npos);

    auto bogus = grouped.call("bogus");
    require_error(bogus, ErrorKind::SchemaResolution);
    REQUIRE(bogus.error().message.find("DataFrameGroupBy") != std::string::npos);

    auto series = grouped.narrow("B");
    REQUIRE(series.has_value());
    auto unique = series->call("unique");
    require_error(unique, ErrorKind::NotImplemented);
    REQUIRE(unique.error().message.find("pd.SeriesGroupBy") != std::string::npos);
}

TEST_CASE("Groupby parses operation names", "[frame][groupby]") {
    REQUIRE(parse_group_by_op("cumprod") == GroupByOp::CumProd);
    REQUIRE(parse_group_by_op("std") == GroupByOp::Std);
    REQUIRE_FALSE(parse_group_by_op("median").has_value());
    REQUIRE(to_string(GroupByOp::Any) == "any");
    REQUIRE(parse_agg_function("nunique") == ir::AggFunc::CountDistinct);
    REQUIRE(agg_output_id("B", "min") == "('B', 'min')");
}

TEST_CASE("Groupby leaves the source frame reusable", "[frame][groupby]") {
    auto frame = foo_bar();
    auto grouped = require_group_by(frame, {"A"});

    auto first = grouped.sum();
    auto second = grouped.max();
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(first->plan()->id() != second->plan()->id());

    auto local = require_local(locate(frame, All{}));
    REQUIRE(local.data.rows() == 6);
}
