#include <kodiak/frame/group_by.hpp>
#include <kodiak/frame/locator.hpp>
#include <kodiak/runtime/ops.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

namespace {

using namespace kodiak;

auto prices() -> Frame {
    runtime::Table table;
    table.add_column("day", Column<std::int64_t>{10, 20, 30, 40});
    table.add_column("open", Column<double>{1.0, 2.0, 3.0, 4.0});
    table.add_column("close", Column<double>{1.5, 2.5, 3.5, 4.5});
    auto frame = Frame::from_table("prices", std::move(table), {"day"});
    REQUIRE(frame.has_value());
    return std::move(frame.value());
}

auto require_local(const std::expected<Frame, Error>& frame) -> LocalFrame {
    REQUIRE(frame.has_value());
    auto local = frame->to_local();
    REQUIRE(local.has_value());
    return std::move(local.value());
}

auto days(const LocalFrame& local) -> std::vector<std::int64_t> {
    const auto* col = std::get_if<Column<std::int64_t>>(local.index.find("day"));
    REQUIRE(col != nullptr);
    return {col->begin(), col->end()};
}

auto require_error(const std::expected<Frame, Error>& frame, ErrorKind kind) {
    REQUIRE_FALSE(frame.has_value());
    REQUIRE(frame.error().kind == kind);
}

}  // namespace

TEST_CASE("Frame from_table adds a sequence index", "[frame][frame]") {
    runtime::Table table;
    table.add_column("x", Column<std::string>{"a", "b", "c"});
    auto frame = Frame::from_table("t", std::move(table));
    REQUIRE(frame.has_value());

    REQUIRE(frame->metadata().index_ids() == std::vector<std::string>{kDefaultIndexColumn});
    REQUIRE_FALSE(frame->metadata().index_columns().front().name.has_value());

    auto collected = frame->collect();
    REQUIRE(collected.has_value());
    REQUIRE(collected->columns[0].name == kDefaultIndexColumn);
    const auto* seq = std::get_if<Column<std::int64_t>>(collected->find(kDefaultIndexColumn));
    REQUIRE(seq != nullptr);
    REQUIRE((*seq)[2] == 2);
}

TEST_CASE("Frame from_table rejects an unknown index column", "[frame][frame]") {
    runtime::Table table;
    table.add_column("x", Column<std::int64_t>{1});
    auto frame = Frame::from_table("t", std::move(table), {"y"});

    require_error(frame, ErrorKind::SchemaResolution);
}

TEST_CASE("Locate all rows and columns is the identity", "[frame][locator]") {
    auto frame = prices();
    auto located = locate(frame, All{}, All{});
    REQUIRE(located.has_value());
    REQUIRE(located->metadata() == frame.metadata());

    auto local = require_local(located);
    REQUIRE(local.data.rows() == 4);
    REQUIRE(local.data.columns[0].name == "open");
    REQUIRE(local.data.columns[1].name == "close");

    auto unbounded = require_local(locate(frame, LabelRange{}, LabelRange{}));
    REQUIRE(unbounded.data.rows() == 4);
    REQUIRE(unbounded.data.columns.size() == 2);
}

TEST_CASE("Locate inclusive label range", "[frame][locator]") {
    auto frame = prices();

    SECTION("both bounds") {
        auto local = require_local(locate(
            frame, LabelRange{.start = std::int64_t{20}, .stop = std::int64_t{30}, .step = {}}));
        REQUIRE(days(local) == std::vector<std::int64_t>{20, 30});
    }

    SECTION("open start") {
        auto local = require_local(
            locate(frame, LabelRange{.start = {}, .stop = std::int64_t{20}, .step = {}}));
        REQUIRE(days(local) == std::vector<std::int64_t>{10, 20});
    }

    SECTION("bounds are cast to the index kind") {
        auto local = require_local(
            locate(frame, LabelRange{.start = std::string("30"), .stop = {}, .step = {}}));
        REQUIRE(days(local) == std::vector<std::int64_t>{30, 40});
    }

    SECTION("a bound that does not cast matches nothing") {
        auto local = require_local(
            locate(frame, LabelRange{.start = std::string("late"), .stop = {}, .step = {}}));
        REQUIRE(local.data.rows() == 0);
    }
}

TEST_CASE("Locate label lists", "[frame][locator]") {
    auto frame = prices();

    SECTION("empty list selects no rows") {
        auto local = require_local(locate(frame, LabelList{}));
        REQUIRE(local.data.rows() == 0);
        REQUIRE(local.data.columns.size() == 2);
    }

    SECTION("single label") {
        auto local = require_local(locate(frame, LabelList{.labels = {std::int64_t{30}}}));
        REQUIRE(days(local) == std::vector<std::int64_t>{30});
    }

    SECTION("several labels keep frame order") {
        auto local = require_local(
            locate(frame, LabelList{.labels = {std::int64_t{40}, std::int64_t{10}, 20.0}}));
        REQUIRE(days(local) == std::vector<std::int64_t>{10, 20, 40});
    }
}

TEST_CASE("Locate with a predicate", "[frame][locator]") {
    auto frame = prices();
    auto pred = ops::filter_cmp(ir::CompareOp::Gt, ops::filter_col("close"), ops::filter_dbl(3.0));

    auto local = require_local(locate(frame, Predicate{.expr = pred}));
    REQUIRE(days(local) == std::vector<std::int64_t>{30, 40});

    require_error(locate(frame, Predicate{.expr = nullptr}), ErrorKind::TypeMismatch);
}

TEST_CASE("Locate a single column yields a series", "[frame][locator]") {
    auto frame = prices();

    auto series = locate(frame, All{}, ir::ColumnRef{.name = "close"});
    REQUIRE(series.has_value());
    REQUIRE(series->is_series());
    REQUIRE(series->series_name() == std::optional<std::string>("close"));
    REQUIRE(series->metadata().data_columns() == std::vector<std::string>{"close"});

    auto local = require_local(series);
    REQUIRE(local.index.columns.size() == 1);
    REQUIRE(local.data.columns.size() == 1);

    // A column indexer on a series is one indexer too many.
    require_error(locate(*series, All{}, ir::ColumnRef{.name = "close"}),
                  ErrorKind::IndexingShape);
}

TEST_CASE("Locate a column list keeps the index in front", "[frame][locator]") {
    auto frame = prices();

    auto located = locate(frame, All{},
                          std::vector<ir::ColumnRef>{ir::ColumnRef{.name = "close"},
                                                     ir::ColumnRef{.name = "open"}});
    REQUIRE(located.has_value());
    REQUIRE_FALSE(located->is_series());

    auto collected = located->collect();
    REQUIRE(collected.has_value());
    REQUIRE(collected->columns[0].name == "day");
    REQUIRE(collected->columns[1].name == "close");
    REQUIRE(collected->columns[2].name == "open");
}

TEST_CASE("Locate rejects unsupported selections", "[frame][locator]") {
    auto frame = prices();

    require_error(locate(frame, Label{.value = std::int64_t{10}}),
                  ErrorKind::UnsupportedSelection);
    require_error(locate(frame, LabelRange{.start = {}, .stop = {}, .step = 2}),
                  ErrorKind::UnsupportedSelection);
    require_error(locate(frame, All{},
                         LabelRange{.start = std::string("open"), .stop = {}, .step = {}}),
                  ErrorKind::UnsupportedSelection);

    auto missing = locate(frame, All{},
                          std::vector<ir::ColumnRef>{ir::ColumnRef{.name = "volume"}});
    require_error(missing, ErrorKind::SchemaResolution);
    REQUIRE(missing.error().message.find("volume") != std::string::npos);
}

TEST_CASE("Locate label selection needs a single index column", "[frame][locator]") {
    runtime::Table table;
    table.add_column("a", Column<std::int64_t>{1, 2});
    table.add_column("b", Column<std::int64_t>{3, 4});
    table.add_column("v", Column<double>{0.5, 1.5});
    auto frame = Frame::from_table("t", std::move(table), {"a", "b"});
    REQUIRE(frame.has_value());

    require_error(locate(*frame, LabelList{.labels = {std::int64_t{1}}}),
                  ErrorKind::UnsupportedSelection);
    require_error(locate(*frame, LabelRange{.start = std::int64_t{1}, .stop = {}, .step = {}}),
                  ErrorKind::UnsupportedSelection);
}

TEST_CASE("Locate assign appends or replaces a column", "[frame][locator]") {
    auto frame = prices();

    SECTION("new column from an expression") {
        auto assigned =
            locate_assign(frame, All{}, ir::ColumnRef{.name = "spread"},
                          ops::binop(ir::ArithmeticOp::Sub, ops::col_ref("close"),
                                     ops::col_ref("open")));
        REQUIRE(assigned.has_value());
        REQUIRE(assigned->metadata().data_columns() ==
                std::vector<std::string>{"open", "close", "spread"});
        REQUIRE(assigned->metadata().declared_type("spread").value() == ScalarKind::Double);

        auto local = require_local(assigned);
        const auto* spread = std::get_if<Column<double>>(local.data.find("spread"));
        REQUIRE(spread != nullptr);
        REQUIRE((*spread)[3] == Catch::Approx(0.5));

        // The source frame is unchanged.
        REQUIRE(frame.metadata().data_columns().size() == 2);
    }

    SECTION("replacement changes the declared kind") {
        auto assigned = locate_assign(frame, LabelRange{}, ir::ColumnRef{.name = "open"},
                                      ops::int_lit(7));
        REQUIRE(assigned.has_value());
        REQUIRE(assigned->metadata().data_columns() ==
                std::vector<std::string>{"open", "close"});
        REQUIRE(assigned->metadata().declared_type("open").value() == ScalarKind::Int);
    }

    SECTION("a series of the same frame is aligned by position") {
        auto close = locate(frame, All{}, ir::ColumnRef{.name = "close"});
        REQUIRE(close.has_value());
        auto assigned =
            locate_assign(frame, All{}, ir::ColumnRef{.name = "copy"}, AssignValue{*close});
        auto local = require_local(assigned);
        const auto* copy = std::get_if<Column<double>>(local.data.find("copy"));
        REQUIRE(copy != nullptr);
        REQUIRE((*copy)[0] == 1.5);
    }
}

TEST_CASE("Locate assign takes the values of a derived series", "[frame][locator]") {
    runtime::Table table;
    table.add_column("A", Column<std::int64_t>{1, 1, 2, 2});
    table.add_column("B", Column<std::int64_t>{1, 2, 3, 4});
    auto frame = Frame::from_table("t", std::move(table));
    REQUIRE(frame.has_value());

    auto grouped = group_by(*frame, {"A"});
    REQUIRE(grouped.has_value());
    auto b = grouped->narrow("B");
    REQUIRE(b.has_value());
    auto running = b->cumsum();
    REQUIRE(running.has_value());

    auto assigned = locate_assign(*frame, All{}, ir::ColumnRef{.name = "C"}, AssignValue{*running});
    REQUIRE(assigned.has_value());
    REQUIRE(assigned->metadata().data_columns() == std::vector<std::string>{"A", "B", "C"});
    REQUIRE(assigned->metadata().declared_type("C").value() == ScalarKind::Int);

    auto local = require_local(assigned);
    const auto* c = std::get_if<Column<std::int64_t>>(local.data.find("C"));
    REQUIRE(c != nullptr);
    REQUIRE(std::vector<std::int64_t>(c->begin(), c->end()) ==
            std::vector<std::int64_t>{1, 3, 3, 7});
    const auto* kept = std::get_if<Column<std::int64_t>>(local.data.find("B"));
    REQUIRE(kept != nullptr);
    REQUIRE((*kept)[3] == 4);
}

TEST_CASE("Locate assign rejects a series with other rows", "[frame][locator]") {
    auto frame = prices();

    SECTION("a frame built from another table") {
        runtime::Table table;
        table.add_column("x", Column<std::int64_t>{1, 2, 3, 4});
        auto other = Frame::from_table("other", std::move(table));
        REQUIRE(other.has_value());
        require_error(
            locate_assign(frame, All{}, ir::ColumnRef{.name = "D"}, AssignValue{*other}),
            ErrorKind::TypeMismatch);
    }

    SECTION("a row-filtered series of the same frame") {
        auto pred =
            ops::filter_cmp(ir::CompareOp::Gt, ops::filter_col("close"), ops::filter_dbl(3.0));
        auto upper = locate(frame, Predicate{.expr = pred}, ir::ColumnRef{.name = "close"});
        REQUIRE(upper.has_value());
        require_error(
            locate_assign(frame, All{}, ir::ColumnRef{.name = "D"}, AssignValue{*upper}),
            ErrorKind::TypeMismatch);
    }
}

TEST_CASE("Locate assign rejects unsupported targets", "[frame][locator]") {
    auto frame = prices();
    auto value = ops::dbl_lit(1.0);

    require_error(locate_assign(frame, LabelList{.labels = {std::int64_t{10}}},
                                ir::ColumnRef{.name = "open"}, value),
                  ErrorKind::UnsupportedSelection);
    require_error(locate_assign(frame, All{}, All{}, value), ErrorKind::UnsupportedSelection);
    require_error(locate_assign(frame, All{}, ir::ColumnRef{.name = "day"}, value),
                  ErrorKind::UnsupportedSelection);
    require_error(locate_assign(frame, All{}, ir::ColumnRef{.name = "x"},
                                ops::col_ref("missing")),
                  ErrorKind::SchemaResolution);

    auto series = locate(frame, All{}, ir::ColumnRef{.name = "open"});
    REQUIRE(series.has_value());
    require_error(locate_assign(*series, All{}, ir::ColumnRef{.name = "open"}, value),
                  ErrorKind::IndexingShape);

    require_error(locate_assign(frame, All{}, ir::ColumnRef{.name = "x"}, AssignValue{frame}),
                  ErrorKind::TypeMismatch);
}

TEST_CASE("cast_label converts like a SQL cast", "[frame][locator]") {
    REQUIRE(cast_label(std::string("12"), ScalarKind::Int) ==
            std::optional<ir::LiteralValue>(std::int64_t{12}));
    REQUIRE(cast_label(2.9, ScalarKind::Int) == std::optional<ir::LiteralValue>(std::int64_t{2}));
    REQUIRE(cast_label(std::int64_t{3}, ScalarKind::Double) ==
            std::optional<ir::LiteralValue>(3.0));
    REQUIRE(cast_label(std::int64_t{3}, ScalarKind::String) ==
            std::optional<ir::LiteralValue>(std::string("3")));
    REQUIRE_FALSE(cast_label(std::string("x1"), ScalarKind::Int).has_value());
    REQUIRE_FALSE(cast_label(std::string("maybe"), ScalarKind::Bool).has_value());
}

TEST_CASE("Attribute access selects a data column", "[frame][locator]") {
    auto frame = prices();

    auto close = attribute(frame, "close");
    REQUIRE(close.has_value());
    REQUIRE(close->is_series());
    REQUIRE(close->series_name() == std::optional<std::string>{"close"});
    auto local = require_local(close);
    REQUIRE(days(local) == std::vector<std::int64_t>{10, 20, 30, 40});
    REQUIRE(local.data.columns.size() == 1);

    auto at = attribute(frame, "at");
    REQUIRE_FALSE(at.has_value());
    REQUIRE(at.error().kind == ErrorKind::NotImplemented);
    REQUIRE(at.error().message.find("pd.DataFrame.at") != std::string::npos);

    require_error(attribute(frame, "no_such_column"), ErrorKind::SchemaResolution);
    require_error(attribute(frame, "day"), ErrorKind::SchemaResolution);
    require_error(attribute(*close, "close"), ErrorKind::SchemaResolution);
}

TEST_CASE("Attribute series group by another attribute", "[frame][locator]") {
    runtime::Table table;
    table.add_column("A", Column<std::string>{"foo", "bar", "foo", "bar"});
    table.add_column("B", Column<std::int64_t>{1, 2, 3, 4});
    auto frame = Frame::from_table("t", std::move(table));
    REQUIRE(frame.has_value());

    auto b = attribute(*frame, "B");
    auto a = attribute(*frame, "A");
    REQUIRE(b.has_value());
    REQUIRE(a.has_value());
    auto grouped = group_by(*b, {*a});
    REQUIRE(grouped.has_value());
    auto local = require_local(grouped->sum());

    const auto* keys = std::get_if<Column<std::string>>(local.index.find("A"));
    const auto* sums = std::get_if<Column<std::int64_t>>(local.data.find("B"));
    REQUIRE(keys != nullptr);
    REQUIRE(sums != nullptr);
    REQUIRE(std::vector<std::string>(keys->begin(), keys->end()) ==
            std::vector<std::string>{"bar", "foo"});
    REQUIRE(std::vector<std::int64_t>(sums->begin(), sums->end()) ==
            std::vector<std::int64_t>{6, 4});
}
