#include <kodiak/core/column.hpp>
#include <kodiak/runtime/table.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>

using namespace kodiak;

TEST_CASE("Column<int64> basic operations", "[core][column]") {
    Column<std::int64_t> col{1, 2, 3, 4, 5};

    SECTION("size and element access") {
        REQUIRE(col.size() == 5);
        REQUIRE_FALSE(col.empty());
        REQUIRE(col.at(0) == 1);
        REQUIRE(col[4] == 5);
    }

    SECTION("push_back grows the column") {
        col.push_back(6);
        REQUIRE(col.size() == 6);
        REQUIRE(col.at(5) == 6);
    }

    SECTION("at() throws on out-of-bounds") {
        REQUIRE_THROWS_AS(col.at(100), std::out_of_range);
    }
}

TEST_CASE("Column filter and transform", "[core][column]") {
    Column<std::int64_t> col{1, 2, 3, 4, 5, 6};

    auto evens = col.filter([](std::int64_t x) { return x % 2 == 0; });
    REQUIRE(evens.size() == 3);
    REQUIRE(evens[2] == 6);

    auto halves = evens.transform([](std::int64_t x) { return static_cast<double>(x) / 4.0; });
    REQUIRE(halves.size() == 3);
    REQUIRE(halves[0] == 0.5);
}

TEST_CASE("Column<Bool> stores one value per row", "[core][column]") {
    Column<Bool> col{Bool{true}, Bool{false}, Bool{true}};

    REQUIRE(col.size() == 3);
    REQUIRE(col[0].value);
    REQUIRE_FALSE(col[1].value);
    REQUIRE(col[1] < col[2]);
}

TEST_CASE("Table add_column and lookup", "[runtime][table]") {
    runtime::Table table;
    table.add_column("price", Column<double>{1.5, 2.5});
    table.add_column("symbol", Column<std::string>{"A", "B"}, {true, false});

    REQUIRE(table.rows() == 2);
    REQUIRE(table.find("missing") == nullptr);
    REQUIRE(std::get_if<Column<double>>(table.find("price")) != nullptr);

    const auto* symbol = table.find_entry("symbol");
    REQUIRE(symbol != nullptr);
    REQUIRE_FALSE(runtime::is_null(*symbol, 0));
    REQUIRE(runtime::is_null(*symbol, 1));
    REQUIRE_FALSE(runtime::cell(*symbol, 1).has_value());

    auto schema = table.schema();
    REQUIRE(schema.size() == 2);
    REQUIRE(schema[0] == Field{.name = "price", .kind = ScalarKind::Double});
    REQUIRE(schema[1] == Field{.name = "symbol", .kind = ScalarKind::String});
}

TEST_CASE("Table add_entry replaces in place", "[runtime][table]") {
    runtime::Table table;
    table.add_column("a", Column<std::int64_t>{1, 2});
    table.add_column("b", Column<std::int64_t>{3, 4});

    runtime::ColumnBuilder builder(ScalarKind::Double);
    builder.append(runtime::ScalarValue{0.5});
    builder.append_null();
    table.add_entry(std::move(builder).finish("a"));

    REQUIRE(table.columns.size() == 2);
    REQUIRE(table.columns[0].name == "a");
    REQUIRE(runtime::kind_of(*table.columns[0].column) == ScalarKind::Double);
    REQUIRE(runtime::is_null(table.columns[0], 1));
}

TEST_CASE("ColumnBuilder copies cells with their nulls", "[runtime][table]") {
    runtime::Table source;
    source.add_column("x", Column<std::int64_t>{7, 0, 9}, {true, false, true});
    const auto& entry = *source.find_entry("x");

    runtime::ColumnBuilder builder(ScalarKind::Int);
    builder.append_from(entry, 2);
    builder.append_from(entry, 1);
    REQUIRE(builder.size() == 2);

    auto out = std::move(builder).finish("y");
    REQUIRE(out.name == "y");
    const auto* values = std::get_if<Column<std::int64_t>>(out.column.get());
    REQUIRE(values != nullptr);
    REQUIRE((*values)[0] == 9);
    REQUIRE(runtime::is_null(out, 1));
}

TEST_CASE("ColumnBuilder without nulls has no validity bitmap", "[runtime][table]") {
    runtime::ColumnBuilder builder(ScalarKind::String);
    builder.append(runtime::ScalarValue{std::string("a")});
    auto out = std::move(builder).finish("s");

    REQUIRE_FALSE(out.validity.has_value());
}
