#include <kodiak/kodiak.hpp>

#include <fmt/core.h>

#include <cstdint>
#include <string>

auto main() -> int {
    kodiak::runtime::Table trades;
    trades.add_column("symbol", kodiak::Column<std::string>{"A", "B", "A", "C", "B"});
    trades.add_column("price", kodiak::Column<double>{100.5, 200.3, 50.0, 175.8, 320.1});
    trades.add_column("qty", kodiak::Column<std::int64_t>{10, 5, 20, 1, 2});

    auto frame = kodiak::Frame::from_table("trades", std::move(trades));
    if (!frame) {
        fmt::print("error: {}\n", frame.error().format());
        return 1;
    }

    // Rows with price > 100, price column only
    fmt::print("=== loc ===\n");
    auto expensive = kodiak::locate(
        *frame,
        kodiak::Predicate{.expr = kodiak::ops::filter_cmp(kodiak::ir::CompareOp::Gt,
                                                          kodiak::ops::filter_col("price"),
                                                          kodiak::ops::filter_dbl(100.0))},
        kodiak::ir::ColumnRef{.name = "price"});
    if (!expensive) {
        fmt::print("error: {}\n", expensive.error().format());
        return 1;
    }
    if (auto table = expensive->collect(); table) {
        kodiak::ops::print(*table);
    }

    fmt::print("\n=== groupby ===\n");
    auto grouped = kodiak::group_by(*frame, {"symbol"});
    if (!grouped) {
        fmt::print("error: {}\n", grouped.error().format());
        return 1;
    }
    auto summary = grouped->aggregate({kodiak::AggRequest{.column = "price",
                                                          .functions = {"min", "max"}},
                                       kodiak::AggRequest{.column = "qty", .functions = {"sum"}}});
    if (!summary) {
        fmt::print("error: {}\n", summary.error().format());
        return 1;
    }
    auto table = summary->collect();
    if (!table) {
        fmt::print("error: {}\n", table.error().format());
        return 1;
    }
    kodiak::ops::print(*table);
    fmt::print("plan root: node id={}, {} data columns\n", summary->plan()->id(),
               summary->metadata().data_columns().size());
    return 0;
}
