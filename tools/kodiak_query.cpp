#include <kodiak/kodiak.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

auto parse_agg_request(const std::string& text) -> std::optional<kodiak::AggRequest> {
    auto eq = text.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == text.size()) {
        return std::nullopt;
    }
    kodiak::AggRequest request;
    request.column = text.substr(0, eq);
    std::stringstream ss(text.substr(eq + 1));
    std::string function;
    while (std::getline(ss, function, ',')) {
        if (!function.empty()) {
            request.functions.push_back(function);
        }
    }
    return request;
}

auto threads_from_env() -> std::size_t {
    const char* env = std::getenv("KODIAK_THREADS");
    if (env == nullptr) {
        return 0;
    }
    try {
        return static_cast<std::size_t>(std::stoul(env));
    } catch (const std::exception&) {
        spdlog::warn("ignoring KODIAK_THREADS={}: not a thread count", env);
        return 0;
    }
}

}  // namespace

auto main(int argc, char** argv) -> int {
    CLI::App app{"kodiak_query: group a CSV file and print the result"};

    std::string csv_path;
    std::vector<std::string> by;
    std::string op;
    std::vector<std::string> aggs;
    std::vector<std::string> index;
    std::size_t threads = 0;
    std::size_t group_threshold = kodiak::runtime::ExecOptions{}.parallel_group_threshold;
    bool verbose = false;

    app.add_option("csv", csv_path, "CSV file to load")->required()->check(CLI::ExistingFile);
    app.add_option("--by", by, "Group key columns")->required()->delimiter(',');
    auto* op_opt = app.add_option("--op", op, "Group-by operation (sum, mean, cumsum, size, ...)");
    auto* agg_opt = app.add_option("--agg", aggs, "Aggregation as column=fn[,fn...]; repeatable");
    op_opt->excludes(agg_opt);
    app.add_option("--index", index, "Index columns of the loaded frame")->delimiter(',');
    app.add_option("--threads", threads,
                   "Grouped-map worker threads. Defaults to the KODIAK_THREADS environment "
                   "variable, then to the hardware concurrency.");
    app.add_option("--group-threshold", group_threshold,
                   "Minimum group count before grouped-map work runs in parallel");
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    if (op.empty() && aggs.empty()) {
        spdlog::error("one of --op or --agg is required");
        return 2;
    }
    if (threads == 0) {
        threads = threads_from_env();
    }
    kodiak::runtime::ExecOptions options;
    options.max_threads = threads;
    options.parallel_group_threshold = group_threshold;

    auto table = kodiak::runtime::read_csv_file(csv_path);
    if (!table) {
        spdlog::error("{}", table.error().format());
        return 1;
    }
    spdlog::info("loaded {} rows, {} columns from {}", table->rows(), table->columns.size(),
                 csv_path);

    auto frame = kodiak::Frame::from_table("input", std::move(*table), index);
    if (!frame) {
        spdlog::error("{}", frame.error().format());
        return 1;
    }
    std::vector<kodiak::GroupKeyInput> keys(by.begin(), by.end());
    auto grouped = kodiak::group_by(*frame, keys);
    if (!grouped) {
        spdlog::error("{}", grouped.error().format());
        return 1;
    }

    kodiak::AggregationSpec spec;
    for (const auto& text : aggs) {
        auto request = parse_agg_request(text);
        if (!request) {
            spdlog::error("malformed --agg '{}': expected column=fn[,fn...]", text);
            return 2;
        }
        spec.push_back(std::move(*request));
    }
    auto result = spec.empty() ? grouped->call(op) : grouped->aggregate(spec);
    if (!result) {
        spdlog::error("{}", result.error().format());
        return 1;
    }

    auto local = result->to_local(options);
    if (!local) {
        spdlog::error("{}", local.error().format());
        return 1;
    }
    spdlog::info("result: {} rows", local->index.rows());
    kodiak::ops::print(kodiak::display_table(*local), std::cout);
    return 0;
}
