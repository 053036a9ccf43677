#include <kodiak/runtime/csv.hpp>

#include <fmt/format.h>

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace kodiak::runtime {

namespace {

auto split_line(const std::string& line) -> std::vector<std::string> {
    std::vector<std::string> fields;
    std::string field;
    std::stringstream ss(line);
    while (std::getline(ss, field, ',')) {
        fields.push_back(field);
    }
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

auto is_missing(const std::string& text) -> bool {
    return text.empty() || text == "NaN" || text == "nan" || text == "NA";
}

auto try_parse_int(const std::string& text) -> std::optional<std::int64_t> {
    std::int64_t out = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, out);
    if (result.ec != std::errc() || result.ptr != end) {
        return std::nullopt;
    }
    return out;
}

auto try_parse_double(const std::string& text) -> std::optional<double> {
    char* end = nullptr;
    double out = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return out;
}

auto try_parse_bool(const std::string& text) -> std::optional<bool> {
    if (text == "true" || text == "True") {
        return true;
    }
    if (text == "false" || text == "False") {
        return false;
    }
    return std::nullopt;
}

auto infer_kind(const std::vector<std::string>& values) -> ScalarKind {
    bool all_int = true;
    bool all_double = true;
    bool all_bool = true;
    for (const auto& value : values) {
        if (is_missing(value)) {
            continue;
        }
        all_int = all_int && try_parse_int(value).has_value();
        all_double = all_double && try_parse_double(value).has_value();
        all_bool = all_bool && try_parse_bool(value).has_value();
    }
    if (all_int) {
        return ScalarKind::Int;
    }
    if (all_double) {
        return ScalarKind::Double;
    }
    if (all_bool) {
        return ScalarKind::Bool;
    }
    return ScalarKind::String;
}

auto parse_cell(ScalarKind kind, const std::string& text) -> std::optional<ScalarValue> {
    if (is_missing(text) && kind != ScalarKind::String) {
        return std::nullopt;
    }
    switch (kind) {
        case ScalarKind::Int:
            return ScalarValue{*try_parse_int(text)};
        case ScalarKind::Double:
            return ScalarValue{*try_parse_double(text)};
        case ScalarKind::Bool:
            return ScalarValue{Bool{*try_parse_bool(text)}};
        case ScalarKind::String:
            if (text.empty()) {
                return std::nullopt;
            }
            return ScalarValue{text};
    }
    return std::nullopt;
}

}  // namespace

auto read_csv(std::istream& input) -> std::expected<Table, Error> {
    auto fail = [](std::string message) {
        return std::unexpected(
            Error{.kind = ErrorKind::Configuration, .message = std::move(message)});
    };

    std::string header_line;
    if (!std::getline(input, header_line)) {
        return fail("csv is empty");
    }

    auto headers = split_line(header_line);
    if (headers.empty()) {
        return fail("csv has no headers");
    }

    std::vector<std::vector<std::string>> columns(headers.size());
    std::string line;
    std::size_t line_no = 1;
    while (std::getline(input, line)) {
        ++line_no;
        if (line.empty()) {
            continue;
        }
        auto fields = split_line(line);
        if (fields.size() != headers.size()) {
            return fail(fmt::format("csv line {} has {} fields, expected {}", line_no,
                                    fields.size(), headers.size()));
        }
        for (std::size_t i = 0; i < fields.size(); ++i) {
            columns[i].push_back(std::move(fields[i]));
        }
    }

    Table table;
    for (std::size_t i = 0; i < headers.size(); ++i) {
        ColumnBuilder builder(infer_kind(columns[i]));
        builder.reserve(columns[i].size());
        for (const auto& value : columns[i]) {
            builder.append(parse_cell(builder.kind(), value));
        }
        table.add_entry(std::move(builder).finish(headers[i]));
    }
    return table;
}

auto read_csv_file(std::string_view path) -> std::expected<Table, Error> {
    std::ifstream input{std::string(path)};
    if (!input) {
        return std::unexpected(Error{.kind = ErrorKind::Configuration,
                                     .message = "failed to open csv: " + std::string(path)});
    }
    return read_csv(input);
}

}  // namespace kodiak::runtime
