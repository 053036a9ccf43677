#include <kodiak/frame/unsupported.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <string>

namespace kodiak {

namespace {

// clang-format off
constexpr std::array kUnsupported = std::to_array<UnsupportedApi>({
    {"pd.DataFrame", "T", ApiKind::Property, ""},
    {"pd.DataFrame", "at", ApiKind::Property, "use loc with a label list of one element"},
    {"pd.DataFrame", "axes", ApiKind::Property, ""},
    {"pd.DataFrame", "blocks", ApiKind::Property, ""},
    {"pd.DataFrame", "empty", ApiKind::Property, ""},
    {"pd.DataFrame", "ftypes", ApiKind::Property, ""},
    {"pd.DataFrame", "iat", ApiKind::Property, ""},
    {"pd.DataFrame", "iloc", ApiKind::Property, "use loc with index labels or a boolean predicate"},
    {"pd.DataFrame", "is_copy", ApiKind::Property, ""},
    {"pd.DataFrame", "ix", ApiKind::Property, "use loc with index labels or a boolean predicate"},
    {"pd.DataFrame", "ndim", ApiKind::Property, ""},
    {"pd.DataFrame", "size", ApiKind::Property, ""},
    {"pd.DataFrame", "style", ApiKind::Property, ""},
    {"pd.DataFrame", "values", ApiKind::Property, ""},
    {"pd.DataFrame", "add", ApiKind::Function, ""},
    {"pd.DataFrame", "add_prefix", ApiKind::Function, ""},
    {"pd.DataFrame", "add_suffix", ApiKind::Function, ""},
    {"pd.DataFrame", "align", ApiKind::Function, ""},
    {"pd.DataFrame", "all", ApiKind::Function, ""},
    {"pd.DataFrame", "any", ApiKind::Function, ""},
    {"pd.DataFrame", "append", ApiKind::Function, ""},
    {"pd.DataFrame", "apply", ApiKind::Function, "use groupby(...).apply with a declared return schema"},
    {"pd.DataFrame", "applymap", ApiKind::Function, ""},
    {"pd.DataFrame", "as_blocks", ApiKind::Function, ""},
    {"pd.DataFrame", "as_matrix", ApiKind::Function, ""},
    {"pd.DataFrame", "asfreq", ApiKind::Function, ""},
    {"pd.DataFrame", "asof", ApiKind::Function, ""},
    {"pd.DataFrame", "astype", ApiKind::Function, ""},
    {"pd.DataFrame", "at_time", ApiKind::Function, ""},
    {"pd.DataFrame", "between_time", ApiKind::Function, ""},
    {"pd.DataFrame", "bfill", ApiKind::Function, ""},
    {"pd.DataFrame", "bool", ApiKind::Function, ""},
    {"pd.DataFrame", "boxplot", ApiKind::Function, ""},
    {"pd.DataFrame", "clip", ApiKind::Function, ""},
    {"pd.DataFrame", "clip_lower", ApiKind::Function, ""},
    {"pd.DataFrame", "clip_upper", ApiKind::Function, ""},
    {"pd.DataFrame", "combine", ApiKind::Function, ""},
    {"pd.DataFrame", "combine_first", ApiKind::Function, ""},
    {"pd.DataFrame", "compound", ApiKind::Function, ""},
    {"pd.DataFrame", "convert_objects", ApiKind::Function, ""},
    {"pd.DataFrame", "corrwith", ApiKind::Function, ""},
    {"pd.DataFrame", "cov", ApiKind::Function, ""},
    {"pd.DataFrame", "cummax", ApiKind::Function, "use groupby(...).cummax"},
    {"pd.DataFrame", "cummin", ApiKind::Function, "use groupby(...).cummin"},
    {"pd.DataFrame", "cumprod", ApiKind::Function, "use groupby(...).cumprod"},
    {"pd.DataFrame", "cumsum", ApiKind::Function, "use groupby(...).cumsum"},
    {"pd.DataFrame", "describe", ApiKind::Function, ""},
    {"pd.DataFrame", "diff", ApiKind::Function, ""},
    {"pd.DataFrame", "div", ApiKind::Function, ""},
    {"pd.DataFrame", "divide", ApiKind::Function, ""},
    {"pd.DataFrame", "dot", ApiKind::Function, ""},
    {"pd.DataFrame", "drop_duplicates", ApiKind::Function, ""},
    {"pd.DataFrame", "droplevel", ApiKind::Function, ""},
    {"pd.DataFrame", "duplicated", ApiKind::Function, ""},
    {"pd.DataFrame", "eq", ApiKind::Function, ""},
    {"pd.DataFrame", "equals", ApiKind::Function, ""},
    {"pd.DataFrame", "eval", ApiKind::Function, ""},
    {"pd.DataFrame", "ewm", ApiKind::Function, ""},
    {"pd.DataFrame", "expanding", ApiKind::Function, ""},
    {"pd.DataFrame", "ffill", ApiKind::Function, ""},
    {"pd.DataFrame", "filter", ApiKind::Function, "use groupby(...).filter"},
    {"pd.DataFrame", "first", ApiKind::Function, ""},
    {"pd.DataFrame", "first_valid_index", ApiKind::Function, ""},
    {"pd.DataFrame", "floordiv", ApiKind::Function, ""},
    {"pd.DataFrame", "ge", ApiKind::Function, ""},
    {"pd.DataFrame", "get_dtype_counts", ApiKind::Function, ""},
    {"pd.DataFrame", "get_ftype_counts", ApiKind::Function, ""},
    {"pd.DataFrame", "get_value", ApiKind::Function, ""},
    {"pd.DataFrame", "get_values", ApiKind::Function, ""},
    {"pd.DataFrame", "gt", ApiKind::Function, ""},
    {"pd.DataFrame", "hist", ApiKind::Function, ""},
    {"pd.DataFrame", "idxmax", ApiKind::Function, ""},
    {"pd.DataFrame", "idxmin", ApiKind::Function, ""},
    {"pd.DataFrame", "infer_objects", ApiKind::Function, ""},
    {"pd.DataFrame", "info", ApiKind::Function, ""},
    {"pd.DataFrame", "insert", ApiKind::Function, ""},
    {"pd.DataFrame", "interpolate", ApiKind::Function, ""},
    {"pd.DataFrame", "items", ApiKind::Function, ""},
    {"pd.DataFrame", "iterrows", ApiKind::Function, ""},
    {"pd.DataFrame", "itertuples", ApiKind::Function, ""},
    {"pd.DataFrame", "join", ApiKind::Function, ""},
    {"pd.DataFrame", "keys", ApiKind::Function, ""},
    {"pd.DataFrame", "last", ApiKind::Function, ""},
    {"pd.DataFrame", "last_valid_index", ApiKind::Function, ""},
    {"pd.DataFrame", "le", ApiKind::Function, ""},
    {"pd.DataFrame", "lookup", ApiKind::Function, ""},
    {"pd.DataFrame", "lt", ApiKind::Function, ""},
    {"pd.DataFrame", "mad", ApiKind::Function, ""},
    {"pd.DataFrame", "mask", ApiKind::Function, ""},
    {"pd.DataFrame", "median", ApiKind::Function, ""},
    {"pd.DataFrame", "melt", ApiKind::Function, ""},
    {"pd.DataFrame", "memory_usage", ApiKind::Function, ""},
    {"pd.DataFrame", "mod", ApiKind::Function, ""},
    {"pd.DataFrame", "mode", ApiKind::Function, ""},
    {"pd.DataFrame", "mul", ApiKind::Function, ""},
    {"pd.DataFrame", "multiply", ApiKind::Function, ""},
    {"pd.DataFrame", "ne", ApiKind::Function, ""},
    {"pd.DataFrame", "nlargest", ApiKind::Function, ""},
    {"pd.DataFrame", "nsmallest", ApiKind::Function, ""},
    {"pd.DataFrame", "nunique", ApiKind::Function, "use groupby(...).aggregate with the 'nunique' function"},
    {"pd.DataFrame", "pct_change", ApiKind::Function, ""},
    {"pd.DataFrame", "pivot", ApiKind::Function, ""},
    {"pd.DataFrame", "pivot_table", ApiKind::Function, ""},
    {"pd.DataFrame", "pop", ApiKind::Function, ""},
    {"pd.DataFrame", "pow", ApiKind::Function, ""},
    {"pd.DataFrame", "prod", ApiKind::Function, ""},
    {"pd.DataFrame", "product", ApiKind::Function, ""},
    {"pd.DataFrame", "quantile", ApiKind::Function, ""},
    {"pd.DataFrame", "query", ApiKind::Function, ""},
    {"pd.DataFrame", "radd", ApiKind::Function, ""},
    {"pd.DataFrame", "rank", ApiKind::Function, ""},
    {"pd.DataFrame", "rdiv", ApiKind::Function, ""},
    {"pd.DataFrame", "reindex", ApiKind::Function, ""},
    {"pd.DataFrame", "reindex_axis", ApiKind::Function, ""},
    {"pd.DataFrame", "reindex_like", ApiKind::Function, ""},
    {"pd.DataFrame", "rename", ApiKind::Function, ""},
    {"pd.DataFrame", "rename_axis", ApiKind::Function, ""},
    {"pd.DataFrame", "reorder_levels", ApiKind::Function, ""},
    {"pd.DataFrame", "replace", ApiKind::Function, ""},
    {"pd.DataFrame", "resample", ApiKind::Function, ""},
    {"pd.DataFrame", "rfloordiv", ApiKind::Function, ""},
    {"pd.DataFrame", "rmod", ApiKind::Function, ""},
    {"pd.DataFrame", "rmul", ApiKind::Function, ""},
    {"pd.DataFrame", "rolling", ApiKind::Function, ""},
    {"pd.DataFrame", "round", ApiKind::Function, ""},
    {"pd.DataFrame", "rpow", ApiKind::Function, ""},
    {"pd.DataFrame", "rsub", ApiKind::Function, ""},
    {"pd.DataFrame", "rtruediv", ApiKind::Function, ""},
    {"pd.DataFrame", "sample", ApiKind::Function, ""},
    {"pd.DataFrame", "select", ApiKind::Function, ""},
    {"pd.DataFrame", "select_dtypes", ApiKind::Function, ""},
    {"pd.DataFrame", "sem", ApiKind::Function, ""},
    {"pd.DataFrame", "set_axis", ApiKind::Function, ""},
    {"pd.DataFrame", "set_value", ApiKind::Function, ""},
    {"pd.DataFrame", "shift", ApiKind::Function, ""},
    {"pd.DataFrame", "slice_shift", ApiKind::Function, ""},
    {"pd.DataFrame", "sort_index", ApiKind::Function, ""},
    {"pd.DataFrame", "squeeze", ApiKind::Function, ""},
    {"pd.DataFrame", "stack", ApiKind::Function, ""},
    {"pd.DataFrame", "sub", ApiKind::Function, ""},
    {"pd.DataFrame", "subtract", ApiKind::Function, ""},
    {"pd.DataFrame", "swapaxes", ApiKind::Function, ""},
    {"pd.DataFrame", "swaplevel", ApiKind::Function, ""},
    {"pd.DataFrame", "tail", ApiKind::Function, ""},
    {"pd.DataFrame", "take", ApiKind::Function, ""},
    {"pd.DataFrame", "to_clipboard", ApiKind::Function, ""},
    {"pd.DataFrame", "to_csv", ApiKind::Function, ""},
    {"pd.DataFrame", "to_dense", ApiKind::Function, ""},
    {"pd.DataFrame", "to_feather", ApiKind::Function, ""},
    {"pd.DataFrame", "to_gbq", ApiKind::Function, ""},
    {"pd.DataFrame", "to_hdf", ApiKind::Function, ""},
    {"pd.DataFrame", "to_json", ApiKind::Function, ""},
    {"pd.DataFrame", "to_latex", ApiKind::Function, ""},
    {"pd.DataFrame", "to_msgpack", ApiKind::Function, ""},
    {"pd.DataFrame", "to_panel", ApiKind::Function, ""},
    {"pd.DataFrame", "to_parquet", ApiKind::Function, ""},
    {"pd.DataFrame", "to_period", ApiKind::Function, ""},
    {"pd.DataFrame", "to_pickle", ApiKind::Function, ""},
    {"pd.DataFrame", "to_records", ApiKind::Function, ""},
    {"pd.DataFrame", "to_sparse", ApiKind::Function, ""},
    {"pd.DataFrame", "to_sql", ApiKind::Function, ""},
    {"pd.DataFrame", "to_stata", ApiKind::Function, ""},
    {"pd.DataFrame", "to_timestamp", ApiKind::Function, ""},
    {"pd.DataFrame", "to_xarray", ApiKind::Function, ""},
    {"pd.DataFrame", "transform", ApiKind::Function, "use groupby(...).transform with a declared return kind"},
    {"pd.DataFrame", "transpose", ApiKind::Function, ""},
    {"pd.DataFrame", "truediv", ApiKind::Function, ""},
    {"pd.DataFrame", "truncate", ApiKind::Function, ""},
    {"pd.DataFrame", "tshift", ApiKind::Function, ""},
    {"pd.DataFrame", "tz_convert", ApiKind::Function, ""},
    {"pd.DataFrame", "tz_localize", ApiKind::Function, ""},
    {"pd.DataFrame", "unstack", ApiKind::Function, ""},
    {"pd.DataFrame", "update", ApiKind::Function, ""},
    {"pd.DataFrame", "where", ApiKind::Function, ""},
    {"pd.DataFrame", "xs", ApiKind::Function, ""},
    {"pd.DataFrameGroupBy", "corrwith", ApiKind::Property, ""},
    {"pd.DataFrameGroupBy", "dtypes", ApiKind::Property, ""},
    {"pd.DataFrameGroupBy", "groups", ApiKind::Property, ""},
    {"pd.DataFrameGroupBy", "indices", ApiKind::Property, ""},
    {"pd.DataFrameGroupBy", "ndim", ApiKind::Property, ""},
    {"pd.DataFrameGroupBy", "ngroups", ApiKind::Property, ""},
    {"pd.DataFrameGroupBy", "plot", ApiKind::Property, ""},
    {"pd.DataFrameGroupBy", "backfill", ApiKind::Function, ""},
    {"pd.DataFrameGroupBy", "bfill", ApiKind::Function, ""},
    {"pd.DataFrameGroupBy", "boxplot", ApiKind::Function, ""},
    {"pd.DataFrameGroupBy", "corr", ApiKind::Function, ""},
    {"pd.DataFrameGroupBy", "cov", ApiKind::Function, ""},
    {"pd.DataFrameGroupBy", "cumcount", ApiKind::Function, ""},
    {"pd.DataFrameGroupBy", "describe", ApiKind::Function, ""},
    {"pd.DataFrameGroupBy", "diff", ApiKind::Function, ""},
    {"pd.DataFrameGroupBy", "expanding", ApiKind::Function, ""},
    {"pd.DataFrameGroupBy", "ffill", ApiKind::Function, ""},
    {"pd.DataFrameGroupBy", "fillna", ApiKind::Function, ""},
    {"pd.DataFrameGroupBy", "head", ApiKind::Function, ""},
    {"pd.DataFrameGroupBy", "hist", ApiKind::Function, ""},
    {"pd.DataFrameGroupBy", "idxmax", ApiKind::Function, ""},
    {"pd.DataFrameGroupBy", "idxmin", ApiKind::Function, ""},
    {"pd.DataFrameGroupBy", "mad", ApiKind::Function, ""},
    {"pd.DataFrameGroupBy", "median", ApiKind::Function, ""},
    {"pd.DataFrameGroupBy", "ngroup", ApiKind::Function, ""},
    {"pd.DataFrameGroupBy", "nth", ApiKind::Function, ""},
    {"pd.DataFrameGroupBy", "nunique", ApiKind::Function, "use aggregate with the 'nunique' function"},
    {"pd.DataFrameGroupBy", "ohlc", ApiKind::Function, ""},
    {"pd.DataFrameGroupBy", "pad", ApiKind::Function, ""},
    {"pd.DataFrameGroupBy", "pct_change", ApiKind::Function, ""},
    {"pd.DataFrameGroupBy", "pipe", ApiKind::Function, ""},
    {"pd.DataFrameGroupBy", "prod", ApiKind::Function, "use cumprod for running products"},
    {"pd.DataFrameGroupBy", "quantile", ApiKind::Function, ""},
    {"pd.DataFrameGroupBy", "rank", ApiKind::Function, ""},
    {"pd.DataFrameGroupBy", "resample", ApiKind::Function, ""},
    {"pd.DataFrameGroupBy", "rolling", ApiKind::Function, ""},
    {"pd.DataFrameGroupBy", "sem", ApiKind::Function, ""},
    {"pd.DataFrameGroupBy", "shift", ApiKind::Function, ""},
    {"pd.DataFrameGroupBy", "tail", ApiKind::Function, ""},
    {"pd.DataFrameGroupBy", "take", ApiKind::Function, ""},
    {"pd.DataFrameGroupBy", "tshift", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "corrwith", ApiKind::Property, ""},
    {"pd.SeriesGroupBy", "dtypes", ApiKind::Property, ""},
    {"pd.SeriesGroupBy", "groups", ApiKind::Property, ""},
    {"pd.SeriesGroupBy", "indices", ApiKind::Property, ""},
    {"pd.SeriesGroupBy", "ndim", ApiKind::Property, ""},
    {"pd.SeriesGroupBy", "ngroups", ApiKind::Property, ""},
    {"pd.SeriesGroupBy", "plot", ApiKind::Property, ""},
    {"pd.SeriesGroupBy", "backfill", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "bfill", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "boxplot", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "corr", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "cov", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "cumcount", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "describe", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "diff", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "expanding", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "ffill", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "fillna", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "head", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "hist", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "idxmax", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "idxmin", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "mad", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "median", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "ngroup", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "nlargest", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "nsmallest", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "nth", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "nunique", ApiKind::Function, "use aggregate with the 'nunique' function"},
    {"pd.SeriesGroupBy", "ohlc", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "pad", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "pct_change", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "pipe", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "prod", ApiKind::Function, "use cumprod for running products"},
    {"pd.SeriesGroupBy", "quantile", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "rank", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "resample", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "rolling", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "sem", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "shift", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "tail", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "take", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "tshift", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "unique", ApiKind::Function, ""},
    {"pd.SeriesGroupBy", "value_counts", ApiKind::Function, ""},
});
// clang-format on

}  // namespace

auto lookup_unsupported(std::string_view class_name, std::string_view name) noexcept
    -> const UnsupportedApi* {
    auto it = std::find_if(kUnsupported.begin(), kUnsupported.end(),
                           [&](const UnsupportedApi& api) {
                               return api.class_name == class_name && api.name == name;
                           });
    return it == kUnsupported.end() ? nullptr : &*it;
}

auto unsupported_apis() noexcept -> std::span<const UnsupportedApi> {
    return kUnsupported;
}

auto unsupported_error(const UnsupportedApi& api) -> Error {
    std::string message =
        api.kind == ApiKind::Property
            ? fmt::format("The property `{}.{}` is not implemented yet.", api.class_name, api.name)
            : fmt::format("The method `{}.{}()` is not implemented yet.", api.class_name,
                          api.name);
    if (!api.suggestion.empty()) {
        message += fmt::format(" Hint: {}.", api.suggestion);
    }
    return Error{.kind = ErrorKind::NotImplemented, .message = std::move(message)};
}

}  // namespace kodiak
