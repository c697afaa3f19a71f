#pragma once

#include "backtest/backtest_result.hpp"
#include "date_utils.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Parquet export of the per-date series (same columns as result_io::to_csv)
// ---------------------------------------------------------------------------
namespace result_parquet {

namespace detail {

inline void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error(what + ": " + status.ToString());
    }
}

inline std::shared_ptr<arrow::Array> double_array(const std::vector<double>& values) {
    arrow::DoubleBuilder b;
    check(b.AppendValues(values), "Appending Parquet column");
    std::shared_ptr<arrow::Array> arr;
    check(b.Finish(&arr), "Finishing Parquet column");
    return arr;
}

}  // namespace detail

inline std::vector<std::string> column_names(const BacktestResult& result) {
    std::vector<std::string> names = {"date", "portfolio_value", "return", "drawdown"};
    for (const auto& s : result.symbols) names.push_back("weight_" + s);
    return names;
}

inline std::shared_ptr<arrow::Table> to_table(const BacktestResult& result) {
    auto names = column_names(result);
    arrow::FieldVector fields;
    fields.push_back(arrow::field(names[0], arrow::utf8()));
    for (size_t c = 1; c < names.size(); ++c) {
        fields.push_back(arrow::field(names[c], arrow::float64()));
    }
    auto schema = arrow::schema(fields);

    std::vector<std::shared_ptr<arrow::Array>> arrays;
    {
        arrow::StringBuilder b;
        for (int d : result.dates) {
            detail::check(b.Append(date_utils::format_date(d)), "Appending Parquet column");
        }
        std::shared_ptr<arrow::Array> arr;
        detail::check(b.Finish(&arr), "Finishing Parquet column");
        arrays.push_back(arr);
    }
    arrays.push_back(detail::double_array(result.portfolio_values));
    arrays.push_back(detail::double_array(result.returns));
    arrays.push_back(detail::double_array(result.drawdown));
    for (const auto& w : result.weights) arrays.push_back(detail::double_array(w));

    return arrow::Table::Make(schema, arrays);
}

// Write with ZSTD compression. Throws std::runtime_error on any Arrow failure.
inline void write(const BacktestResult& result, const std::string& path) {
    auto table = to_table(result);

    auto outfile_result = arrow::io::FileOutputStream::Open(path);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet output file: " + path);
    }
    auto outfile = *outfile_result;

    auto props = parquet::WriterProperties::Builder()
        .compression(parquet::Compression::ZSTD)
        ->build();

    auto num_rows = static_cast<int64_t>(result.dates.size());
    detail::check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile,
                                             /*chunk_size=*/std::max<int64_t>(num_rows, 1),
                                             props),
                  "Failed to write Parquet " + path);
    detail::check(outfile->Close(), "Closing Parquet output " + path);
}

}  // namespace result_parquet
