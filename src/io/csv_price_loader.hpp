#pragma once

#include "core/log.hpp"
#include "data/price_series.hpp"
#include "date_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// CSV price loading: "date,...,close[,adj_close]" files with a header row
// ---------------------------------------------------------------------------
namespace csv_prices {

namespace detail {

inline std::vector<std::string> split_row(const std::string& line) {
    std::vector<std::string> cols;
    std::istringstream ss(line);
    std::string col;
    while (std::getline(ss, col, ',')) {
        while (!col.empty() && (col.back() == '\r' || col.back() == ' ')) col.pop_back();
        size_t lead = 0;
        while (lead < col.size() && col[lead] == ' ') ++lead;
        cols.push_back(col.substr(lead));
    }
    return cols;
}

inline std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline bool parse_double(const std::string& text, double& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    out = std::strtod(text.c_str(), &end);
    return end != nullptr && *end == '\0';
}

}  // namespace detail

// Parse CSV text. Rows are sorted by date; a repeated date keeps the last row.
inline PriceSeries parse(std::istream& in, const std::string& symbol,
                         const std::string& source = "<stream>") {
    std::string line;
    if (!std::getline(in, line)) {
        throw std::runtime_error("Empty price file: " + source);
    }
    auto header = detail::split_row(line);
    int date_col = -1, close_col = -1, adj_col = -1;
    for (size_t i = 0; i < header.size(); ++i) {
        auto name = detail::lower(header[i]);
        if (name == "date") date_col = static_cast<int>(i);
        else if (name == "close") close_col = static_cast<int>(i);
        else if (name == "adj_close" || name == "adj close" || name == "adjclose")
            adj_col = static_cast<int>(i);
    }
    int price_col = adj_col >= 0 ? adj_col : close_col;
    if (date_col < 0 || price_col < 0) {
        throw std::runtime_error("Price file needs 'date' and 'close' or 'adj_close' columns: " +
                                 source);
    }

    PriceSeries series;
    series.symbol = symbol;
    int line_no = 1;
    int skipped = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty() || line == "\r") continue;
        auto cols = detail::split_row(line);
        size_t need = static_cast<size_t>(std::max(date_col, price_col)) + 1;
        double close = 0.0;
        int date = cols.size() >= need ? date_utils::parse_date(cols[date_col]) : 0;
        if (date == 0 || !detail::parse_double(cols[price_col], close)) {
            basket_log::logger()->warn("{}:{} malformed row skipped", source, line_no);
            ++skipped;
            continue;
        }
        series.points.push_back({date, close});
    }

    std::stable_sort(series.points.begin(), series.points.end(),
                     [](const PricePoint& a, const PricePoint& b) { return a.date < b.date; });
    std::vector<PricePoint> unique;
    unique.reserve(series.points.size());
    for (const auto& p : series.points) {
        if (!unique.empty() && unique.back().date == p.date) {
            unique.back() = p;
        } else {
            unique.push_back(p);
        }
    }
    series.points = std::move(unique);

    basket_log::logger()->debug("Loaded {} points for {} from {} ({} skipped)",
                                series.points.size(), symbol, source, skipped);
    return series;
}

inline PriceSeries load(const std::string& path, const std::string& symbol) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Cannot open price file: " + path);
    }
    return parse(f, symbol, path);
}

// Every <SYMBOL>.csv in `dir`, sorted by symbol.
inline std::vector<PriceSeries> load_directory(const std::string& dir) {
    namespace fs = std::filesystem;
    if (!fs::is_directory(dir)) {
        throw std::runtime_error("Price directory not found: " + dir);
    }
    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".csv") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    std::vector<PriceSeries> out;
    for (const auto& path : files) {
        out.push_back(load(path.string(), path.stem().string()));
    }
    return out;
}

}  // namespace csv_prices
