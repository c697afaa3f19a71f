#pragma once

#include "core/errors.hpp"
#include "data/price_series.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// AlignedPriceMatrix - every symbol priced on one shared trading-date axis
// ---------------------------------------------------------------------------
struct AlignedPriceMatrix {
    std::vector<int> dates;
    std::vector<std::string> symbols;
    std::vector<std::vector<double>> prices;     // prices[symbol][date_idx]
    std::vector<size_t> first_quote_index;       // first date with a real quote
    std::vector<int> filled_count;               // cells forward/back filled

    size_t num_dates() const { return dates.size(); }
    size_t num_symbols() const { return symbols.size(); }

    int index_of(const std::string& symbol) const {
        for (size_t i = 0; i < symbols.size(); ++i) {
            if (symbols[i] == symbol) return static_cast<int>(i);
        }
        return -1;
    }

    const std::vector<double>& column(const std::string& symbol) const {
        int idx = index_of(symbol);
        if (idx < 0) {
            throw InsufficientDataError("Symbol not in aligned matrix: " + symbol, symbol);
        }
        return prices[static_cast<size_t>(idx)];
    }

    bool is_consistent() const {
        if (prices.size() != symbols.size()) return false;
        for (const auto& col : prices) {
            if (col.size() != dates.size()) return false;
        }
        return true;
    }
};

// One extra series (benchmark, signal) aligned onto an existing axis.
struct AlignedSeries {
    std::string symbol;
    std::vector<double> prices;
    size_t first_quote_index = 0;
    int filled_count = 0;
};

namespace alignment {

constexpr size_t MIN_ALIGNED_DATES = 2;

// A reference series may be back-filled over at most this many leading axis
// dates before its first real quote.
constexpr size_t MAX_LEADING_FILL_DATES = 5;

namespace detail {

// PriceSeries preconditions reported as a data problem for that symbol.
inline void validate_series(const PriceSeries& series) {
    try {
        series.validate();
    } catch (const std::invalid_argument& e) {
        throw InsufficientDataError(e.what(), series.symbol);
    }
}

// Fill `axis` positions from `series` (already restricted to the axis span).
// Missing dates take the most recent known price; leading gaps take the
// first available price.
inline AlignedSeries fill_onto_axis(const PriceSeries& series, const std::vector<int>& axis) {
    AlignedSeries out;
    out.symbol = series.symbol;
    out.prices.assign(axis.size(), 0.0);

    size_t p = 0;
    bool seen = false;
    double last = 0.0;
    for (size_t i = 0; i < axis.size(); ++i) {
        while (p < series.points.size() && series.points[p].date < axis[i]) {
            // Quotes between axis dates still advance the carried price.
            last = series.points[p].close;
            if (!seen) out.first_quote_index = i;
            seen = true;
            ++p;
        }
        if (p < series.points.size() && series.points[p].date == axis[i]) {
            last = series.points[p].close;
            if (!seen) out.first_quote_index = i;
            seen = true;
            out.prices[i] = last;
            ++p;
            continue;
        }
        if (seen) {
            out.prices[i] = last;
        } else {
            out.prices[i] = series.points.front().close;
        }
        out.filled_count++;
    }
    if (!seen) out.first_quote_index = axis.size();
    return out;
}

}  // namespace detail

// Merge N series onto the union of their trading dates within [start, end]
// (a zero bound is open).
inline AlignedPriceMatrix align_prices(const std::vector<PriceSeries>& series,
                                       int start = 0, int end = 0) {
    if (series.empty()) {
        throw InsufficientDataError("No price series supplied");
    }

    std::vector<PriceSeries> sliced;
    sliced.reserve(series.size());
    std::set<std::string> seen_symbols;
    for (const auto& s : series) {
        detail::validate_series(s);
        if (!seen_symbols.insert(s.symbol).second) {
            throw InvalidConfigError("prices", "duplicate price series for symbol " + s.symbol);
        }
        auto window = s.slice(start, end);
        if (window.empty()) {
            throw InsufficientDataError(
                "No price points for " + s.symbol + " in the requested period", s.symbol);
        }
        if (window.size() < MIN_ALIGNED_DATES) {
            throw InsufficientDataError(
                "Fewer than 2 price points for " + s.symbol + " in the requested period",
                s.symbol);
        }
        sliced.push_back(std::move(window));
    }

    std::set<int> union_dates;
    for (const auto& s : sliced) {
        for (const auto& p : s.points) union_dates.insert(p.date);
    }
    if (union_dates.size() < MIN_ALIGNED_DATES) {
        throw InsufficientDataError("Fewer than 2 aligned trading dates",
                                    sliced.size() == 1 ? sliced.front().symbol : "");
    }

    AlignedPriceMatrix m;
    m.dates.assign(union_dates.begin(), union_dates.end());
    for (const auto& s : sliced) {
        auto col = detail::fill_onto_axis(s, m.dates);
        m.symbols.push_back(s.symbol);
        m.prices.push_back(std::move(col.prices));
        m.first_quote_index.push_back(col.first_quote_index);
        m.filled_count.push_back(col.filled_count);
    }
    return m;
}

// Align a single series onto an existing date axis with the same fill rules.
// The series needs two real observations over the axis (a quote carried in
// from before the first date counts as one) and its first quote no later than
// MAX_LEADING_FILL_DATES into the axis.
inline AlignedSeries align_to_axis(const PriceSeries& series, const std::vector<int>& axis) {
    detail::validate_series(series);
    if (axis.size() < MIN_ALIGNED_DATES) {
        throw InsufficientDataError("Axis has fewer than 2 dates", series.symbol);
    }
    auto window = series.slice(0, axis.back());
    size_t observed = 0;
    bool carried_in = false;
    for (const auto& p : window.points) {
        if (p.date >= axis.front()) {
            ++observed;
        } else {
            carried_in = true;
        }
    }
    if (observed == 0) {
        throw InsufficientDataError(
            "No price points for " + series.symbol + " within the aligned period", series.symbol);
    }
    if (observed + (carried_in ? 1 : 0) < MIN_ALIGNED_DATES) {
        throw InsufficientDataError(
            "Fewer than 2 price points for " + series.symbol + " within the aligned period",
            series.symbol);
    }

    auto aligned = detail::fill_onto_axis(window, axis);
    if (aligned.first_quote_index > MAX_LEADING_FILL_DATES) {
        throw InsufficientDataError(
            series.symbol + " starts " + std::to_string(aligned.first_quote_index) +
                " dates after the aligned period begins",
            series.symbol);
    }
    return aligned;
}

}  // namespace alignment
