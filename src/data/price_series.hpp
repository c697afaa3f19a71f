#pragma once

#include "date_utils.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// PricePoint / PriceSeries - daily adjusted closes for one symbol
// ---------------------------------------------------------------------------
struct PricePoint {
    int date = 0;          // YYYYMMDD
    double close = 0.0;    // adjusted close
};

struct PriceSeries {
    std::string symbol;
    std::vector<PricePoint> points;

    bool empty() const { return points.empty(); }
    size_t size() const { return points.size(); }

    int first_date() const { return points.empty() ? 0 : points.front().date; }
    int last_date() const { return points.empty() ? 0 : points.back().date; }

    // Dates must be valid and strictly increasing.
    void validate() const {
        if (symbol.empty()) {
            throw std::invalid_argument("PriceSeries requires a symbol");
        }
        for (size_t i = 0; i < points.size(); ++i) {
            if (!date_utils::is_valid_date(points[i].date)) {
                throw std::invalid_argument("PriceSeries " + symbol + " has invalid date " +
                                            std::to_string(points[i].date));
            }
            if (i > 0 && points[i].date <= points[i - 1].date) {
                throw std::invalid_argument("PriceSeries " + symbol +
                                            " dates not strictly increasing at " +
                                            std::to_string(points[i].date));
            }
        }
    }

    // Points with start <= date <= end. A zero bound is open.
    PriceSeries slice(int start, int end) const {
        PriceSeries out;
        out.symbol = symbol;
        for (const auto& p : points) {
            if (start != 0 && p.date < start) continue;
            if (end != 0 && p.date > end) break;
            out.points.push_back(p);
        }
        return out;
    }
};

inline bool is_valid_price(double price) {
    return std::isfinite(price) && price > 0.0;
}
