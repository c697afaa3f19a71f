#pragma once

#include "data/price_alignment.hpp"

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

// One price column plus the index of its first real (unfilled) quote.
struct PriceColumn {
    const std::vector<double>* prices = nullptr;
    size_t first_quote_index = 0;

    explicit operator bool() const { return prices != nullptr; }
};

// ---------------------------------------------------------------------------
// MarketView - read-only window onto the aligned history up to date index t
//
// Nothing after t is reachable: every accessor taking a date index rejects
// indices past t, so strategies cannot look ahead.
// ---------------------------------------------------------------------------
class MarketView {
public:
    MarketView(const AlignedPriceMatrix& matrix,
               const std::map<std::string, AlignedSeries>& references, size_t t)
        : matrix_(matrix), references_(references), t_(t) {
        if (t_ >= matrix_.num_dates()) {
            throw std::out_of_range("MarketView index past end of date axis");
        }
    }

    size_t index() const { return t_; }
    int date() const { return matrix_.dates[t_]; }
    size_t num_symbols() const { return matrix_.num_symbols(); }
    const std::string& symbol(size_t i) const { return matrix_.symbols[i]; }

    double price(size_t i, size_t k) const {
        if (k > t_) throw std::out_of_range("MarketView lookahead at index " + std::to_string(k));
        return matrix_.prices[i][k];
    }

    double current_price(size_t i) const { return matrix_.prices[i][t_]; }

    // Real quotes available for symbol i up to t (filled leading cells excluded).
    size_t history_length(size_t i) const {
        size_t first = matrix_.first_quote_index[i];
        return first > t_ ? 0 : t_ - first + 1;
    }

    // True when at least `days` price changes of real history end at t.
    bool has_history(size_t i, int days) const {
        return history_length(i) >= static_cast<size_t>(days) + 1;
    }

    PriceColumn column(size_t i) const {
        return {&matrix_.prices[i], matrix_.first_quote_index[i]};
    }

    // Held symbol first, then reference series. Empty column when absent.
    PriceColumn find_column(const std::string& symbol) const {
        int idx = matrix_.index_of(symbol);
        if (idx >= 0) return column(static_cast<size_t>(idx));
        auto it = references_.find(symbol);
        if (it != references_.end()) {
            return {&it->second.prices, it->second.first_quote_index};
        }
        return {};
    }

    bool column_has_history(const PriceColumn& col, int days) const {
        if (!col || col.first_quote_index > t_) return false;
        return t_ - col.first_quote_index >= static_cast<size_t>(days);
    }

private:
    const AlignedPriceMatrix& matrix_;
    const std::map<std::string, AlignedSeries>& references_;
    size_t t_;
};
