#pragma once

#include "core/errors.hpp"
#include "date_utils.hpp"

#include <string>
#include <vector>

enum class RebalanceFrequency { DAILY, WEEKLY, MONTHLY, QUARTERLY, YEARLY, NONE };

// ---------------------------------------------------------------------------
// Rebalance calendar: a date is a rebalance date when it is the first trading
// day of a new period relative to the previous trading day on the axis
// ---------------------------------------------------------------------------
namespace rebalance {

inline const char* to_string(RebalanceFrequency f) {
    switch (f) {
        case RebalanceFrequency::DAILY:     return "daily";
        case RebalanceFrequency::WEEKLY:    return "weekly";
        case RebalanceFrequency::MONTHLY:   return "monthly";
        case RebalanceFrequency::QUARTERLY: return "quarterly";
        case RebalanceFrequency::YEARLY:    return "yearly";
        case RebalanceFrequency::NONE:      return "none";
    }
    return "unknown";
}

inline RebalanceFrequency parse(const std::string& text) {
    if (text == "daily") return RebalanceFrequency::DAILY;
    if (text == "weekly") return RebalanceFrequency::WEEKLY;
    if (text == "monthly") return RebalanceFrequency::MONTHLY;
    if (text == "quarterly") return RebalanceFrequency::QUARTERLY;
    if (text == "yearly" || text == "annually") return RebalanceFrequency::YEARLY;
    if (text == "none") return RebalanceFrequency::NONE;
    throw InvalidConfigError("rebalancing_frequency", "unknown frequency '" + text + "'");
}

inline bool is_rebalance_date(int prev_date, int date, RebalanceFrequency f) {
    using namespace date_utils;
    switch (f) {
        case RebalanceFrequency::DAILY:
            return true;
        case RebalanceFrequency::WEEKLY:
            return iso_week_index(date) != iso_week_index(prev_date);
        case RebalanceFrequency::MONTHLY:
            return year_of(date) != year_of(prev_date) || month_of(date) != month_of(prev_date);
        case RebalanceFrequency::QUARTERLY:
            return year_of(date) != year_of(prev_date) ||
                   quarter_of(date) != quarter_of(prev_date);
        case RebalanceFrequency::YEARLY:
            return year_of(date) != year_of(prev_date);
        case RebalanceFrequency::NONE:
            return false;
    }
    return false;
}

// Indices on `dates` where the portfolio is (re)allocated. Index 0 is always
// included as the initial allocation.
inline std::vector<size_t> schedule(const std::vector<int>& dates, RebalanceFrequency f) {
    std::vector<size_t> out;
    if (dates.empty()) return out;
    out.push_back(0);
    for (size_t t = 1; t < dates.size(); ++t) {
        if (is_rebalance_date(dates[t - 1], dates[t], f)) out.push_back(t);
    }
    return out;
}

}  // namespace rebalance
