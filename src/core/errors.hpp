#pragma once

#include <stdexcept>
#include <string>
#include <utility>

// ---------------------------------------------------------------------------
// BacktestError - base of every error a backtest run reports to its caller
// ---------------------------------------------------------------------------
class BacktestError : public std::runtime_error {
public:
    explicit BacktestError(const std::string& what) : std::runtime_error(what) {}
};

// Not enough aligned history to simulate.
class InsufficientDataError : public BacktestError {
public:
    explicit InsufficientDataError(const std::string& what, std::string symbol = {})
        : BacktestError(what), symbol_(std::move(symbol)) {}

    const std::string& symbol() const { return symbol_; }

private:
    std::string symbol_;
};

// Strategy parameters out of bounds, allocations not summing to 1.0, etc.
class InvalidConfigError : public BacktestError {
public:
    InvalidConfigError(const std::string& parameter, const std::string& what)
        : BacktestError(parameter + ": " + what), parameter_(parameter) {}

    const std::string& parameter() const { return parameter_; }

private:
    std::string parameter_;
};

// Non-positive or non-finite price that cannot be recovered from.
class InvalidPriceError : public BacktestError {
public:
    InvalidPriceError(const std::string& what, std::string symbol, int date)
        : BacktestError(what), symbol_(std::move(symbol)), date_(date) {}

    const std::string& symbol() const { return symbol_; }
    int date() const { return date_; }

private:
    std::string symbol_;
    int date_ = 0;
};
