#pragma once

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

// ---------------------------------------------------------------------------
// Shared "basketsim" logger (thread-safe sink, created on first use)
// ---------------------------------------------------------------------------
namespace basket_log {

inline const std::string LOGGER_NAME = "basketsim";

inline std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get(LOGGER_NAME)) return existing;
        return spdlog::stderr_color_mt(LOGGER_NAME);
    }();
    return instance;
}

inline void set_level(const std::string& level) {
    logger()->set_level(spdlog::level::from_str(level));
}

}  // namespace basket_log
