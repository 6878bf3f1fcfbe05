#pragma once

#include <labmarker/common/class_traits.hpp>

// Set log level based on whether we're in DEBUG mode
// Needs to be done before including spdlog
#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/ranges.h>

#include <chrono>
#include <cstdlib>
#include <string_view>

#if defined(TRACE)
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#define SPDLOG_FUNCTION __PRETTY_FUNCTION__
#elif defined(DEBUG)
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#define SPDLOG_FUNCTION __PRETTY_FUNCTION__
#elif defined(RELEASE)
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_ERROR
#else
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#endif

#include <spdlog/cfg/helpers.h>
#include <spdlog/common.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

// Wrappers for spdlog macros
#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_CRITICAL(__VA_ARGS__)

#ifdef DEBUG
#define DEBUG_TIME(expr)                                                                                               \
    [&]() {                                                                                                            \
        ::labmarker::detail::DebugTimeHelper debug_time_helper__(#expr);                                               \
        return expr;                                                                                                   \
    }()
#else
#define DEBUG_TIME(expr) expr
#endif

namespace labmarker {
namespace detail {

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
struct DebugTimeHelper : NonMovable
{
    explicit DebugTimeHelper(std::string_view str)
        : str_expr(str) {
        start = std::chrono::steady_clock::now();
    }

    ~DebugTimeHelper() {
        const auto& stop = std::chrono::steady_clock::now();
        LOG_DEBUG("{} took {:%S}s to execute", str_expr, stop - start);
    }

    std::string_view str_expr;
    std::chrono::steady_clock::time_point start;
};

} // namespace detail

inline void init_loggers() {
    // Log to stderr, so that stdout is left to the marking output
    spdlog::set_default_logger(spdlog::stderr_color_st("labmarker"));

#if defined(TRACE)
    spdlog::set_level(spdlog::level::trace);
#elif defined(DEBUG)
    spdlog::set_level(spdlog::level::debug);
#elif defined(RELEASE)
    spdlog::set_level(spdlog::level::err);
#else
    spdlog::set_level(spdlog::level::info);
#endif

    // Override any previously set log-level with the enviornment variable LOG_LEVEL, if set
    if (const char* env_levels = std::getenv("LOG_LEVEL"); env_levels != nullptr) {
        spdlog::cfg::helpers::load_levels(env_levels);
    }

#if defined(DEBUG) || defined(TRACE)
    spdlog::set_pattern("[%T.%e] [%^%8l%$] [pid %6P] [%30!!@%20!s:%-4#] %v");
#else
    // Pattern:
    //   time - [HH:MM:SS.MS]
    //   level (colored, center aligned) - [ info ]
    //   message - "foo bar"
    spdlog::set_pattern("[%T.%e] [%^%=8l%$] %v");
#endif
}

} // namespace labmarker
