#pragma once

// Logging for dnd using spdlog
//
// Log levels (compile-time filtered via SPDLOG_ACTIVE_LEVEL):
//   - TRACE: Very verbose, per-call logging (e.g., every registration, every report)
//   - DEBUG: State changes (e.g., collision target changed, drop committed)
//   - INFO:  Normal operational messages (e.g., config loaded, scenario replayed)
//   - WARN:  Warning conditions
//   - ERROR: Error conditions
//
// In Release builds: TRACE and DEBUG are compiled out (zero cost)
// In Debug builds: All levels are active
//
// Usage:
//   LOG_DEBUG("Collision target {:#x}", id);

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>
#include <vector>

namespace dnd::log {

constexpr char const* DEFAULT_PATTERN = "[%H:%M:%S.%e] [%^%l%$] %v";

// Initialize logging - call once at startup
//
// file_path may be empty, in which case only the console sink is installed.
inline void init(
    spdlog::level::level_enum level = spdlog::level::info,
    std::string const& file_path = {},
    std::string const& pattern = DEFAULT_PATTERN
)
{
    // Console sink (stderr) with colors
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::trace);
    console_sink->set_pattern(pattern);

    std::vector<spdlog::sink_ptr> sinks{ console_sink };

    // Optional file sink for persistent logs
    if (!file_path.empty())
    {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, true);
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v");
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("dnd", sinks.begin(), sinks.end());
    logger->set_level(level);               // Runtime level (compile-time is separate)
    logger->flush_on(spdlog::level::debug); // Flush on debug and above

    spdlog::set_default_logger(logger);
}

// Shutdown logging - call at exit
inline void shutdown() { spdlog::shutdown(); }

} // namespace dnd::log

// Convenience macros using spdlog's compile-time filtered macros
// These are zero-cost when level is below SPDLOG_ACTIVE_LEVEL

#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)
