#pragma once

#include "dnd/core/log.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace dnd {

struct LoggingConfig
{
    std::string level = "info";  // spdlog level name: trace, debug, info, warn, error, critical, off
    std::string file;            // Empty: console only
    std::string pattern = log::DEFAULT_PATTERN;
};

struct ReplayConfig
{
    bool stop_on_failure = false; // Stop replay at the first failed expectation
    bool log_state = true;        // Log the session state after every step
};

struct Config
{
    LoggingConfig logging;
    ReplayConfig replay;
};

std::optional<Config> load_config(std::string const& path);
std::optional<Config> parse_config(std::string_view text);
Config default_config();

} // namespace dnd
