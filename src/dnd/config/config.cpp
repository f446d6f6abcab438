#include "config.hpp"
#include "dnd/core/log.hpp"
#include <toml++/toml.hpp>

namespace dnd
{

namespace {

Config config_from_table(toml::table const& tbl)
{
    Config cfg = default_config();

    // Logging
    if (auto logging = tbl["logging"].as_table())
    {
        if (auto v = (*logging)["level"].value<std::string>())
        {
            // from_str maps every unknown name to off
            if (spdlog::level::from_str(*v) != spdlog::level::off || *v == "off")
                cfg.logging.level = *v;
            else
                LOG_WARN("Unknown log level '{}', using '{}'", *v, cfg.logging.level);
        }
        if (auto v = (*logging)["file"].value<std::string>())
            cfg.logging.file = *v;
        if (auto v = (*logging)["pattern"].value<std::string>())
            cfg.logging.pattern = *v;
    }

    // Replay
    if (auto replay = tbl["replay"].as_table())
    {
        if (auto v = (*replay)["stop_on_failure"].value<bool>())
            cfg.replay.stop_on_failure = *v;
        if (auto v = (*replay)["log_state"].value<bool>())
            cfg.replay.log_state = *v;
    }

    return cfg;
}

} // namespace

Config default_config()
{
    Config cfg;

    cfg.logging.level = "info";
    cfg.logging.file.clear();
    cfg.logging.pattern = log::DEFAULT_PATTERN;

    cfg.replay.stop_on_failure = false;
    cfg.replay.log_state = true;

    return cfg;
}

std::optional<Config> load_config(std::string const& path)
{
    try
    {
        return config_from_table(toml::parse_file(path));
    }
    catch (toml::parse_error const& err)
    {
        LOG_ERROR("Config parse error in {}: {}", path, err.description());
        return std::nullopt;
    }
    catch (std::exception const& e)
    {
        LOG_ERROR("Config error: {}", e.what());
        return std::nullopt;
    }
}

std::optional<Config> parse_config(std::string_view text)
{
    try
    {
        return config_from_table(toml::parse(text));
    }
    catch (toml::parse_error const& err)
    {
        LOG_ERROR("Config parse error: {}", err.description());
        return std::nullopt;
    }
    catch (std::exception const& e)
    {
        LOG_ERROR("Config error: {}", e.what());
        return std::nullopt;
    }
}

} // namespace dnd
