#include <cstdlib>
#include <dnd/config/config.hpp>
#include <dnd/coordinator.hpp>
#include <dnd/core/log.hpp>
#include <dnd/scenario/scenario.hpp>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

namespace {

struct Arguments
{
    std::string config_path;
    std::string scenario_path;
};

void print_usage(char const* program)
{
    std::cerr << "Usage: " << program << " [--config <config.toml>] <scenario.toml>" << std::endl;
}

std::optional<Arguments> parse_arguments(int argc, char* argv[])
{
    Arguments args;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        if (arg == "--config" || arg == "-c")
        {
            if (i + 1 >= argc)
                return std::nullopt;
            args.config_path = argv[++i];
        }
        else if (arg == "--help" || arg == "-h")
        {
            return std::nullopt;
        }
        else if (args.scenario_path.empty())
        {
            args.scenario_path = std::string(arg);
        }
        else
        {
            return std::nullopt;
        }
    }

    if (args.scenario_path.empty())
        return std::nullopt;
    return args;
}

std::string get_config_path(Arguments const& args)
{
    // Command line argument takes priority
    if (!args.config_path.empty())
    {
        return args.config_path;
    }

    // Try XDG_CONFIG_HOME
    if (char const* xdg = std::getenv("XDG_CONFIG_HOME"))
    {
        return std::string(xdg) + "/dnd/config.toml";
    }

    // Fall back to ~/.config
    if (char const* home = std::getenv("HOME"))
    {
        return std::string(home) + "/.config/dnd/config.toml";
    }

    return "";
}

std::string describe(std::optional<dnd::ElementId> id) { return id ? std::to_string(*id) : std::string("none"); }

} // namespace

int main(int argc, char* argv[])
{
    auto args = parse_arguments(argc, argv);
    if (!args)
    {
        print_usage(argv[0]);
        return 2;
    }

    // Console logging until the configured logger replaces it
    dnd::log::init();

    try
    {
        std::string config_path = get_config_path(*args);
        dnd::Config config = dnd::default_config();

        if (!config_path.empty() && fs::exists(config_path))
        {
            auto loaded = dnd::load_config(config_path);
            if (loaded)
            {
                config = *loaded;
            }
            else
            {
                LOG_WARN("Failed to load config {}, using defaults", config_path);
            }
        }

        auto level = spdlog::level::from_str(config.logging.level);
        dnd::log::init(level, config.logging.file, config.logging.pattern);
        LOG_INFO("Config: {}", config_path.empty() || !fs::exists(config_path) ? "defaults" : config_path);

        auto scenario = dnd::scenario::load_scenario(args->scenario_path);
        if (!scenario)
        {
            LOG_ERROR("Could not load scenario {}", args->scenario_path);
            dnd::log::shutdown();
            return 1;
        }

        dnd::DragDropCoordinator coordinator;
        dnd::scenario::StepCallback on_step;
        if (config.replay.log_state)
        {
            on_step = [](size_t index, dnd::scenario::Step const& step, dnd::SessionState const& state)
            {
                LOG_INFO(
                    "[{}] {} {}: collision={} dropped={}",
                    index,
                    dnd::scenario::to_string(step.action),
                    step.id,
                    describe(state.current_collision_target),
                    describe(state.last_dropped_target)
                );
            };
        }

        auto result = dnd::scenario::replay(*scenario, coordinator, config.replay.stop_on_failure, on_step);
        for (auto const& failure : result.failures)
        {
            LOG_ERROR("{}", failure);
        }

        LOG_INFO(
            "Scenario '{}': {} steps, {} failures",
            scenario->name,
            result.steps_run,
            result.failures.size()
        );
        dnd::log::shutdown();
        return result.ok() ? 0 : 1;
    }
    catch (std::exception const& e)
    {
        LOG_ERROR("Error: {}", e.what());
        dnd::log::shutdown();
        return 1;
    }
}
