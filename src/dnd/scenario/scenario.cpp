#include "scenario.hpp"
#include "dnd/core/log.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/fmt/fmt.h>
#include <stdexcept>
#include <toml++/toml.hpp>

namespace dnd::scenario {

namespace {

class ScenarioError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

struct ActionName
{
    char const* name;
    Action action;
};

constexpr ActionName ACTION_NAMES[] = {
    { "register_drag", Action::RegisterDrag },
    { "update_drag", Action::UpdateDrag },
    { "unregister_drag", Action::UnregisterDrag },
    { "register_drop", Action::RegisterDrop },
    { "update_drop", Action::UpdateDrop },
    { "unregister_drop", Action::UnregisterDrop },
    { "report", Action::Report },
    { "drop", Action::Drop },
    { "expect", Action::Expect },
};

std::string describe(std::optional<ElementId> id) { return id ? fmt::format("{}", *id) : std::string("none"); }

ElementId require_id(toml::table const& tbl, char const* key, size_t index)
{
    auto node = tbl[key];
    if (!node)
        node = tbl["id"];

    auto v = node.value<int64_t>();
    if (!v)
        throw ScenarioError(fmt::format("entry {}: missing integer '{}'", index, key));
    if (*v < 0)
        throw ScenarioError(fmt::format("entry {}: '{}' must not be negative", index, key));
    return static_cast<ElementId>(*v);
}

/// Parses an id or the string "none".
std::optional<ElementId> parse_optional_id(toml::node_view<toml::node const> node, char const* key, size_t index)
{
    if (auto s = node.value<std::string>())
    {
        if (*s == "none")
            return std::nullopt;
        throw ScenarioError(fmt::format("entry {}: '{}' must be an id or \"none\", got \"{}\"", index, key, *s));
    }
    auto v = node.value<int64_t>();
    if (!v || *v < 0)
        throw ScenarioError(fmt::format("entry {}: '{}' must be an id or \"none\"", index, key));
    return static_cast<ElementId>(*v);
}

std::vector<double> require_numbers(toml::table const& tbl, char const* key, size_t count, size_t index)
{
    auto const* arr = tbl[key].as_array();
    if (!arr || arr->size() != count)
        throw ScenarioError(fmt::format("entry {}: '{}' must be an array of {} numbers", index, key, count));

    std::vector<double> values;
    values.reserve(count);
    for (auto const& item : *arr)
    {
        auto v = item.value<double>();
        if (!v)
            throw ScenarioError(fmt::format("entry {}: '{}' must contain only numbers", index, key));
        values.push_back(*v);
    }
    return values;
}

Rect require_frame(toml::table const& tbl, size_t index)
{
    auto v = require_numbers(tbl, "frame", 4, index);
    if (v[2] < 0.0 || v[3] < 0.0)
        throw ScenarioError(fmt::format("entry {}: frame size must not be negative", index));
    return { v[0], v[1], v[2], v[3] };
}

Step parse_step(toml::table const& tbl, size_t index)
{
    auto name = tbl["action"].value<std::string>();
    if (!name)
        throw ScenarioError(fmt::format("step {}: missing 'action'", index));

    auto action = parse_action(*name);
    if (!action)
        throw ScenarioError(fmt::format("step {}: unknown action \"{}\"", index, *name));

    Step step;
    step.action = *action;

    switch (step.action)
    {
        case Action::RegisterDrag:
        case Action::UpdateDrag:
            step.id = require_id(tbl, "drag", index);
            step.frame = require_frame(tbl, index);
            break;
        case Action::UnregisterDrag:
            step.id = require_id(tbl, "drag", index);
            break;
        case Action::RegisterDrop:
        case Action::UpdateDrop:
            step.id = require_id(tbl, "drop", index);
            step.frame = require_frame(tbl, index);
            step.accepts_any = tbl["accepts_any"].value_or(false);
            break;
        case Action::UnregisterDrop:
            step.id = require_id(tbl, "drop", index);
            break;
        case Action::Report:
        {
            step.id = require_id(tbl, "drag", index);
            auto v = require_numbers(tbl, "offset", 2, index);
            step.offset = { v[0], v[1] };
            break;
        }
        case Action::Drop:
            step.id = require_id(tbl, "drag", index);
            if (auto v = tbl["succeeds"].value<bool>())
                step.expect.drop_succeeds = *v;
            if (tbl.contains("dropped"))
            {
                step.expect.check_dropped = true;
                step.expect.dropped = parse_optional_id(tbl["dropped"], "dropped", index);
            }
            break;
        case Action::Expect:
            if (tbl.contains("collision"))
            {
                step.expect.check_collision = true;
                step.expect.collision = parse_optional_id(tbl["collision"], "collision", index);
            }
            if (tbl.contains("dropped"))
            {
                step.expect.check_dropped = true;
                step.expect.dropped = parse_optional_id(tbl["dropped"], "dropped", index);
            }
            if (!step.expect.check_collision && !step.expect.check_dropped)
                throw ScenarioError(fmt::format("step {}: expect needs 'collision' or 'dropped'", index));
            break;
    }

    return step;
}

Scenario scenario_from_table(toml::table const& tbl)
{
    Scenario scenario;
    scenario.name = tbl["name"].value_or(std::string("unnamed"));

    size_t index = 0;

    if (auto drags = tbl["drag"].as_array())
    {
        for (auto const& item : *drags)
        {
            auto const* t = item.as_table();
            if (!t)
                throw ScenarioError(fmt::format("entry {}: [[drag]] must be a table", index));

            Step step;
            step.action = Action::RegisterDrag;
            step.id = require_id(*t, "id", index);
            step.frame = require_frame(*t, index);
            scenario.steps.push_back(step);
            ++index;
        }
    }

    if (auto drops = tbl["drop"].as_array())
    {
        for (auto const& item : *drops)
        {
            auto const* t = item.as_table();
            if (!t)
                throw ScenarioError(fmt::format("entry {}: [[drop]] must be a table", index));

            Step step;
            step.action = Action::RegisterDrop;
            step.id = require_id(*t, "id", index);
            step.frame = require_frame(*t, index);
            step.accepts_any = (*t)["accepts_any"].value_or(false);
            scenario.steps.push_back(step);
            ++index;
        }
    }

    if (auto steps = tbl["step"].as_array())
    {
        for (auto const& item : *steps)
        {
            auto const* t = item.as_table();
            if (!t)
                throw ScenarioError(fmt::format("step {}: [[step]] must be a table", index));
            scenario.steps.push_back(parse_step(*t, index));
            ++index;
        }
    }

    return scenario;
}

void check_expectation(Expectation const& expect, SessionState const& state, size_t index, ReplayResult& result)
{
    if (expect.check_collision && state.current_collision_target != expect.collision)
    {
        result.failures.push_back(fmt::format(
            "step {}: expected collision {}, got {}",
            index,
            describe(expect.collision),
            describe(state.current_collision_target)
        ));
    }
    if (expect.check_dropped && state.last_dropped_target != expect.dropped)
    {
        result.failures.push_back(fmt::format(
            "step {}: expected dropped {}, got {}",
            index,
            describe(expect.dropped),
            describe(state.last_dropped_target)
        ));
    }
}

} // namespace

std::optional<Action> parse_action(std::string_view name)
{
    std::string lowered(name);
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) { return std::tolower(c); });

    for (auto const& entry : ACTION_NAMES)
    {
        if (lowered == entry.name)
            return entry.action;
    }
    return std::nullopt;
}

char const* to_string(Action action)
{
    for (auto const& entry : ACTION_NAMES)
    {
        if (entry.action == action)
            return entry.name;
    }
    return "unknown";
}

std::optional<Scenario> load_scenario(std::string const& path)
{
    try
    {
        auto scenario = scenario_from_table(toml::parse_file(path));
        LOG_INFO("Loaded scenario '{}' from {} ({} steps)", scenario.name, path, scenario.steps.size());
        return scenario;
    }
    catch (toml::parse_error const& err)
    {
        LOG_ERROR("Scenario parse error in {}: {}", path, err.description());
        return std::nullopt;
    }
    catch (std::exception const& e)
    {
        LOG_ERROR("Scenario error in {}: {}", path, e.what());
        return std::nullopt;
    }
}

std::optional<Scenario> parse_scenario(std::string_view text)
{
    try
    {
        return scenario_from_table(toml::parse(text));
    }
    catch (toml::parse_error const& err)
    {
        LOG_ERROR("Scenario parse error: {}", err.description());
        return std::nullopt;
    }
    catch (std::exception const& e)
    {
        LOG_ERROR("Scenario error: {}", e.what());
        return std::nullopt;
    }
}

ReplayResult replay(
    Scenario const& scenario,
    DragDropCoordinator& coordinator,
    bool stop_on_failure,
    StepCallback const& on_step
)
{
    ReplayResult result;

    for (size_t i = 0; i < scenario.steps.size(); ++i)
    {
        Step const& step = scenario.steps[i];
        size_t failures_before = result.failures.size();
        LOG_TRACE("replay: step {} {} id={}", i, to_string(step.action), step.id);

        switch (step.action)
        {
            case Action::RegisterDrag:
                coordinator.register_drag(step.id, step.frame);
                break;
            case Action::UpdateDrag:
                coordinator.update_drag(step.id, step.frame);
                break;
            case Action::UnregisterDrag:
                coordinator.unregister_drag(step.id);
                break;
            case Action::RegisterDrop:
                coordinator.register_drop(step.id, step.frame, step.accepts_any);
                break;
            case Action::UpdateDrop:
                coordinator.update_drop(step.id, step.frame, step.accepts_any);
                break;
            case Action::UnregisterDrop:
                coordinator.unregister_drop(step.id);
                break;
            case Action::Report:
                coordinator.report(step.id, step.offset);
                break;
            case Action::Drop:
            {
                DropResult drop = coordinator.finalize_drop(step.id);
                if (step.expect.drop_succeeds && *step.expect.drop_succeeds != drop.success)
                {
                    result.failures.push_back(fmt::format(
                        "step {}: expected drop of {} to {}",
                        i,
                        step.id,
                        *step.expect.drop_succeeds ? "succeed" : "fail"
                    ));
                }
                break;
            }
            case Action::Expect:
                break;
        }

        check_expectation(step.expect, coordinator.state(), i, result);
        ++result.steps_run;

        if (on_step)
            on_step(i, step, coordinator.state());

        if (stop_on_failure && result.failures.size() > failures_before)
        {
            LOG_WARN("replay: stopping after failed step {}", i);
            break;
        }
    }

    return result;
}

} // namespace dnd::scenario
