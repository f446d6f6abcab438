#pragma once

#include "dnd/coordinator.hpp"
#include "dnd/core/types.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dnd::scenario {

enum class Action
{
    RegisterDrag,
    UpdateDrag,
    UnregisterDrag,
    RegisterDrop,
    UpdateDrop,
    UnregisterDrop,
    Report,
    Drop,
    Expect,
};

std::optional<Action> parse_action(std::string_view name);
char const* to_string(Action action);

/**
 * @brief Checks made by an Expect step (or by a Drop step's `succeeds`).
 *
 * Each check_* flag enables the matching comparison; an empty expected id
 * means "none".
 */
struct Expectation
{
    bool check_collision = false;
    std::optional<ElementId> collision;

    bool check_dropped = false;
    std::optional<ElementId> dropped;

    std::optional<bool> drop_succeeds;
};

struct Step
{
    Action action = Action::Expect;
    ElementId id = 0; ///< Drag id for drag/report/drop actions, drop id for drop-target actions
    Rect frame;
    bool accepts_any = false;
    Offset offset;
    Expectation expect;
};

struct Scenario
{
    std::string name;
    std::vector<Step> steps;
};

struct ReplayResult
{
    size_t steps_run = 0;
    std::vector<std::string> failures;

    bool ok() const { return failures.empty(); }
};

using StepCallback = std::function<void(size_t index, Step const& step, SessionState const& state)>;

/**
 * @brief Load a scenario from a TOML file.
 *
 * `[[drag]]` and `[[drop]]` tables become leading register steps, followed by
 * the `[[step]]` tables in file order.
 *
 * @return nullopt (with the reason logged) on parse errors or invalid content.
 */
std::optional<Scenario> load_scenario(std::string const& path);
std::optional<Scenario> parse_scenario(std::string_view text);

/**
 * @brief Drive a coordinator through the scenario's steps.
 *
 * @param stop_on_failure Stop after the first step whose expectation failed.
 * @param on_step Called after each step with the resulting session state.
 */
ReplayResult replay(
    Scenario const& scenario,
    DragDropCoordinator& coordinator,
    bool stop_on_failure = false,
    StepCallback const& on_step = {}
);

} // namespace dnd::scenario
