#include "dnd/core/collision.hpp"
#include "dnd/core/geometry.hpp"
#include "dnd/core/log.hpp"

namespace dnd::collision_policy {

std::optional<Rect> dragged_frame(
    std::optional<ElementId> drag_id,
    std::optional<Offset> offset,
    FrameRegistry const& drags
)
{
    if (!drag_id || !offset)
        return std::nullopt;

    auto frame = drags.get(*drag_id);
    if (!frame)
        return std::nullopt;

    return frame->translated(*offset);
}

std::optional<ElementId> select_target(
    std::optional<ElementId> drag_id,
    std::optional<Offset> offset,
    FrameRegistry const& drags,
    FrameRegistry const& exact_drops,
    FrameRegistry const& any_drops
)
{
    auto dragged = dragged_frame(drag_id, offset, drags);
    if (!dragged)
    {
        LOG_TRACE("select_target: no dragged frame (drag registered={})", drag_id && drags.contains(*drag_id));
        return std::nullopt;
    }

    if (auto exact = exact_drops.get(*drag_id); exact && exact->intersects(*dragged))
    {
        LOG_TRACE("select_target: exact target {:#x}", *drag_id);
        return drag_id;
    }

    std::optional<ElementId> closest;
    double closest_distance = 0.0;
    for (auto const& [id, entry] : any_drops)
    {
        if (!entry.value.intersects(*dragged))
            continue;

        double d = geometry::midpoint_distance(entry.value, *dragged);
        if (!closest || d < closest_distance)
        {
            closest = id;
            closest_distance = d;
        }
    }

    if (closest)
        LOG_TRACE("select_target: any target {:#x} at distance {}", *closest, closest_distance);
    return closest;
}

} // namespace dnd::collision_policy
