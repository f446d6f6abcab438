#pragma once

#include "dnd/core/ref_registry.hpp"
#include "dnd/core/types.hpp"
#include <optional>

namespace dnd::collision_policy {

using FrameRegistry = RefRegistry<Rect>;

/**
 * @brief Frame of the dragged element after applying the reported offset.
 *
 * @return nullopt if there is no drag id or offset, or the drag id is not registered.
 */
std::optional<Rect> dragged_frame(
    std::optional<ElementId> drag_id,
    std::optional<Offset> offset,
    FrameRegistry const& drags
);

/**
 * @brief Select the drop target for the current drag.
 *
 * Pure decision function: does NOT mutate any registry.
 *
 * An exact target registered under the drag's own id wins whenever it
 * intersects the dragged frame, regardless of distance. Otherwise the
 * intersecting accept-any target whose midpoint is closest to the dragged
 * frame's midpoint is chosen. Equal distances resolve to the same target for
 * identical registry contents.
 *
 * @param drag_id Element currently reporting offsets.
 * @param offset Cumulative offset of that element.
 * @param drags Registered drag frames.
 * @param exact_drops Targets accepting only the drag sharing their id.
 * @param any_drops Targets accepting any drag.
 * @return The selected target id, or nullopt when nothing intersects.
 */
std::optional<ElementId> select_target(
    std::optional<ElementId> drag_id,
    std::optional<Offset> offset,
    FrameRegistry const& drags,
    FrameRegistry const& exact_drops,
    FrameRegistry const& any_drops
);

} // namespace dnd::collision_policy
