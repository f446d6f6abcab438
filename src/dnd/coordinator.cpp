/**
 * @file coordinator.cpp
 * @brief Drag-and-drop coordinator implementation
 *
 * Registration calls forward to the reference-counted registries. The session
 * lifecycle is:
 *   report (called on every drag motion) -> ... -> finalize_drop (on release)
 *
 * Every session mutation ends with publish(), which notifies observers of the
 * fields that changed.
 */

#include "dnd/coordinator.hpp"
#include "dnd/core/collision.hpp"
#include "dnd/core/invariants.hpp"
#include "dnd/core/log.hpp"
#include <vector>

namespace dnd {

void DragDropCoordinator::register_drag(ElementId id, Rect const& frame)
{
    drags_.add(id, frame);
    LOG_TRACE(
        "register_drag: id={:#x} frame=({}, {}, {}, {}) refs={}",
        id,
        frame.x,
        frame.y,
        frame.width,
        frame.height,
        drags_.count(id)
    );
}

void DragDropCoordinator::update_drag(ElementId id, Rect const& frame)
{
    if (!drags_.update(id, frame))
        LOG_TRACE("update_drag: id={:#x} not registered, ignored", id);
}

void DragDropCoordinator::unregister_drag(ElementId id)
{
    if (!drags_.remove(id))
    {
        LOG_TRACE("unregister_drag: id={:#x} not registered, ignored", id);
        return;
    }
    LOG_TRACE("unregister_drag: id={:#x} refs={}", id, drags_.count(id));
}

void DragDropCoordinator::register_drop(ElementId id, Rect const& frame, bool accepts_any)
{
    auto& registry = accepts_any ? any_drops_ : exact_drops_;
    registry.add(id, frame);
    LOG_TRACE(
        "register_drop: id={:#x} frame=({}, {}, {}, {}) accepts_any={} refs={}",
        id,
        frame.x,
        frame.y,
        frame.width,
        frame.height,
        accepts_any,
        registry.count(id)
    );
}

void DragDropCoordinator::update_drop(ElementId id, Rect const& frame, bool accepts_any)
{
    auto& registry = accepts_any ? any_drops_ : exact_drops_;
    if (!registry.update(id, frame))
        LOG_TRACE("update_drop: id={:#x} not registered, ignored", id);
}

void DragDropCoordinator::unregister_drop(ElementId id)
{
    // The accepts_any flag is not tracked per id, so try both registries.
    bool removed_exact = exact_drops_.remove(id);
    bool removed_any = any_drops_.remove(id);
    LOG_TRACE("unregister_drop: id={:#x} exact={} any={}", id, removed_exact, removed_any);
}

void DragDropCoordinator::report(ElementId drag_id, Offset offset)
{
    StateChange change = StateChange::None;

    if (state_.current_drag_id != drag_id)
    {
        state_.current_drag_id = drag_id;
        change |= StateChange::DragId;
    }
    if (state_.current_offset != offset)
    {
        state_.current_offset = offset;
        change |= StateChange::Offset;
    }

    auto target = collision_policy::select_target(
        state_.current_drag_id,
        state_.current_offset,
        drags_,
        exact_drops_,
        any_drops_
    );
    if (state_.current_collision_target != target)
    {
        if (target)
            LOG_DEBUG("report: drag {:#x} now collides with {:#x}", drag_id, *target);
        else
            LOG_DEBUG("report: drag {:#x} no longer collides", drag_id);
        state_.current_collision_target = target;
        change |= StateChange::CollisionTarget;
    }

    DND_ASSERT_INVARIANTS(drags_, exact_drops_, any_drops_, state_);
    publish(change);
}

bool DragDropCoordinator::is_colliding_drop(ElementId drop_id) const
{
    return state_.current_collision_target == drop_id;
}

bool DragDropCoordinator::is_colliding_drag(ElementId drag_id) const
{
    return state_.current_drag_id == drag_id && state_.current_collision_target.has_value();
}

DropResult DragDropCoordinator::finalize_drop(ElementId drag_id)
{
    DropResult result;

    if (!is_colliding_drag(drag_id))
    {
        LOG_DEBUG("finalize_drop: drag {:#x} is not over a target, drop failed", drag_id);
        bool changed = state_.last_dropped_target.has_value();
        state_.last_dropped_target.reset();
        publish(changed ? StateChange::DroppedTarget : StateChange::None);
        return result;
    }

    result.success = true;
    result.target = state_.current_collision_target;
    state_.last_dropped_target = result.target;
    LOG_DEBUG("finalize_drop: drag {:#x} dropped on {:#x}", drag_id, *result.target);

    DND_ASSERT_INVARIANTS(drags_, exact_drops_, any_drops_, state_);
    publish(StateChange::DroppedTarget);
    return result;
}

DragDropCoordinator::SubscriptionId DragDropCoordinator::subscribe(Observer observer)
{
    SubscriptionId id = next_subscription_++;
    observers_.emplace(id, std::move(observer));
    return id;
}

void DragDropCoordinator::unsubscribe(SubscriptionId id) { observers_.erase(id); }

void DragDropCoordinator::publish(StateChange change)
{
    if (change == StateChange::None || observers_.empty())
        return;

    // Observers may subscribe or unsubscribe while being notified. Iterate over
    // a snapshot of the ids and skip any that were removed in the meantime.
    std::vector<SubscriptionId> ids;
    ids.reserve(observers_.size());
    for (auto const& [id, observer] : observers_)
        ids.push_back(id);

    for (SubscriptionId id : ids)
    {
        auto it = observers_.find(id);
        if (it == observers_.end())
            continue;
        // Copy: the observer may unsubscribe itself during the call.
        Observer observer = it->second;
        observer(change, state_);
    }
}

} // namespace dnd
