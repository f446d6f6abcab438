#include "dnd/element/drop_element.hpp"
#include "dnd/core/log.hpp"

namespace dnd {

DropElement::DropElement(DragDropCoordinator& coordinator, Rect const& frame, std::optional<ElementId> receive_from)
    : coordinator_(coordinator)
    , id_(receive_from ? *receive_from : coordinator.make_anonymous_id())
    , accepts_any_(!receive_from.has_value())
{
    coordinator_.register_drop(id_, frame, accepts_any_);
    subscription_ = coordinator_.subscribe([this](StateChange change, SessionState const& state)
                                           { on_state_changed(change, state); });
}

DropElement::~DropElement()
{
    coordinator_.unsubscribe(subscription_);
    coordinator_.unregister_drop(id_);
}

void DropElement::set_frame(Rect const& frame) { coordinator_.update_drop(id_, frame, accepts_any_); }

DropInfo DropElement::info() const
{
    return DropInfo{
        .did_drop = dropped_,
        .is_colliding = coordinator_.is_colliding_drop(id_),
    };
}

void DropElement::on_state_changed(StateChange change, SessionState const& state)
{
    if (!has_change(change, StateChange::DroppedTarget))
        return;
    if (state.last_dropped_target != id_)
        return;

    dropped_ = true;
    if (!state.current_drag_id)
        return;

    LOG_DEBUG("drop {:#x} received drag {:#x}", id_, *state.current_drag_id);
    if (on_received_)
        on_received_(*state.current_drag_id);
}

} // namespace dnd
