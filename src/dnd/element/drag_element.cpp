#include "dnd/element/drag_element.hpp"
#include "dnd/core/log.hpp"

namespace dnd {

DragElement::DragElement(DragDropCoordinator& coordinator, ElementId id, Rect const& frame)
    : coordinator_(coordinator)
    , id_(id)
{
    coordinator_.register_drag(id_, frame);
}

DragElement::~DragElement() { coordinator_.unregister_drag(id_); }

void DragElement::set_frame(Rect const& frame) { coordinator_.update_drag(id_, frame); }

void DragElement::drag_changed(Offset translation)
{
    offset_ = adjusted(translation);
    coordinator_.report(id_, offset_);

    if (!dragging_)
        set_dragging(true);
}

bool DragElement::drag_ended()
{
    // Observers of the drop may destroy this element. Member state is settled
    // before the coordinator publishes and only locals are used afterwards.
    DragDropCoordinator& coordinator = coordinator_;
    ElementId const id = id_;
    DragEndedCallback on_drag_ended = on_drag_ended_;
    DraggingChangedCallback on_dragging_changed = dragging_ ? on_dragging_changed_ : nullptr;

    // A release away from any target leaves the previous drop outcome alone.
    bool const colliding = coordinator.can_drop(id);
    dropped_ = dropped_ || colliding;
    offset_ = {};
    dragging_ = false;

    bool const success = colliding && coordinator.finalize_drop(id).success;
    coordinator.report(id, Offset{});
    LOG_DEBUG("drag_ended: id={:#x} dropped={}", id, success);

    if (on_drag_ended)
        on_drag_ended(success);
    if (on_dragging_changed)
        on_dragging_changed(id, false);
    return success;
}

DragInfo DragElement::info() const
{
    return DragInfo{
        .did_drop = dropped_,
        .is_dragging = dragging_,
        .is_colliding = coordinator_.is_colliding_drag(id_),
    };
}

Offset DragElement::adjusted(Offset translation) const
{
    // The first change event of a gesture reports the raw translation.
    if (!dragging_ || !adjustment_)
        return translation;

    Offset adjustment = adjustment_(translation);
    return { translation.dx + adjustment.dx, translation.dy + adjustment.dy };
}

void DragElement::set_dragging(bool dragging)
{
    if (dragging_ == dragging)
        return;
    dragging_ = dragging;
    if (on_dragging_changed_)
        on_dragging_changed_(id_, dragging_);
}

} // namespace dnd
