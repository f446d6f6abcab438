#pragma once

#include "dnd/coordinator.hpp"
#include "dnd/core/types.hpp"
#include <functional>

namespace dnd {

struct DragInfo
{
    bool did_drop = false;
    bool is_dragging = false;
    bool is_colliding = false;
};

/**
 * @brief Coordinator-side state of one draggable element.
 *
 * Registers the element's frame on construction and unregisters it on
 * destruction. The owning view forwards geometry changes to set_frame() and
 * gesture events to drag_changed() / drag_ended().
 */
class DragElement
{
public:
    using TranslationAdjustment = std::function<Offset(Offset translation)>;
    using DraggingChangedCallback = std::function<void(ElementId id, bool dragging)>;
    using DragEndedCallback = std::function<void(bool dropped)>;

    DragElement(DragDropCoordinator& coordinator, ElementId id, Rect const& frame);
    ~DragElement();

    DragElement(DragElement const&) = delete;
    DragElement& operator=(DragElement const&) = delete;
    DragElement(DragElement&&) = delete;
    DragElement& operator=(DragElement&&) = delete;

    ElementId id() const { return id_; }

    void set_frame(Rect const& frame);

    /// Extra translation applied once the gesture is underway, e.g. to keep the element above the finger.
    void set_translation_adjustment(TranslationAdjustment adjustment) { adjustment_ = std::move(adjustment); }
    void set_on_dragging_changed(DraggingChangedCallback callback) { on_dragging_changed_ = std::move(callback); }
    void set_on_drag_ended(DragEndedCallback callback) { on_drag_ended_ = std::move(callback); }

    /// Gesture moved; translation is cumulative since the gesture started.
    void drag_changed(Offset translation);

    /**
     * @brief Gesture released.
     *
     * Commits the drop if the element currently collides with a target, then
     * reports a zero offset to reset the session position. Callbacks run by
     * the drop (including on_received of the target) may destroy this element.
     *
     * @return True if the drop succeeded.
     */
    bool drag_ended();

    DragInfo info() const;
    Offset offset() const { return offset_; }
    bool is_dragging() const { return dragging_; }

private:
    DragDropCoordinator& coordinator_;
    ElementId id_;
    Offset offset_;
    bool dragging_ = false;
    bool dropped_ = false;

    TranslationAdjustment adjustment_;
    DraggingChangedCallback on_dragging_changed_;
    DragEndedCallback on_drag_ended_;

    Offset adjusted(Offset translation) const;
    void set_dragging(bool dragging);
};

} // namespace dnd
