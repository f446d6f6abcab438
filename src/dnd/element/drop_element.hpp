#pragma once

#include "dnd/coordinator.hpp"
#include "dnd/core/types.hpp"
#include <functional>
#include <optional>

namespace dnd {

struct DropInfo
{
    bool did_drop = false;
    bool is_colliding = false;
};

/**
 * @brief Coordinator-side state of one drop target.
 *
 * With a receive_from id the target is exact: it only accepts the drag element
 * registered under that id and is itself registered under it. Without one it
 * accepts any drag element and is registered under an anonymous id from the
 * coordinator.
 *
 * Registration and the state subscription live as long as the object.
 */
class DropElement
{
public:
    using ReceivedCallback = std::function<void(ElementId drag_id)>;

    DropElement(DragDropCoordinator& coordinator, Rect const& frame, std::optional<ElementId> receive_from = std::nullopt);
    ~DropElement();

    DropElement(DropElement const&) = delete;
    DropElement& operator=(DropElement const&) = delete;
    DropElement(DropElement&&) = delete;
    DropElement& operator=(DropElement&&) = delete;

    ElementId id() const { return id_; }
    bool accepts_any() const { return accepts_any_; }

    void set_frame(Rect const& frame);

    /// Called with the dropped drag element's id each time a drop lands here.
    void set_on_received(ReceivedCallback callback) { on_received_ = std::move(callback); }

    DropInfo info() const;

private:
    DragDropCoordinator& coordinator_;
    ElementId id_;
    bool accepts_any_;
    bool dropped_ = false;
    DragDropCoordinator::SubscriptionId subscription_ = 0;
    ReceivedCallback on_received_;

    void on_state_changed(StateChange change, SessionState const& state);
};

} // namespace dnd
