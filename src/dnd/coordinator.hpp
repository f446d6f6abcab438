#pragma once

#include "dnd/core/ref_registry.hpp"
#include "dnd/core/types.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <optional>

namespace dnd {

/// Published session fields touched by a mutation
enum class StateChange : uint8_t
{
    None = 0,
    DragId = 1 << 0,
    Offset = 1 << 1,
    CollisionTarget = 1 << 2,
    DroppedTarget = 1 << 3,
};

constexpr StateChange operator|(StateChange a, StateChange b)
{
    return static_cast<StateChange>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

constexpr StateChange& operator|=(StateChange& a, StateChange b) { return a = a | b; }

constexpr bool has_change(StateChange set, StateChange flag)
{
    return (static_cast<uint8_t>(set) & static_cast<uint8_t>(flag)) != 0;
}

/**
 * @brief Snapshot of the published drag session.
 *
 * There is a single session slot per coordinator: a report from a second
 * drag element overwrites the first one's session.
 */
struct SessionState
{
    std::optional<ElementId> current_drag_id;
    std::optional<Offset> current_offset;
    std::optional<ElementId> current_collision_target;
    std::optional<ElementId> last_dropped_target; ///< Written only by finalize_drop

    bool operator==(SessionState const&) const = default;
};

struct DropResult
{
    bool success = false;
    std::optional<ElementId> target;

    explicit operator bool() const { return success; }
};

/**
 * @brief Drag-and-drop coordinator.
 *
 * Owns the drag registry, the two drop registries (exact and accept-any) and
 * the session state. This is the only entry point the UI layer uses: it
 * reports element geometry and drag offsets here, and reads the published
 * state back either through the getters or by subscribing.
 *
 * Not thread-safe. All calls are expected from one UI dispatch loop.
 * Unknown identifiers are never an error.
 */
class DragDropCoordinator
{
public:
    using FrameRegistry = RefRegistry<Rect>;
    using SubscriptionId = uint64_t;
    using Observer = std::function<void(StateChange change, SessionState const& state)>;

    DragDropCoordinator() = default;

    DragDropCoordinator(DragDropCoordinator const&) = delete;
    DragDropCoordinator& operator=(DragDropCoordinator const&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Element geometry
    // ─────────────────────────────────────────────────────────────────────────

    void register_drag(ElementId id, Rect const& frame);
    void update_drag(ElementId id, Rect const& frame);
    void unregister_drag(ElementId id);

    /**
     * @brief Register a drop target.
     *
     * @param accepts_any True for a target accepting any drag element; false
     *        for one accepting only the drag element registered under the same id.
     *        Must be the same value for every call concerning this id.
     */
    void register_drop(ElementId id, Rect const& frame, bool accepts_any);
    void update_drop(ElementId id, Rect const& frame, bool accepts_any);

    /// Removes id from both drop registries.
    void unregister_drop(ElementId id);

    /// Fresh identifier for a drop target that accepts any drag element.
    ElementId make_anonymous_id() { return next_anonymous_id_++; }

    // ─────────────────────────────────────────────────────────────────────────
    // Drag session
    // ─────────────────────────────────────────────────────────────────────────

    /// Record the current offset of drag_id and recompute the collision target.
    void report(ElementId drag_id, Offset offset);

    bool is_colliding_drop(ElementId drop_id) const;
    bool is_colliding_drag(ElementId drag_id) const;
    bool can_drop(ElementId drag_id) const { return is_colliding_drag(drag_id); }

    /**
     * @brief Commit the current collision as the drop outcome of drag_id.
     *
     * On failure last_dropped_target is cleared. The collision target itself
     * is left untouched either way.
     */
    DropResult finalize_drop(ElementId drag_id);

    std::optional<ElementId> current_drag_id() const { return state_.current_drag_id; }
    std::optional<Offset> current_offset() const { return state_.current_offset; }
    std::optional<ElementId> current_collision_target() const { return state_.current_collision_target; }
    std::optional<ElementId> last_dropped_target() const { return state_.last_dropped_target; }
    SessionState const& state() const { return state_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Observation
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Register a callback run synchronously after published state changes.
     *
     * Callbacks fire only for fields whose value changed, except that every
     * successful drop signals DroppedTarget. Callbacks may call back into the
     * coordinator, including subscribe/unsubscribe.
     */
    SubscriptionId subscribe(Observer observer);
    void unsubscribe(SubscriptionId id);
    size_t observer_count() const { return observers_.size(); }

    FrameRegistry const& drag_registry() const { return drags_; }
    FrameRegistry const& exact_drop_registry() const { return exact_drops_; }
    FrameRegistry const& any_drop_registry() const { return any_drops_; }

private:
    FrameRegistry drags_;
    FrameRegistry exact_drops_;
    FrameRegistry any_drops_;

    SessionState state_;
    ElementId next_anonymous_id_ = ANONYMOUS_ID_BASE;

    std::map<SubscriptionId, Observer> observers_;
    SubscriptionId next_subscription_ = 1;

    void publish(StateChange change);
};

} // namespace dnd
