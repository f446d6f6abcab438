#pragma once

/**
 * @file invariants.hpp
 * @brief Debug assertions for coordinator invariants
 *
 * These assertions verify invariants that must hold after every coordinator
 * mutation. They are enabled in debug builds and compile to nothing in release.
 * Violations are logged, never fatal.
 *
 * Key invariants:
 * 1. Every registry entry has a reference count of at least 1
 * 2. A drop id lives in at most one of the exact/accept-any registries
 * 3. A collision target implies a current drag id and offset
 */

#include "log.hpp"
#include "ref_registry.hpp"
#include "types.hpp"
#include <optional>

namespace dnd::invariants {

#ifdef NDEBUG
// Release build: no-op
#    define DND_ASSERT_INVARIANTS(drags, exact_drops, any_drops, state)
#else

/**
 * @brief Assert that no entry is kept alive with a zero count
 */
inline void assert_registry_counts(RefRegistry<Rect> const& registry, char const* name)
{
    for (auto const& [id, entry] : registry)
    {
        if (entry.count == 0)
        {
            LOG_ERROR("INVARIANT VIOLATION: {} registry holds {:#x} with zero references", name, id);
        }
    }
}

/**
 * @brief Assert that no drop id was registered with both accepts_any values
 *
 * Mixing the flag for one id is a caller bug the coordinator cannot repair;
 * it is reported here so that it shows up in debug logs.
 */
inline void assert_drop_registries_disjoint(RefRegistry<Rect> const& exact_drops, RefRegistry<Rect> const& any_drops)
{
    for (auto const& [id, entry] : exact_drops)
    {
        if (any_drops.contains(id))
        {
            LOG_ERROR("INVARIANT VIOLATION: Drop {:#x} registered as both exact and accept-any", id);
        }
    }
}

/**
 * @brief Assert session consistency
 *
 * Verifies:
 * - If a collision target is set, a drag id and an offset are set too
 */
inline void assert_session_consistency(
    std::optional<ElementId> drag_id,
    std::optional<Offset> offset,
    std::optional<ElementId> collision_target
)
{
    if (collision_target && (!drag_id || !offset))
    {
        LOG_ERROR("INVARIANT VIOLATION: Collision target {:#x} without an active drag", *collision_target);
    }
}

#    define DND_ASSERT_INVARIANTS(drags, exact_drops, any_drops, state)                                               \
        do                                                                                                             \
        {                                                                                                              \
            ::dnd::invariants::assert_registry_counts(drags, "drag");                                                  \
            ::dnd::invariants::assert_registry_counts(exact_drops, "exact drop");                                      \
            ::dnd::invariants::assert_registry_counts(any_drops, "any drop");                                          \
            ::dnd::invariants::assert_drop_registries_disjoint(exact_drops, any_drops);                                \
            ::dnd::invariants::assert_session_consistency(                                                             \
                (state).current_drag_id,                                                                               \
                (state).current_offset,                                                                                \
                (state).current_collision_target                                                                       \
            );                                                                                                         \
        } while (0)

#endif // NDEBUG

} // namespace dnd::invariants
