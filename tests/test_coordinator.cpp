#include "dnd/coordinator.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace dnd;

namespace {

constexpr ElementId DRAG_A = 0xA;
constexpr ElementId DROP_B = 0xB;
constexpr ElementId DROP_C = 0xC;

// Drag A at (0,0,50,50), accept-any B at (40,40,50,50) and C at (200,200,50,50)
void setup_basic(DragDropCoordinator& coordinator)
{
    coordinator.register_drag(DRAG_A, { 0, 0, 50, 50 });
    coordinator.register_drop(DROP_B, { 40, 40, 50, 50 }, true);
    coordinator.register_drop(DROP_C, { 200, 200, 50, 50 }, true);
}

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
// End-to-end scenarios
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Drag onto the overlapping accept-any target and drop", "[coordinator]")
{
    DragDropCoordinator coordinator;
    setup_basic(coordinator);

    coordinator.report(DRAG_A, { 10, 10 });

    REQUIRE(coordinator.current_drag_id() == DRAG_A);
    REQUIRE(coordinator.current_offset() == Offset{ 10, 10 });
    REQUIRE(coordinator.current_collision_target() == DROP_B);
    REQUIRE(coordinator.is_colliding_drop(DROP_B));
    REQUIRE_FALSE(coordinator.is_colliding_drop(DROP_C));
    REQUIRE(coordinator.is_colliding_drag(DRAG_A));
    REQUIRE(coordinator.can_drop(DRAG_A));

    auto result = coordinator.finalize_drop(DRAG_A);

    REQUIRE(result.success);
    REQUIRE(static_cast<bool>(result));
    REQUIRE(result.target == DROP_B);
    REQUIRE(coordinator.last_dropped_target() == DROP_B);
}

TEST_CASE("Exact target beats a closer accept-any target", "[coordinator]")
{
    constexpr ElementId X = 0x58;
    constexpr ElementId Y = 0x59;

    DragDropCoordinator coordinator;
    coordinator.register_drag(X, { 0, 0, 40, 40 });
    coordinator.register_drop(X, { 30, 30, 40, 40 }, false);
    coordinator.register_drop(Y, { 10, 10, 40, 40 }, true);

    coordinator.report(X, { 10, 10 });

    REQUIRE(coordinator.current_collision_target() == X);
    REQUIRE(coordinator.is_colliding_drop(X));
    REQUIRE_FALSE(coordinator.is_colliding_drop(Y));
    REQUIRE(coordinator.finalize_drop(X).target == X);
}

// ─────────────────────────────────────────────────────────────────────────────
// Session state
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Fresh coordinator has no session", "[coordinator]")
{
    DragDropCoordinator coordinator;

    REQUIRE(coordinator.state() == SessionState{});
    REQUIRE_FALSE(coordinator.is_colliding_drag(DRAG_A));
    REQUIRE_FALSE(coordinator.can_drop(DRAG_A));
    REQUIRE_FALSE(coordinator.is_colliding_drop(DROP_B));
}

TEST_CASE("Moving away from every target clears the collision", "[coordinator]")
{
    DragDropCoordinator coordinator;
    setup_basic(coordinator);

    coordinator.report(DRAG_A, { 10, 10 });
    REQUIRE(coordinator.current_collision_target() == DROP_B);

    coordinator.report(DRAG_A, { 100, -100 });
    REQUIRE_FALSE(coordinator.current_collision_target().has_value());
    REQUIRE_FALSE(coordinator.is_colliding_drag(DRAG_A));
}

TEST_CASE("Zero offset report recomputes from the home frame", "[coordinator]")
{
    DragDropCoordinator coordinator;
    setup_basic(coordinator);

    coordinator.report(DRAG_A, { 10, 10 });
    coordinator.report(DRAG_A, {});

    REQUIRE(coordinator.current_offset() == Offset{});
    // (0,0,50,50) still overlaps B at (40,40,50,50)
    REQUIRE(coordinator.current_collision_target() == DROP_B);
}

TEST_CASE("Report for an unregistered drag collides with nothing", "[coordinator]")
{
    DragDropCoordinator coordinator;
    coordinator.register_drop(DROP_B, { 0, 0, 50, 50 }, true);

    coordinator.report(DRAG_A, { 1, 1 });

    REQUIRE(coordinator.current_drag_id() == DRAG_A);
    REQUIRE_FALSE(coordinator.current_collision_target().has_value());
}

TEST_CASE("Second drag report overwrites the session", "[coordinator]")
{
    constexpr ElementId DRAG_D = 0xD;

    DragDropCoordinator coordinator;
    setup_basic(coordinator);
    coordinator.register_drag(DRAG_D, { 500, 500, 10, 10 });

    coordinator.report(DRAG_A, { 10, 10 });
    REQUIRE(coordinator.is_colliding_drag(DRAG_A));

    coordinator.report(DRAG_D, { 0, 0 });
    REQUIRE(coordinator.current_drag_id() == DRAG_D);
    REQUIRE_FALSE(coordinator.is_colliding_drag(DRAG_A));
    REQUIRE_FALSE(coordinator.is_colliding_drag(DRAG_D));
}

TEST_CASE("is_colliding_drag requires the reporting drag", "[coordinator]")
{
    DragDropCoordinator coordinator;
    setup_basic(coordinator);
    coordinator.report(DRAG_A, { 10, 10 });

    REQUIRE(coordinator.is_colliding_drag(DRAG_A));
    REQUIRE_FALSE(coordinator.is_colliding_drag(DROP_B));
    REQUIRE_FALSE(coordinator.can_drop(0x999));
}

// ─────────────────────────────────────────────────────────────────────────────
// Finalize drop
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Failed drop clears the last dropped target only", "[coordinator][drop]")
{
    DragDropCoordinator coordinator;
    setup_basic(coordinator);

    coordinator.report(DRAG_A, { 10, 10 });
    REQUIRE(coordinator.finalize_drop(DRAG_A).success);
    REQUIRE(coordinator.last_dropped_target() == DROP_B);

    SECTION("Drag no longer colliding")
    {
        coordinator.report(DRAG_A, { 1000, 1000 });
        auto result = coordinator.finalize_drop(DRAG_A);

        REQUIRE_FALSE(result.success);
        REQUIRE_FALSE(result.target.has_value());
        REQUIRE_FALSE(coordinator.last_dropped_target().has_value());
        REQUIRE_FALSE(coordinator.current_collision_target().has_value());
    }

    SECTION("Different drag id than the reporting one")
    {
        auto result = coordinator.finalize_drop(0x999);

        REQUIRE_FALSE(result.success);
        REQUIRE_FALSE(coordinator.last_dropped_target().has_value());
        // The collision target is left untouched
        REQUIRE(coordinator.current_collision_target() == DROP_B);
    }
}

TEST_CASE("Drop without any report fails", "[coordinator][drop]")
{
    DragDropCoordinator coordinator;
    setup_basic(coordinator);

    REQUIRE_FALSE(coordinator.finalize_drop(DRAG_A).success);
    REQUIRE_FALSE(coordinator.last_dropped_target().has_value());
}

TEST_CASE("Successful drop keeps the collision target", "[coordinator][drop]")
{
    DragDropCoordinator coordinator;
    setup_basic(coordinator);

    coordinator.report(DRAG_A, { 10, 10 });
    coordinator.finalize_drop(DRAG_A);

    REQUIRE(coordinator.current_collision_target() == DROP_B);
    REQUIRE(coordinator.last_dropped_target() == coordinator.current_collision_target());
}

TEST_CASE("Collision target is not recomputed by registry changes", "[coordinator]")
{
    DragDropCoordinator coordinator;
    setup_basic(coordinator);

    coordinator.report(DRAG_A, { 10, 10 });
    coordinator.unregister_drop(DROP_B);

    // Stale until the next report
    REQUIRE(coordinator.current_collision_target() == DROP_B);

    coordinator.report(DRAG_A, { 10, 10 });
    REQUIRE_FALSE(coordinator.current_collision_target().has_value());
}

// ─────────────────────────────────────────────────────────────────────────────
// Registration
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Drop registration routes by accepts_any", "[coordinator][registry]")
{
    DragDropCoordinator coordinator;
    coordinator.register_drop(1, { 0, 0, 10, 10 }, false);
    coordinator.register_drop(2, { 0, 0, 10, 10 }, true);

    REQUIRE(coordinator.exact_drop_registry().contains(1));
    REQUIRE_FALSE(coordinator.any_drop_registry().contains(1));
    REQUIRE(coordinator.any_drop_registry().contains(2));
    REQUIRE_FALSE(coordinator.exact_drop_registry().contains(2));

    coordinator.update_drop(2, { 5, 5, 10, 10 }, true);
    REQUIRE(coordinator.any_drop_registry().get(2) == Rect{ 5, 5, 10, 10 });
}

TEST_CASE("Unregister drop removes from either registry", "[coordinator][registry]")
{
    DragDropCoordinator coordinator;
    coordinator.register_drop(1, { 0, 0, 10, 10 }, false);
    coordinator.register_drop(2, { 0, 0, 10, 10 }, true);

    coordinator.unregister_drop(1);
    coordinator.unregister_drop(2);
    coordinator.unregister_drop(3);

    REQUIRE(coordinator.exact_drop_registry().empty());
    REQUIRE(coordinator.any_drop_registry().empty());
}

TEST_CASE("Updated drag frame is used by the next report", "[coordinator][registry]")
{
    DragDropCoordinator coordinator;
    setup_basic(coordinator);

    coordinator.update_drag(DRAG_A, { 180, 180, 50, 50 });
    coordinator.report(DRAG_A, { 10, 10 });

    REQUIRE(coordinator.current_collision_target() == DROP_C);
}

TEST_CASE("Updates and removals of unknown ids are ignored", "[coordinator][registry]")
{
    DragDropCoordinator coordinator;

    coordinator.update_drag(1, { 0, 0, 10, 10 });
    coordinator.unregister_drag(1);
    coordinator.update_drop(2, { 0, 0, 10, 10 }, true);
    coordinator.update_drop(2, { 0, 0, 10, 10 }, false);
    coordinator.unregister_drop(2);

    REQUIRE(coordinator.drag_registry().empty());
    REQUIRE(coordinator.exact_drop_registry().empty());
    REQUIRE(coordinator.any_drop_registry().empty());
}

TEST_CASE("Reused drag id survives a late unregister", "[coordinator][registry]")
{
    DragDropCoordinator coordinator;
    coordinator.register_drop(DROP_B, { 100, 0, 50, 50 }, true);

    coordinator.register_drag(DRAG_A, { 0, 0, 50, 50 });
    coordinator.register_drag(DRAG_A, { 0, 60, 50, 50 });
    coordinator.unregister_drag(DRAG_A);

    coordinator.report(DRAG_A, { 100, -40 });
    REQUIRE(coordinator.current_collision_target() == DROP_B);

    coordinator.unregister_drag(DRAG_A);
    coordinator.report(DRAG_A, { 100, -40 });
    REQUIRE_FALSE(coordinator.current_collision_target().has_value());
}

TEST_CASE("Anonymous ids are unique and reserved", "[coordinator]")
{
    DragDropCoordinator coordinator;

    ElementId first = coordinator.make_anonymous_id();
    ElementId second = coordinator.make_anonymous_id();

    REQUIRE(first != second);
    REQUIRE(first >= ANONYMOUS_ID_BASE);
    REQUIRE(second >= ANONYMOUS_ID_BASE);

    DragDropCoordinator other;
    REQUIRE(other.make_anonymous_id() == first);
}
