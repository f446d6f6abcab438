#pragma once

#include <cstdint>

namespace dnd {

// ─────────────────────────────────────────────────────────────────────────────
// Identifiers
// ─────────────────────────────────────────────────────────────────────────────

/// Opaque element identifier supplied by the UI layer
using ElementId = uint64_t;

/// First identifier handed out for anonymous drop targets (high bit set)
constexpr ElementId ANONYMOUS_ID_BASE = ElementId{ 1 } << 63;

// ─────────────────────────────────────────────────────────────────────────────
// Basic geometry types
//
// All coordinates live in one shared 2-D space chosen by the UI layer.
// ─────────────────────────────────────────────────────────────────────────────

struct Point
{
    double x = 0.0;
    double y = 0.0;

    bool operator==(Point const&) const = default;
};

/// Cumulative translation of a dragged element
struct Offset
{
    double dx = 0.0;
    double dy = 0.0;

    bool is_zero() const { return dx == 0.0 && dy == 0.0; }

    bool operator==(Offset const&) const = default;
};

struct Rect
{
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    // A negative size extends the rect to the left of / above its origin.
    double min_x() const { return width < 0.0 ? x + width : x; }
    double min_y() const { return height < 0.0 ? y + height : y; }
    double max_x() const { return width < 0.0 ? x : x + width; }
    double max_y() const { return height < 0.0 ? y : y + height; }

    bool empty() const { return width == 0.0 || height == 0.0; }

    Point midpoint() const { return { x + width / 2.0, y + height / 2.0 }; }

    Rect translated(Offset offset) const { return { x + offset.dx, y + offset.dy, width, height }; }

    /**
     * @brief Strict overlap test.
     *
     * Rectangles that only share an edge or a corner do not intersect, and an
     * empty rectangle intersects nothing.
     */
    bool intersects(Rect const& other) const;

    bool operator==(Rect const&) const = default;
};

} // namespace dnd
