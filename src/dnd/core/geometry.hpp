#pragma once

#include "dnd/core/types.hpp"

namespace dnd::geometry {

double distance(Point a, Point b);

/// Distance between the midpoints of two rectangles
double midpoint_distance(Rect const& a, Rect const& b);

} // namespace dnd::geometry
