#include "dnd/core/geometry.hpp"
#include <cmath>

namespace dnd {

bool Rect::intersects(Rect const& other) const
{
    if (empty() || other.empty())
        return false;

    return min_x() < other.max_x() && other.min_x() < max_x() && min_y() < other.max_y() && other.min_y() < max_y();
}

namespace geometry {

double distance(Point a, Point b) { return std::hypot(a.x - b.x, a.y - b.y); }

double midpoint_distance(Rect const& a, Rect const& b) { return distance(a.midpoint(), b.midpoint()); }

} // namespace geometry

} // namespace dnd
