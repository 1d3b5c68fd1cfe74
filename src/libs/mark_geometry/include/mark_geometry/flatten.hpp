#pragma once

#include <mark_geometry/types.hpp>

namespace mark_geometry {

Polyline flatten_cubic(Point p0, Point c1, Point c2, Point p3, int segments = 24);
Polyline ellipse_polygon(Point center, double rx, double ry, int segments = 64);

} // namespace mark_geometry
