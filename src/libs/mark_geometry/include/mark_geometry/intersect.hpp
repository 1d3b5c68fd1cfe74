#pragma once

#include <mark_geometry/types.hpp>
#include <optional>
#include <vector>

namespace mark_geometry {

// Bounded intersection of two segments (both parameters within [0, 1]).
std::optional<Point> intersect_segments(const Segment& a, const Segment& b);

// Casts a ray from `origin` toward `target` against closed outlines (the last
// vertex of each outline connects back to the first) and returns the nearest hit.
// A near-degenerate direction falls back to `fallback_center`; hits closer than
// epsilon to the origin are ignored.
std::optional<Point> ray_intersection(const std::vector<Polyline>& outlines,
    Point origin, Point target, Point fallback_center);

double distance_to_segment(Point p, const Segment& s);
bool point_in_polygon(Point p, const Polyline& polygon);

} // namespace mark_geometry
