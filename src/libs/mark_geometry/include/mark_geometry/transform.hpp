#pragma once

#include <mark_geometry/types.hpp>

namespace mark_geometry {

// Item placement: local coordinates are scaled and rotated about `origin`,
// then translated by `position`. Rotation is in degrees, clockwise on screen.
struct Transform2D {
    Point position;
    double scale = 1.0;
    double rotation = 0.0;
    Point origin;

    Point map(Point local) const;
    Point inverse_map(Point scene) const;
    Polyline map(const Polyline& local) const;
    // Axis-aligned bounds of the mapped rect corners.
    Rect map_bounds(const Rect& local) const;
};

} // namespace mark_geometry
