#include <mark_geometry/transform.hpp>
#include <cmath>
#include <numbers>

namespace mark_geometry {

namespace {

Point rotate(Point v, double degrees) {
    const double rad = degrees * std::numbers::pi / 180.0;
    const double c = std::cos(rad);
    const double s = std::sin(rad);
    return {v.x * c - v.y * s, v.x * s + v.y * c};
}

} // namespace

Point Transform2D::map(Point local) const {
    const Point rel = (local - origin) * scale;
    return position + origin + rotate(rel, rotation);
}

Point Transform2D::inverse_map(Point scene) const {
    const Point rel = rotate(scene - position - origin, -rotation);
    if (scale == 0.0) return origin;
    return origin + rel * (1.0 / scale);
}

Polyline Transform2D::map(const Polyline& local) const {
    Polyline out;
    out.reserve(local.size());
    for (const auto& p : local) out.push_back(map(p));
    return out;
}

Rect Transform2D::map_bounds(const Rect& local) const {
    return bounding_rect({
        map({local.x, local.y}),
        map({local.right(), local.y}),
        map({local.right(), local.bottom()}),
        map({local.x, local.bottom()}),
    });
}

} // namespace mark_geometry
