#include <mark_geometry/flatten.hpp>
#include <cmath>
#include <numbers>

namespace mark_geometry {

Polyline flatten_cubic(Point p0, Point c1, Point c2, Point p3, int segments) {
    if (segments < 1) segments = 1;
    Polyline out;
    out.reserve(static_cast<std::size_t>(segments) + 1);
    for (int i = 0; i <= segments; ++i) {
        const double t = static_cast<double>(i) / segments;
        const double u = 1.0 - t;
        const double b0 = u * u * u;
        const double b1 = 3.0 * u * u * t;
        const double b2 = 3.0 * u * t * t;
        const double b3 = t * t * t;
        out.push_back({
            b0 * p0.x + b1 * c1.x + b2 * c2.x + b3 * p3.x,
            b0 * p0.y + b1 * c1.y + b2 * c2.y + b3 * p3.y,
        });
    }
    return out;
}

Polyline ellipse_polygon(Point center, double rx, double ry, int segments) {
    if (segments < 3) segments = 3;
    Polyline out;
    out.reserve(static_cast<std::size_t>(segments));
    for (int i = 0; i < segments; ++i) {
        const double a = 2.0 * std::numbers::pi * i / segments;
        out.push_back({center.x + rx * std::cos(a), center.y + ry * std::sin(a)});
    }
    return out;
}

} // namespace mark_geometry
