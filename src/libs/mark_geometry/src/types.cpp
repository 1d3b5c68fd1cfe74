#include <mark_geometry/types.hpp>
#include <algorithm>
#include <cmath>

namespace mark_geometry {

double length(Point v) {
    return std::hypot(v.x, v.y);
}

double distance(Point a, Point b) {
    return length(b - a);
}

double manhattan_length(Point v) {
    return std::abs(v.x) + std::abs(v.y);
}

bool Rect::intersects(const Rect& o) const {
    return x <= o.right() && o.x <= right() && y <= o.bottom() && o.y <= bottom();
}

Rect Rect::adjusted(double margin) const {
    return {x - margin, y - margin, width + margin * 2, height + margin * 2};
}

Rect Rect::united(const Rect& o) const {
    if (is_null()) return o;
    if (o.is_null()) return *this;
    const double l = std::min(x, o.x);
    const double t = std::min(y, o.y);
    const double r = std::max(right(), o.right());
    const double b = std::max(bottom(), o.bottom());
    return {l, t, r - l, b - t};
}

Rect bounding_rect(const std::vector<Point>& points) {
    if (points.empty()) return {};
    double min_x = points.front().x;
    double min_y = points.front().y;
    double max_x = min_x;
    double max_y = min_y;
    for (const auto& p : points) {
        min_x = std::min(min_x, p.x);
        min_y = std::min(min_y, p.y);
        max_x = std::max(max_x, p.x);
        max_y = std::max(max_y, p.y);
    }
    return {min_x, min_y, max_x - min_x, max_y - min_y};
}

} // namespace mark_geometry
