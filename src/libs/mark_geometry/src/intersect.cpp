#include <mark_geometry/intersect.hpp>
#include <cmath>
#include <limits>

namespace mark_geometry {

namespace {

constexpr double degenerate_direction = 2.0;
constexpr double min_direction_length = 1e-6;
constexpr double ray_length = 10000.0;
constexpr double min_hit_distance = 1e-6;

double cross(Point a, Point b) {
    return a.x * b.y - a.y * b.x;
}

} // namespace

std::optional<Point> intersect_segments(const Segment& a, const Segment& b) {
    const Point r = a.p2 - a.p1;
    const Point s = b.p2 - b.p1;
    const double denom = cross(r, s);
    if (std::abs(denom) < 1e-12) return std::nullopt;

    const Point qp = b.p1 - a.p1;
    const double t = cross(qp, s) / denom;
    const double u = cross(qp, r) / denom;
    if (t < 0.0 || t > 1.0 || u < 0.0 || u > 1.0) return std::nullopt;
    return a.p1 + r * t;
}

std::optional<Point> ray_intersection(const std::vector<Polyline>& outlines,
    Point origin, Point target, Point fallback_center)
{
    Point direction = target - origin;
    if (manhattan_length(direction) < degenerate_direction)
        direction = fallback_center - origin;

    const double len = length(direction);
    if (len < min_direction_length) return std::nullopt;

    const Segment ray{origin, origin + direction * (ray_length / len)};

    std::optional<Point> best;
    double best_dist = std::numeric_limits<double>::max();
    for (const auto& outline : outlines) {
        const std::size_t n = outline.size();
        if (n < 2) continue;
        for (std::size_t i = 0; i < n; ++i) {
            const Segment edge{outline[i], outline[(i + 1) % n]};
            auto hit = intersect_segments(ray, edge);
            if (!hit) continue;
            const double d = distance(origin, *hit);
            if (d <= min_hit_distance) continue;
            if (d < best_dist) {
                best_dist = d;
                best = hit;
            }
        }
    }
    return best;
}

double distance_to_segment(Point p, const Segment& s) {
    const Point d = s.p2 - s.p1;
    const double len2 = d.x * d.x + d.y * d.y;
    if (len2 <= 0.0) return distance(p, s.p1);
    double t = ((p.x - s.p1.x) * d.x + (p.y - s.p1.y) * d.y) / len2;
    if (t < 0.0) t = 0.0;
    if (t > 1.0) t = 1.0;
    return distance(p, s.p1 + d * t);
}

bool point_in_polygon(Point p, const Polyline& polygon) {
    bool inside = false;
    const std::size_t n = polygon.size();
    for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
        const Point& a = polygon[i];
        const Point& b = polygon[j];
        if ((a.y > p.y) != (b.y > p.y) &&
            p.x < (b.x - a.x) * (p.y - a.y) / (b.y - a.y) + a.x)
        {
            inside = !inside;
        }
    }
    return inside;
}

} // namespace mark_geometry
