#pragma once

#include <vector>

namespace mark_geometry {

struct Point {
    double x = 0;
    double y = 0;

    bool operator==(const Point&) const = default;
};

inline Point operator+(Point a, Point b) { return {a.x + b.x, a.y + b.y}; }
inline Point operator-(Point a, Point b) { return {a.x - b.x, a.y - b.y}; }
inline Point operator*(Point a, double s) { return {a.x * s, a.y * s}; }

double length(Point v);
double distance(Point a, Point b);
double manhattan_length(Point v);

struct Size {
    double width = 0;
    double height = 0;
};

struct Rect {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;

    double right() const { return x + width; }
    double bottom() const { return y + height; }
    Point top_left() const { return {x, y}; }
    Point center() const { return {x + width * 0.5, y + height * 0.5}; }
    bool is_null() const { return width <= 0 && height <= 0; }
    bool contains(Point p) const { return p.x >= x && p.x <= right() && p.y >= y && p.y <= bottom(); }
    bool intersects(const Rect& o) const;
    Rect adjusted(double margin) const;
    Rect united(const Rect& o) const;
};

// Smallest axis-aligned rect holding every point; empty input yields a null rect.
Rect bounding_rect(const std::vector<Point>& points);

using Polyline = std::vector<Point>;

struct Segment {
    Point p1;
    Point p2;

    double length() const { return distance(p1, p2); }
};

} // namespace mark_geometry
