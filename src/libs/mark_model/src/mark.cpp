#include <mark_model/mark.hpp>
#include <mark_model/label.hpp>
#include <mark_model/leader_line.hpp>
#include <mark_model/mark_constants.hpp>
#include <mark_geometry/flatten.hpp>
#include <mark_geometry/intersect.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace mark_model {

namespace {

double triangle_height(double side) {
    return side * std::sqrt(3.0) * 0.5;
}

mark_geometry::Polyline scurve_path(const Mark& m) {
    const double top = -m.h * 0.5;
    const double bottom = m.h * 0.5;
    const double w2 = m.w * 0.5;
    return mark_geometry::flatten_cubic(
        {0, top},
        {-w2 * m.curve, top + m.h * 0.25},
        {w2 * m.curve, top + m.h * 0.75},
        {0, bottom},
        defaults::curve_segments);
}

mark_geometry::Polyline rect_ring(const Rect& r) {
    return {{r.x, r.y}, {r.right(), r.y}, {r.right(), r.bottom()}, {r.x, r.bottom()}};
}

bool near_polyline(const mark_geometry::Polyline& pts, Point p, double tolerance) {
    if (pts.empty()) return false;
    if (pts.size() == 1) return mark_geometry::distance(pts.front(), p) <= tolerance;
    for (std::size_t i = 0; i + 1 < pts.size(); ++i) {
        if (mark_geometry::distance_to_segment(p, {pts[i], pts[i + 1]}) <= tolerance)
            return true;
    }
    return false;
}

} // namespace

Mark make_circle(Point center, double radius) {
    Mark m;
    m.kind = MarkKind::Circle;
    m.pos = center;
    m.radius = radius > 0 ? radius : defaults::circle_radius;
    return m;
}

Mark make_square(Point center, double size) {
    Mark m;
    m.kind = MarkKind::Square;
    m.pos = center;
    m.size = size > 0 ? size : defaults::square_size;
    return m;
}

Mark make_triangle(Point center, double size) {
    Mark m;
    m.kind = MarkKind::Triangle;
    m.pos = center;
    m.size = size > 0 ? size : defaults::triangle_size;
    return m;
}

Mark make_scurve(Point center, double w, double h) {
    Mark m;
    m.kind = MarkKind::SCurve;
    m.pos = center;
    m.w = w > 0 ? w : defaults::scurve_width;
    m.h = h > 0 ? h : defaults::scurve_height;
    m.mid_radius = defaults::scurve_mid_radius;
    m.curve = defaults::scurve_curve;
    return m;
}

Mark make_note_text(Point top_left, std::string_view text, const TextMeasure& measure) {
    Mark m;
    m.kind = MarkKind::NoteText;
    m.pos = top_left;
    set_note_text(m, text, measure);
    return m;
}

Mark make_memo_line(Point p1, Point p2) {
    Mark m;
    m.kind = MarkKind::MemoLine;
    m.points = {p1, p2};
    return m;
}

Mark make_memo_free_path(Point start) {
    Mark m;
    m.kind = MarkKind::MemoFreePath;
    m.points = {start};
    return m;
}

mark_geometry::Transform2D transform_of(const Mark& m) {
    mark_geometry::Transform2D t;
    if (is_memo(m.kind)) return t;
    t.position = m.pos;
    t.scale = m.scale;
    t.rotation = m.rotation;
    t.origin = local_bounds(m).center();
    return t;
}

Rect local_bounds(const Mark& m) {
    switch (m.kind) {
    case MarkKind::Circle:
        return {-m.radius, -m.radius, m.radius * 2, m.radius * 2};
    case MarkKind::Square:
        return {-m.size * 0.5, -m.size * 0.5, m.size, m.size};
    case MarkKind::Triangle: {
        const double h = triangle_height(m.size);
        return {-m.size * 0.5, -h * 0.5, m.size, h};
    }
    case MarkKind::SCurve:
        return {-m.w * 0.5, -m.h * 0.5, m.w, m.h};
    case MarkKind::NoteText:
        return {0, 0, m.text_size.width + defaults::text_margin * 2,
            m.text_size.height + defaults::text_margin * 2};
    case MarkKind::MemoLine:
    case MarkKind::MemoFreePath:
        return mark_geometry::bounding_rect(m.points);
    }
    return {};
}

Rect scene_bounds(const Mark& m) {
    return transform_of(m).map_bounds(local_bounds(m));
}

Point scene_center(const Mark& m) {
    return transform_of(m).map(local_bounds(m).center());
}

std::vector<mark_geometry::Polyline> outline_scene(const Mark& m) {
    const auto t = transform_of(m);
    std::vector<mark_geometry::Polyline> out;
    switch (m.kind) {
    case MarkKind::Circle:
        out.push_back(t.map(mark_geometry::ellipse_polygon({0, 0}, m.radius, m.radius,
            defaults::circle_outline_segments)));
        break;
    case MarkKind::Square:
    case MarkKind::NoteText:
        out.push_back(t.map(rect_ring(local_bounds(m))));
        break;
    case MarkKind::Triangle: {
        const double h = triangle_height(m.size);
        out.push_back(t.map(mark_geometry::Polyline{
            {0, -h * 0.5}, {-m.size * 0.5, h * 0.5}, {m.size * 0.5, h * 0.5}}));
        break;
    }
    case MarkKind::SCurve:
        out.push_back(t.map(scurve_path(m)));
        out.push_back(t.map(mark_geometry::ellipse_polygon({0, 0}, m.mid_radius, m.mid_radius,
            defaults::circle_outline_segments)));
        break;
    case MarkKind::MemoLine:
    case MarkKind::MemoFreePath:
        out.push_back(m.points);
        break;
    }
    return out;
}

bool hit_test(const Mark& m, Point scene_pt) {
    if (!m.visible) return false;

    if (is_memo(m.kind))
        return near_polyline(m.points, scene_pt, defaults::memo_hit_width * 0.5);

    const Point local = transform_of(m).inverse_map(scene_pt);
    switch (m.kind) {
    case MarkKind::Circle:
        return mark_geometry::length(local) <= m.radius;
    case MarkKind::Square:
    case MarkKind::NoteText:
        return local_bounds(m).contains(local);
    case MarkKind::Triangle: {
        const double h = triangle_height(m.size);
        return mark_geometry::point_in_polygon(local,
            {{0, -h * 0.5}, {-m.size * 0.5, h * 0.5}, {m.size * 0.5, h * 0.5}});
    }
    case MarkKind::SCurve:
        if (mark_geometry::length(local) <= m.mid_radius) return true;
        return near_polyline(scurve_path(m), local, defaults::scurve_stroke * 0.5 + 2.0);
    default:
        return false;
    }
}

void set_position(Mark& m, Point p) {
    m.pos = p;
    sync_attachments(m);
}

void translate(Mark& m, Point delta) {
    if (is_memo(m.kind)) {
        for (auto& p : m.points) p = p + delta;
        return;
    }
    set_position(m, m.pos + delta);
}

void set_scale(Mark& m, double scale) {
    if (!(scale > 0.0)) {
        spdlog::debug("set_scale ignored kind={} scale={}", kind_name(m.kind), scale);
        return;
    }
    if (m.kind == MarkKind::Circle)
        scale = std::clamp(scale, defaults::circle_min_scale, defaults::circle_max_scale);
    m.scale = scale;
    sync_attachments(m);
}

void set_rotation(Mark& m, double degrees) {
    m.rotation = degrees;
    sync_attachments(m);
}

void set_circle_id(Mark& m, int id) {
    if (m.kind != MarkKind::Circle) return;
    m.display_id = id;
}

void set_note_text(Mark& m, std::string_view text, const TextMeasure& measure) {
    m.text = std::string(text);
    m.text_size = measure(m.text, defaults::note_font_px);
}

void set_memo_end(Mark& m, Point p) {
    if (m.kind != MarkKind::MemoLine) return;
    if (m.points.size() < 2) m.points.resize(2, p);
    m.points[1] = p;
}

void add_memo_point(Mark& m, Point p) {
    if (m.kind != MarkKind::MemoFreePath) return;
    m.points.push_back(p);
}

double memo_line_length(const Mark& m) {
    if (m.points.size() < 2) return 0.0;
    return mark_geometry::distance(m.points.front(), m.points.back());
}

void sync_attachments(Mark& m) {
    recompute_geometry(m);
    reposition_label(m);
}

} // namespace mark_model
