#include <mark_model/leader_line.hpp>
#include <mark_model/mark.hpp>
#include <mark_model/mark_constants.hpp>
#include <mark_geometry/intersect.hpp>

namespace mark_model {

void begin_attach(Mark& m, Point anchor) {
    if (!owns_leader_line(m.kind)) return;
    LeaderLine line;
    line.anchor = anchor;
    line.terminus = anchor;
    line.opacity = defaults::leader_preview_opacity;
    line.preview = true;
    m.leader = line;
}

void update_preview(Mark& m, Point target) {
    if (!m.leader) return;
    m.leader->terminus = target;
}

void recompute_geometry(Mark& m) {
    if (!m.leader || m.leader->preview) return;
    const Point center = scene_center(m);
    auto hit = mark_geometry::ray_intersection(outline_scene(m), m.leader->anchor, center, center);
    m.leader->terminus = hit.value_or(center);
}

void confirm_attach(Mark& m) {
    if (!m.leader) return;
    m.leader->opacity = 1.0;
    m.leader->preview = false;
    recompute_geometry(m);
}

void cancel_attach(Mark& m) {
    m.leader.reset();
}

void move_anchor(Mark& m, Point anchor) {
    if (!m.leader) return;
    m.leader->anchor = anchor;
    recompute_geometry(m);
}

void restore_attach(Mark& m, Point p1, Point p2) {
    if (!owns_leader_line(m.kind)) return;
    LeaderLine line;
    line.anchor = p1;
    line.terminus = p2;
    m.leader = line;
    recompute_geometry(m);
}

} // namespace mark_model
