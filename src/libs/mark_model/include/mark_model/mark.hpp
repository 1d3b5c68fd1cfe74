#pragma once

#include <mark_model/text_measure.hpp>
#include <mark_model/types.hpp>
#include <mark_geometry/transform.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace mark_model {

Mark make_circle(Point center, double radius = 0);
Mark make_square(Point center, double size = 0);
Mark make_triangle(Point center, double size = 0);
Mark make_scurve(Point center, double w = 0, double h = 0);
Mark make_note_text(Point top_left, std::string_view text, const TextMeasure& measure);
Mark make_memo_line(Point p1, Point p2);
Mark make_memo_free_path(Point start);

mark_geometry::Transform2D transform_of(const Mark& m);

Rect local_bounds(const Mark& m);
Rect scene_bounds(const Mark& m);
Point scene_center(const Mark& m);

// Closed scene-space outlines used to terminate leader lines.
std::vector<mark_geometry::Polyline> outline_scene(const Mark& m);

// Pointer picking on the mark body (labels are tested separately).
bool hit_test(const Mark& m, Point scene_pt);

void set_position(Mark& m, Point p);
void translate(Mark& m, Point delta);
// Circles saturate at [circle_min_scale, circle_max_scale]; other kinds only
// reject non-positive values.
void set_scale(Mark& m, double scale);
void set_rotation(Mark& m, double degrees);

void set_circle_id(Mark& m, int id);
void set_note_text(Mark& m, std::string_view text, const TextMeasure& measure);

void set_memo_end(Mark& m, Point p);
void add_memo_point(Mark& m, Point p);
double memo_line_length(const Mark& m);

// Position-changed hook: re-terminates the leader line and re-places the label.
void sync_attachments(Mark& m);

} // namespace mark_model
