#pragma once

#include <string_view>

namespace mark_model {

// Default shape dimensions and drawing constants, in scene units (image pixels).

namespace defaults {

constexpr double circle_radius = 18.0;
constexpr double circle_min_scale = 0.6;
constexpr double circle_max_scale = 2.5;

constexpr double square_size = 36.0;
constexpr double triangle_size = 40.0;

constexpr double scurve_width = 43.0;
constexpr double scurve_height = 55.0;
constexpr double scurve_mid_radius = 8.0;
constexpr double scurve_curve = 0.9;
constexpr double scurve_stroke = 3.0;

constexpr std::string_view note_text = "하자";
constexpr double note_font_px = 16.0;
// Text items keep a small document margin around their glyphs.
constexpr double text_margin = 4.0;

constexpr double label_font_px = 18.0;
constexpr double label_margin_x = 6.0;
constexpr double label_margin_y = 2.0;

constexpr double leader_width = 2.0;
constexpr double leader_preview_opacity = 0.4;

constexpr double memo_stroke = 2.0;
constexpr double memo_hit_width = 10.0;

constexpr int circle_outline_segments = 64;
constexpr int curve_segments = 24;

constexpr std::string_view default_member = "벽체";

} // namespace defaults

} // namespace mark_model
