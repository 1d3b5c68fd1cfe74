#pragma once

#include <chrono>

namespace mark_scene {

// Interaction thresholds. Distances are scene units unless suffixed _px.

namespace tuning {

constexpr std::chrono::milliseconds press_hold_delay{500};
constexpr std::chrono::milliseconds edit_coalesce_delay{300};

constexpr double anchor_handle_radius_px = 10.0;

constexpr double min_memo_line_length = 8.0;
constexpr double min_memo_path_extent = 6.0;
// Drag-created shapes must travel at least their longest side plus this margin.
constexpr double creation_margin = 10.0;

constexpr double wheel_scale_factor = 1.1;
constexpr double view_zoom_factor = 1.15;

} // namespace tuning

} // namespace mark_scene
