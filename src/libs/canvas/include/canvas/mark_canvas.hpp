#pragma once

#include <mark_scene/deadline_timer.hpp>
#include <mark_scene/editor_session.hpp>
#include <mark_model/text_measure.hpp>
#include "imgui.h"
#include <optional>
#include <string>

namespace canvas {

// Label and note measurement with the current ImGui font. Needs a live context.
mark_model::TextMeasure imgui_text_measure();

// Floor-plan canvas bound to one editor session: pan and zoom, pointer and
// keyboard mapping onto the controller, inline label/note editors, the shape
// palette, the defect detail panel and the status bar.
class MarkCanvas {
public:
    explicit MarkCanvas(mark_scene::EditorSession& session);

    void set_background_texture(ImTextureID texture) { background_ = texture; }
    // Fits the background into the next drawn region.
    void request_fit() { needs_fit_ = true; }

    void pan(float dx, float dy);
    void zoom_at(float screen_x, float screen_y, float zoom_delta);
    void reset_view();

    void screen_to_world(float screen_x, float screen_y, double& world_x, double& world_y) const;
    void world_to_screen(double world_x, double world_y, float& screen_x, float& screen_y) const;

    float offset_x() const { return offset_x_; }
    float offset_y() const { return offset_y_; }
    float zoom() const { return zoom_; }

    void draw_palette();
    bool update_and_draw(float region_width, float region_height, mark_scene::Clock::time_point now);
    void draw_detail_panel(mark_scene::Clock::time_point now);
    void draw_status_bar() const;

private:
    void fit_to_region(float region_width, float region_height);
    void sync_zoom();
    void handle_input(float region_width, float region_height, mark_scene::Clock::time_point now);
    void handle_keys(mark_scene::Clock::time_point now);
    void apply_result(const mark_scene::IntentResult& result);
    void draw_inline_editor();
    void finish_inline_editor(bool commit);
    void load_detail_buffers();

    mark_scene::EditorSession& session_;
    ImTextureID background_{};
    float offset_x_ = 0;
    float offset_y_ = 0;
    float zoom_ = 1.0f;
    float base_zoom_ = 1.0f;
    float region_width_ = 0;
    float region_height_ = 0;
    bool needs_fit_ = true;

    bool panning_ = false;
    float pan_start_x_ = 0;
    float pan_start_y_ = 0;
    float pan_start_offset_x_ = 0;
    float pan_start_offset_y_ = 0;
    bool left_down_in_canvas_ = false;
    ImVec2 last_mouse_{-1.0f, -1.0f};

    enum class InlineTarget { None, Label, Note };
    InlineTarget inline_target_ = InlineTarget::None;
    mark_model::MarkId inline_id_ = 0;
    bool inline_focus_pending_ = false;
    std::string inline_buffer_;

    std::optional<mark_model::MarkId> detail_bound_;
    bool detail_focus_pending_ = false;
    ImVec2 detail_min_{};
    ImVec2 detail_max_{};
    std::string member_buf_;
    std::string location_buf_;
    std::string type_buf_;
    std::string width_buf_;
    std::string length_buf_;
    std::string count_buf_;
    bool progress_ = false;
    std::string remark_buf_;
};

} // namespace canvas
