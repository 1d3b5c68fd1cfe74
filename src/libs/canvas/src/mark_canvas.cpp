#include <canvas/mark_canvas.hpp>
#include <mark_render/render_scene.hpp>
#include <mark_scene/editor_tuning.hpp>
#include <mark_model/label.hpp>
#include <mark_model/mark.hpp>
#include "imgui.h"
#include "misc/cpp/imgui_stdlib.h"
#include <algorithm>
#include <cfloat>
#include <string>

namespace canvas {

namespace {

using mark_scene::Tool;

struct PaletteEntry {
    const char* label;
    Tool tool;
};

const PaletteEntry palette_entries[] = {
    {"메모 직선", Tool::MemoLine},
    {"메모 자유선", Tool::MemoFree},
    {"원", Tool::Circle},
    {"사각형", Tool::Square},
    {"삼각형", Tool::Triangle},
    {"균열", Tool::SCurve},
    {"텍스트", Tool::Text},
};

const float min_zoom = 0.1f;
const float max_zoom = 10.0f;
const float wheel_scroll_px = 40.0f;

} // namespace

mark_model::TextMeasure imgui_text_measure() {
    return [](std::string_view text, double font_px) {
        ImFont* font = ImGui::GetFont();
        const ImVec2 size = font->CalcTextSizeA((float)font_px, FLT_MAX, 0.0f,
            text.data(), text.data() + text.size());
        return mark_model::Size{size.x, size.y};
    };
}

MarkCanvas::MarkCanvas(mark_scene::EditorSession& session)
    : session_(session) {}

void MarkCanvas::pan(float dx, float dy) {
    offset_x_ += dx;
    offset_y_ += dy;
}

void MarkCanvas::zoom_at(float screen_x, float screen_y, float zoom_delta) {
    float new_zoom = zoom_ * zoom_delta;
    if (new_zoom < min_zoom) new_zoom = min_zoom;
    if (new_zoom > max_zoom) new_zoom = max_zoom;
    float factor = new_zoom / zoom_;
    offset_x_ = screen_x - (screen_x - offset_x_) * factor;
    offset_y_ = screen_y - (screen_y - offset_y_) * factor;
    zoom_ = new_zoom;
    sync_zoom();
}

void MarkCanvas::reset_view() {
    needs_fit_ = true;
}

void MarkCanvas::screen_to_world(float screen_x, float screen_y, double& world_x, double& world_y) const {
    world_x = (screen_x - offset_x_) / zoom_;
    world_y = (screen_y - offset_y_) / zoom_;
}

void MarkCanvas::world_to_screen(double world_x, double world_y, float& screen_x, float& screen_y) const {
    screen_x = (float)world_x * zoom_ + offset_x_;
    screen_y = (float)world_y * zoom_ + offset_y_;
}

void MarkCanvas::fit_to_region(float region_width, float region_height) {
    const ImVec2 origin = ImGui::GetCursorScreenPos();
    const auto size = session_.controller().scene().background_size();
    if (size.width > 0 && size.height > 0) {
        base_zoom_ = std::min(region_width / (float)size.width, region_height / (float)size.height);
        base_zoom_ = std::clamp(base_zoom_, min_zoom, max_zoom);
    } else {
        base_zoom_ = 1.0f;
    }
    zoom_ = base_zoom_;
    offset_x_ = origin.x + (region_width - (float)size.width * zoom_) * 0.5f;
    offset_y_ = origin.y + (region_height - (float)size.height * zoom_) * 0.5f;
    needs_fit_ = false;
    sync_zoom();
}

void MarkCanvas::sync_zoom() {
    session_.controller().set_view_scale(zoom_);
    session_.set_zoom(base_zoom_ > 0 ? zoom_ / base_zoom_ : 1.0);
}

void MarkCanvas::draw_palette() {
    auto& controller = session_.controller();
    for (const auto& entry : palette_entries) {
        if (ImGui::RadioButton(entry.label, controller.tool() == entry.tool))
            controller.set_tool(entry.tool);
        ImGui::SameLine();
    }
    bool area = controller.edit_mode() == mark_scene::EditMode::AreaSelect;
    if (ImGui::Checkbox("영역 선택", &area))
        controller.set_edit_mode(area ? mark_scene::EditMode::AreaSelect : mark_scene::EditMode::Select);
    ImGui::SameLine();
    if (ImGui::Button("화면 맞춤")) reset_view();
}

void MarkCanvas::apply_result(const mark_scene::IntentResult& result) {
    auto& controller = session_.controller();
    if (result.edit_label && controller.begin_label_edit(*result.edit_label)) {
        const auto* m = controller.scene().find(*result.edit_label);
        inline_target_ = InlineTarget::Label;
        inline_id_ = *result.edit_label;
        inline_buffer_ = m && m->label ? m->label->text : std::string{};
        inline_focus_pending_ = true;
    } else if (result.edit_note && controller.begin_note_edit(*result.edit_note)) {
        const auto* m = controller.scene().find(*result.edit_note);
        inline_target_ = InlineTarget::Note;
        inline_id_ = *result.edit_note;
        inline_buffer_ = m ? m->text : std::string{};
        inline_focus_pending_ = true;
    }
}

void MarkCanvas::handle_input(float region_width, float region_height, mark_scene::Clock::time_point now) {
    ImGuiIO& io = ImGui::GetIO();
    ImVec2 mouse = io.MousePos;
    ImVec2 win_min = ImGui::GetWindowPos();
    ImVec2 win_max = ImVec2(win_min.x + region_width, win_min.y + region_height);

    bool in_region = mouse.x >= win_min.x && mouse.x <= win_max.x &&
                     mouse.y >= win_min.y && mouse.y <= win_max.y &&
                     ImGui::IsWindowHovered() && !ImGui::IsAnyItemHovered();

    double wx = 0.0;
    double wy = 0.0;
    screen_to_world(mouse.x, mouse.y, wx, wy);
    const mark_model::Point world{wx, wy};

    if (ImGui::IsMouseClicked(0) && session_.detail_panel().is_visible()) {
        const mark_model::Rect bounds{detail_min_.x, detail_min_.y,
            detail_max_.x - detail_min_.x, detail_max_.y - detail_min_.y};
        session_.detail_panel().handle_global_press({mouse.x, mouse.y}, bounds);
    }

    if (ImGui::IsMouseClicked(2) && in_region) {
        panning_ = true;
        pan_start_x_ = mouse.x;
        pan_start_y_ = mouse.y;
        pan_start_offset_x_ = offset_x_;
        pan_start_offset_y_ = offset_y_;
    }
    if (ImGui::IsMouseReleased(2)) panning_ = false;
    if (panning_) {
        offset_x_ = pan_start_offset_x_ + (mouse.x - pan_start_x_);
        offset_y_ = pan_start_offset_y_ + (mouse.y - pan_start_y_);
    }

    if (inline_target_ == InlineTarget::None) {
        if (ImGui::IsMouseDoubleClicked(0) && in_region) {
            apply_result(session_.handle(mark_scene::DoubleClickAt{world}, now));
        } else if (ImGui::IsMouseClicked(0) && in_region) {
            left_down_in_canvas_ = true;
            apply_result(session_.handle(
                mark_scene::PressAt{world, {io.KeyCtrl, io.KeyShift}}, now));
        }

        const bool moved = mouse.x != last_mouse_.x || mouse.y != last_mouse_.y;
        if (moved && (in_region || left_down_in_canvas_)) {
            const bool down = left_down_in_canvas_ && ImGui::IsMouseDown(0);
            session_.handle(mark_scene::MoveTo{world, down}, now);
        }

        if (ImGui::IsMouseReleased(0) && left_down_in_canvas_) {
            left_down_in_canvas_ = false;
            session_.handle(mark_scene::ReleaseAt{world}, now);
        }
    }
    last_mouse_ = mouse;

    if (in_region && io.MouseWheel != 0.0f) {
        if (io.KeyCtrl) {
            const double factor = io.MouseWheel > 0 ? mark_scene::tuning::wheel_scale_factor
                                                    : 1.0 / mark_scene::tuning::wheel_scale_factor;
            session_.controller().scale_selected(factor, now);
        } else if (io.KeyShift) {
            const float factor = io.MouseWheel > 0 ? (float)mark_scene::tuning::view_zoom_factor
                                                   : 1.0f / (float)mark_scene::tuning::view_zoom_factor;
            zoom_at(mouse.x, mouse.y, factor);
        } else {
            pan(0.0f, io.MouseWheel * wheel_scroll_px);
        }
    }
}

void MarkCanvas::handle_keys(mark_scene::Clock::time_point now) {
    ImGuiIO& io = ImGui::GetIO();
    if (io.WantTextInput) return;

    if (ImGui::IsKeyPressed(ImGuiKey_Delete)) session_.delete_selected();
    if (!io.KeyCtrl) return;
    if (ImGui::IsKeyPressed(ImGuiKey_Z, false)) session_.undo();
    if (ImGui::IsKeyPressed(ImGuiKey_Y, false)) session_.redo();
    if (ImGui::IsKeyPressed(ImGuiKey_S, false)) {
        session_.tick(now);
        session_.save_if_dirty();
    }
    if (ImGui::IsKeyPressed(ImGuiKey_0, false)) reset_view();
}

void MarkCanvas::finish_inline_editor(bool commit) {
    auto& controller = session_.controller();
    const std::string text = inline_buffer_;
    if (inline_target_ == InlineTarget::Label) {
        if (commit) controller.commit_label_edit(inline_id_, text);
        else controller.cancel_label_edit(inline_id_);
    } else if (inline_target_ == InlineTarget::Note) {
        const auto* m = controller.scene().find(inline_id_);
        controller.commit_note_text(inline_id_, commit ? text : (m ? m->text : std::string{}));
    }
    inline_target_ = InlineTarget::None;
}

void MarkCanvas::draw_inline_editor() {
    if (inline_target_ == InlineTarget::None) return;
    const auto* m = session_.controller().scene().find(inline_id_);
    if (!m) {
        inline_target_ = InlineTarget::None;
        return;
    }

    const mark_model::Rect box = inline_target_ == InlineTarget::Label
        ? mark_model::label_scene_bounds(*m) : mark_model::scene_bounds(*m);
    float sx = 0, sy = 0;
    world_to_screen(box.x, box.y, sx, sy);
    ImGui::SetCursorScreenPos(ImVec2(sx, sy));
    ImGui::SetNextItemWidth(std::max(120.0f, (float)box.width * zoom_ + 40.0f));
    if (inline_focus_pending_) {
        ImGui::SetKeyboardFocusHere();
        inline_focus_pending_ = false;
    }

    const bool entered = ImGui::InputText("##inline_edit", &inline_buffer_,
        ImGuiInputTextFlags_EnterReturnsTrue | ImGuiInputTextFlags_AutoSelectAll);
    if (entered) {
        finish_inline_editor(true);
    } else if (ImGui::IsItemActive() && ImGui::IsKeyPressed(ImGuiKey_Escape)) {
        finish_inline_editor(false);
    } else if (ImGui::IsItemDeactivated()) {
        finish_inline_editor(true);
    }
}

bool MarkCanvas::update_and_draw(float region_width, float region_height, mark_scene::Clock::time_point now) {
    if (region_width <= 0 || region_height <= 0) return false;

    region_width_ = region_width;
    region_height_ = region_height;
    if (needs_fit_) fit_to_region(region_width, region_height);

    session_.tick(now);
    handle_input(region_width, region_height, now);
    handle_keys(now);

    ImDrawList* draw_list = ImGui::GetWindowDrawList();
    if (!draw_list) return true;

    mark_render::render_scene(draw_list, session_.controller(), background_, offset_x_, offset_y_, zoom_);
    draw_inline_editor();
    return true;
}

void MarkCanvas::draw_status_bar() const {
    const auto& controller = session_.controller();
    ImGui::Text("%s  |  선택 %zu개  |  확대 %d%%  |  %s",
        session_.is_dirty() ? "저장 안 됨 *" : "저장됨",
        controller.scene().selected_ids().size(),
        (int)(session_.zoom() * 100.0 + 0.5),
        mark_scene::drag_mode_name(controller.drag_mode()));
}

} // namespace canvas
