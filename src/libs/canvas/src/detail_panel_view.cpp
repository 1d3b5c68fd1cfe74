#include <canvas/mark_canvas.hpp>
#include "imgui.h"
#include "misc/cpp/imgui_stdlib.h"
#include <string>

namespace canvas {

void MarkCanvas::load_detail_buffers() {
    const auto* info = session_.detail_panel().info();
    if (!info) return;
    member_buf_ = info->member;
    location_buf_ = info->location;
    type_buf_ = info->defect_type;
    width_buf_ = info->size.width_mm;
    length_buf_ = info->size.length_m;
    count_buf_ = info->size.count_ea;
    progress_ = info->progress;
    remark_buf_ = info->remark;
}

void MarkCanvas::draw_detail_panel(mark_scene::Clock::time_point now) {
    auto& panel = session_.detail_panel();
    if (!panel.is_visible()) {
        detail_bound_.reset();
        detail_min_ = detail_max_ = ImVec2(0, 0);
        return;
    }
    if (detail_bound_ != panel.target()) {
        detail_bound_ = panel.target();
        load_detail_buffers();
        detail_focus_pending_ = true;
    }

    ImGui::BeginChild("detail_panel", ImVec2(0, 0), true);
    detail_min_ = ImGui::GetWindowPos();
    detail_max_ = ImVec2(detail_min_.x + ImGui::GetWindowWidth(), detail_min_.y + ImGui::GetWindowHeight());

    const auto focus = panel.focus_field();
    auto field = [&](const char* label, std::string& buf, mark_scene::DetailField which, float width) {
        if (detail_focus_pending_ && focus == which) {
            ImGui::SetKeyboardFocusHere();
            detail_focus_pending_ = false;
        }
        ImGui::SetNextItemWidth(width);
        if (ImGui::InputText(label, &buf)) panel.commit_field(which, buf, now);
    };

    field("부재", member_buf_, mark_scene::DetailField::Member, 160.0f);
    ImGui::SameLine();
    field("부위", location_buf_, mark_scene::DetailField::Location, 160.0f);
    ImGui::SameLine();
    field("유형 및 형상", type_buf_, mark_scene::DetailField::DefectType, 160.0f);
    field("폭(mm)", width_buf_, mark_scene::DetailField::WidthMm, 160.0f);
    ImGui::SameLine();
    field("길이(m)", length_buf_, mark_scene::DetailField::LengthM, 160.0f);
    ImGui::SameLine();
    field("개소(EA)", count_buf_, mark_scene::DetailField::CountEa, 160.0f);
    ImGui::SameLine();
    if (ImGui::Checkbox("진행", &progress_)) panel.commit_progress(progress_, now);
    field("##remark", remark_buf_, mark_scene::DetailField::Remark, -1.0f);
    detail_focus_pending_ = false;

    ImGui::EndChild();
}

} // namespace canvas
