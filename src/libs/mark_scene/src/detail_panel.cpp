#include <mark_scene/detail_panel.hpp>
#include <mark_scene/scene_controller.hpp>

namespace mark_scene {

namespace {

bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

DetailPanel::DetailPanel(SceneController& controller)
    : controller_(controller)
{
}

bool DetailPanel::show_for_circle(MarkId id) {
    Mark* m = controller_.scene().find(id);
    if (!m || !mark_model::has_defect_record(m->kind)) return false;
    if (!m->defect) m->defect = mark_model::DefectInfo{};
    controller_.scene().select_only(id);
    target_ = id;
    return true;
}

void DetailPanel::hide() {
    target_.reset();
}

const mark_model::DefectInfo* DetailPanel::info() const {
    if (!target_) return nullptr;
    const Mark* m = controller_.scene().find(*target_);
    if (!m || !m->defect) return nullptr;
    return &*m->defect;
}

void DetailPanel::commit(const mark_model::DefectInfo& info, Clock::time_point now) {
    if (!target_) return;
    controller_.apply_defect_info(*target_, info, now);
}

void DetailPanel::commit_field(DetailField field, const std::string& value, Clock::time_point now) {
    const auto* current = info();
    if (!current) return;
    mark_model::DefectInfo next = *current;
    switch (field) {
    case DetailField::Member: next.member = value; break;
    case DetailField::Location: next.location = value; break;
    case DetailField::DefectType: next.defect_type = value; break;
    case DetailField::WidthMm: next.size.width_mm = value; break;
    case DetailField::LengthM: next.size.length_m = value; break;
    case DetailField::CountEa: next.size.count_ea = value; break;
    case DetailField::Remark: next.remark = value; break;
    case DetailField::Progress: return;
    }
    commit(next, now);
}

void DetailPanel::commit_progress(bool in_progress, Clock::time_point now) {
    const auto* current = info();
    if (!current) return;
    mark_model::DefectInfo next = *current;
    next.progress = in_progress;
    commit(next, now);
}

bool DetailPanel::handle_global_press(Point screen_pt, const Rect& panel_bounds) {
    if (!target_) return false;
    if (panel_bounds.contains(screen_pt)) return false;
    hide();
    return true;
}

DetailField DetailPanel::focus_field() const {
    const auto* current = info();
    if (!current) return DetailField::Member;
    if (is_blank(current->member)) return DetailField::Member;
    if (is_blank(current->location)) return DetailField::Location;
    if (is_blank(current->defect_type)) return DetailField::DefectType;
    return DetailField::Member;
}

} // namespace mark_scene
