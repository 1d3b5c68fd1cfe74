#include "project_browser.hpp"
#include <inspection_loaders/project_files.hpp>
#include <inspection_model/inspections.hpp>
#include <inspection_model/project_edit.hpp>
#include <mark_loaders/defect_set.hpp>
#include <mark_scene/editor_log.hpp>
#include <report_export/report_exporter.hpp>
#include "imgui.h"
#include "misc/cpp/imgui_stdlib.h"
#include <cstdint>
#include <filesystem>
#include <utility>

namespace {

} // namespace

ProjectBrowser::ProjectBrowser(AppOptions options)
    : options_(std::move(options)) {}

ProjectBrowser::~ProjectBrowser() = default;

void ProjectBrowser::init() {
    if (auto index = inspection_loaders::load_index(options_.index_path)) {
        index_ = std::move(*index);
    } else {
        critical("프로젝트 목록을 읽을 수 없습니다:\n" + options_.index_path);
    }
    if (!options_.project_path.empty()) open_project(options_.project_path);
}

bool ProjectBrowser::request_quit() {
    if (session_ && session_->needs_close_confirmation()) {
        close_requested_ = true;
        quit_after_close_ = true;
        return false;
    }
    quit_confirmed_ = true;
    return true;
}

void ProjectBrowser::on_dirty_changed(bool dirty) {
    mark_scene::editor_logger()->debug("editor_dirty value={}", dirty);
}

void ProjectBrowser::on_save_requested(const nlohmann::json& defects) {
    if (!project_) return;
    auto* part = inspection_model::find_part(*project_, editing_part_);
    auto* sp = part ? inspection_model::find_subpart(*part, editing_subpart_) : nullptr;
    if (!sp) {
        critical("저장할 소분류를 찾을 수 없습니다.");
        return;
    }
    inspection_model::set_defects(*sp, editing_inspection_, mark_loaders::items_to_defect_map(defects));
    if (!save_project()) critical("프로젝트 저장에 실패했습니다:\n" + project_path_);
}

void ProjectBrowser::on_open_defect_detail(mark_model::MarkId id) {
    mark_scene::editor_logger()->debug("detail_opened id={}", id);
}

void ProjectBrowser::on_zoom_changed(double zoom) {
    mark_scene::editor_logger()->debug("zoom_changed value={:.2f}", zoom);
}

bool ProjectBrowser::open_project(const std::string& path) {
    auto loaded = inspection_loaders::load_project(path);
    if (!loaded) {
        critical("프로젝트를 열 수 없습니다:\n" + path);
        return false;
    }
    close_editor();
    project_ = std::move(*loaded);
    project_path_ = path;
    selected_part_.clear();
    selected_subpart_.clear();
    selected_inspection_.clear();
    building_name_buf_ = project_->building.name;
    building_address_buf_ = project_->building.address;
    building_location_buf_ = project_->building.location;
    building_memo_buf_ = project_->building.memo;
    return true;
}

bool ProjectBrowser::save_project() {
    if (!project_) return false;
    return inspection_loaders::save_project(*project_, project_path_);
}

void ProjectBrowser::create_project(const std::string& building_name) {
    inspection_model::Project project = inspection_model::Project::create_empty();
    project.building.name = building_name;

    const std::filesystem::path dir = std::filesystem::path(options_.index_path).parent_path();
    const std::string path = (dir / (project.id + ".json")).string();
    if (!inspection_loaders::save_project(project, path)) {
        critical("프로젝트 파일을 만들 수 없습니다:\n" + path);
        return;
    }
    index_[project.id] = path;
    if (!inspection_loaders::save_index(index_, options_.index_path))
        critical("프로젝트 목록을 저장할 수 없습니다:\n" + options_.index_path);
    open_project(path);
}

inspection_model::Part* ProjectBrowser::current_part() {
    return project_ ? inspection_model::find_part(*project_, selected_part_) : nullptr;
}

inspection_model::SubPart* ProjectBrowser::current_subpart() {
    auto* part = current_part();
    return part ? inspection_model::find_subpart(*part, selected_subpart_) : nullptr;
}

void ProjectBrowser::warn(std::string message) {
    warning_ = std::move(message);
    warning_pending_ = true;
}

void ProjectBrowser::critical(std::string message) {
    mark_scene::editor_logger()->error("app_error {}", message);
    critical_ = std::move(message);
    critical_pending_ = true;
}

void ProjectBrowser::begin_defect_editing() {
    auto* sp = current_subpart();
    if (!sp || selected_inspection_.empty() || !sp->inspections.count(selected_inspection_)) {
        warn("하자를 편집하려면 점검을 먼저 선택하세요.");
        return;
    }
    if (!texture_.load(sp->image_path)) {
        critical("도면 이미지를 열 수 없습니다:\n" + sp->image_path);
        return;
    }

    session_ = std::make_unique<mark_scene::EditorSession>(this, canvas::imgui_text_measure());
    session_->open(sp->image_path, texture_.size(), inspection_model::get_defects(*sp, selected_inspection_));
    canvas_ = std::make_unique<canvas::MarkCanvas>(*session_);
    canvas_->set_background_texture((ImTextureID)(intptr_t)texture_.gl_name());
    canvas_->request_fit();
    editing_part_ = selected_part_;
    editing_subpart_ = selected_subpart_;
    editing_inspection_ = selected_inspection_;
}

void ProjectBrowser::close_editor() {
    canvas_.reset();
    session_.reset();
    texture_.release();
    close_requested_ = false;
}

void ProjectBrowser::export_reports() {
    auto* part = current_part();
    auto* sp = current_subpart();
    if (!project_ || !part || !sp) {
        warn("보고서를 내보낼 소분류를 선택하세요.");
        return;
    }
    const std::string out_dir = !options_.reports_dir.empty()
        ? options_.reports_dir
        : std::filesystem::path(project_path_).parent_path().string();

    report_export::ReportExporter exporter(*project_, *part, *sp, out_dir, options_.templates_dir);
    const auto visual = exporter.export_visual_inspection();
    const auto drawing = exporter.export_defect_drawing();
    if (!visual || !drawing) {
        critical("보고서 생성에 실패했습니다.\n템플릿 폴더를 확인하세요: " + options_.templates_dir);
        return;
    }
    warn("보고서를 저장했습니다:\n" + *visual + "\n" + *drawing);
}

void ProjectBrowser::draw(mark_scene::Clock::time_point now) {
    if (session_) {
        draw_editor_window(now);
    } else {
        ImGui::BeginChild("projects", ImVec2(260, 0), true);
        draw_project_list();
        ImGui::EndChild();
        ImGui::SameLine();
        ImGui::BeginChild("project", ImVec2(0, 0), true);
        if (project_) {
            draw_building_info();
            ImGui::Separator();
            const float column = ImGui::GetContentRegionAvail().x / 3.0f - 6.0f;
            ImGui::BeginChild("parts", ImVec2(column, 0), true);
            draw_parts();
            ImGui::EndChild();
            ImGui::SameLine();
            ImGui::BeginChild("subparts", ImVec2(column, 0), true);
            draw_subparts();
            ImGui::EndChild();
            ImGui::SameLine();
            ImGui::BeginChild("inspections", ImVec2(0, 0), true);
            draw_inspections();
            ImGui::EndChild();
        } else {
            ImGui::TextDisabled("프로젝트를 선택하거나 새로 만드세요.");
        }
        ImGui::EndChild();
    }

    draw_name_dialog();
    draw_inspection_dialog();
    draw_delete_confirmation();
    draw_close_confirmation();
    draw_messages();
}

void ProjectBrowser::draw_project_list() {
    ImGui::TextUnformatted("프로젝트");
    if (ImGui::BeginListBox("##project_index", ImVec2(-1, -ImGui::GetFrameHeightWithSpacing()))) {
        for (const auto& [id, path] : index_) {
            const bool selected = project_ && project_->id == id;
            if (ImGui::Selectable((id + "##" + path).c_str(), selected) && !selected)
                open_project(path);
        }
        ImGui::EndListBox();
    }
    if (ImGui::Button("새 프로젝트")) open_name_dialog(NameTarget::NewProject, "");
}

void ProjectBrowser::draw_building_info() {
    ImGui::InputText("건물명", &building_name_buf_);
    ImGui::InputText("주소", &building_address_buf_);
    ImGui::InputText("위치", &building_location_buf_);
    ImGui::InputTextMultiline("메모", &building_memo_buf_, ImVec2(0, 60));
    if (ImGui::Button("건물 정보 저장")) {
        project_->building.name = building_name_buf_;
        project_->building.address = building_address_buf_;
        project_->building.location = building_location_buf_;
        project_->building.memo = building_memo_buf_;
        if (!save_project()) critical("프로젝트 저장에 실패했습니다:\n" + project_path_);
    }
    ImGui::SameLine();
    if (ImGui::Button("보고서 내보내기")) export_reports();
}

void ProjectBrowser::draw_parts() {
    ImGui::TextUnformatted("대분류");
    if (ImGui::BeginListBox("##parts", ImVec2(-1, -ImGui::GetFrameHeightWithSpacing()))) {
        for (const auto& part : project_->parts) {
            if (ImGui::Selectable((part.name + "##" + part.id).c_str(), part.id == selected_part_)) {
                if (selected_part_ != part.id) {
                    selected_subpart_.clear();
                    selected_inspection_.clear();
                }
                selected_part_ = part.id;
            }
        }
        ImGui::EndListBox();
    }
    if (ImGui::Button("추가##part")) open_name_dialog(NameTarget::NewPart, "");
    ImGui::SameLine();
    if (auto* part = current_part()) {
        if (ImGui::Button("이름 변경##part")) open_name_dialog(NameTarget::RenamePart, part->name);
        ImGui::SameLine();
        if (ImGui::Button("삭제##part")) {
            delete_target_ = DeleteTarget::Part;
            delete_pending_ = true;
        }
    }
}

void ProjectBrowser::draw_subparts() {
    ImGui::TextUnformatted("소분류");
    auto* part = current_part();
    if (!part) {
        ImGui::TextDisabled("대분류를 선택하세요.");
        return;
    }
    if (ImGui::BeginListBox("##subparts", ImVec2(-1, -ImGui::GetFrameHeightWithSpacing()))) {
        for (const auto& sp : part->subparts) {
            if (ImGui::Selectable((sp.name + "##" + sp.id).c_str(), sp.id == selected_subpart_)) {
                if (selected_subpart_ != sp.id) selected_inspection_.clear();
                selected_subpart_ = sp.id;
            }
        }
        ImGui::EndListBox();
    }
    if (ImGui::Button("추가##sub")) open_name_dialog(NameTarget::NewSubPart, "");
    ImGui::SameLine();
    if (auto* sp = current_subpart()) {
        if (ImGui::Button("이름 변경##sub")) open_name_dialog(NameTarget::RenameSubPart, sp->name);
        ImGui::SameLine();
        if (ImGui::Button("삭제##sub")) {
            delete_target_ = DeleteTarget::SubPart;
            delete_pending_ = true;
        }
    }
}

void ProjectBrowser::draw_inspections() {
    ImGui::TextUnformatted("점검");
    auto* sp = current_subpart();
    if (!sp) {
        ImGui::TextDisabled("소분류를 선택하세요.");
        return;
    }
    if (ImGui::BeginListBox("##inspections", ImVec2(-1, -ImGui::GetFrameHeightWithSpacing() * 2))) {
        for (const auto& key : inspection_model::list_inspections(*sp)) {
            const auto& insp = sp->inspections.at(key);
            std::string line = inspection_model::inspection_title(*sp, key);
            if (!insp.start_date.empty()) line += "  (" + insp.start_date + " ~ " + insp.end_date.value_or("") + ")";
            if (ImGui::Selectable((line + "##" + key).c_str(), key == selected_inspection_))
                selected_inspection_ = key;
        }
        ImGui::EndListBox();
    }
    if (ImGui::Button("추가##insp")) open_inspection_dialog(InspectionDialog::Add);
    const bool has_selection = sp->inspections.count(selected_inspection_) > 0;
    if (has_selection) {
        ImGui::SameLine();
        if (ImGui::Button("수정##insp")) open_inspection_dialog(InspectionDialog::Edit);
        ImGui::SameLine();
        if (ImGui::Button("복사##insp")) open_inspection_dialog(InspectionDialog::Copy);
        ImGui::SameLine();
        if (ImGui::Button("삭제##insp")) {
            delete_target_ = DeleteTarget::Inspection;
            delete_pending_ = true;
        }
    }
    if (ImGui::Button("하자 편집")) begin_defect_editing();
}

void ProjectBrowser::draw_editor_window(mark_scene::Clock::time_point now) {
    canvas_->draw_palette();
    ImGui::SameLine();
    if (ImGui::Button("저장")) {
        session_->tick(now);
        session_->save_if_dirty();
    }
    ImGui::SameLine();
    if (ImGui::Button("닫기")) {
        if (session_->needs_close_confirmation()) close_requested_ = true;
        else close_editor();
    }
    if (!session_) return;

    const float detail_height = session_->detail_panel().is_visible() ? 110.0f : 0.0f;
    const float status_height = ImGui::GetFrameHeightWithSpacing();
    ImVec2 canvas_size = ImGui::GetContentRegionAvail();
    canvas_size.y -= detail_height + status_height;
    if (canvas_size.x > 0 && canvas_size.y > 0) {
        ImGui::BeginChild("canvas", canvas_size, false,
            ImGuiWindowFlags_NoScrollbar | ImGuiWindowFlags_NoScrollWithMouse);
        canvas_->update_and_draw(canvas_size.x, canvas_size.y, now);
        ImGui::EndChild();
    }
    if (detail_height > 0) canvas_->draw_detail_panel(now);
    canvas_->draw_status_bar();
}

void ProjectBrowser::open_name_dialog(NameTarget target, const std::string& initial) {
    name_target_ = target;
    name_buf_ = initial;
    image_buf_.clear();
    name_dialog_pending_ = true;
}

void ProjectBrowser::apply_name_dialog() {
    const std::string name = name_buf_;
    switch (name_target_) {
    case NameTarget::NewProject:
        if (name.find_first_not_of(' ') == std::string::npos) {
            warn("건물명을 입력하세요.");
            return;
        }
        create_project(name);
        return;
    case NameTarget::NewPart:
        if (auto* part = inspection_model::add_part(*project_, name)) selected_part_ = part->id;
        else warn("이름을 입력하세요.");
        break;
    case NameTarget::RenamePart:
        if (!inspection_model::rename_part(*project_, selected_part_, name)) warn("이름을 입력하세요.");
        break;
    case NameTarget::NewSubPart:
        if (auto* part = current_part()) {
            if (auto* sp = inspection_model::add_subpart(*part, name, image_buf_))
                selected_subpart_ = sp->id;
            else
                warn("이름과 도면 이미지 경로를 입력하세요.");
        }
        break;
    case NameTarget::RenameSubPart:
        if (auto* part = current_part(); !part || !inspection_model::rename_subpart(*part, selected_subpart_, name))
            warn("이름을 입력하세요.");
        break;
    case NameTarget::None:
        return;
    }
    if (!save_project()) critical("프로젝트 저장에 실패했습니다:\n" + project_path_);
}

void ProjectBrowser::draw_name_dialog() {
    if (name_dialog_pending_) {
        ImGui::OpenPopup("이름");
        name_dialog_pending_ = false;
    }
    if (!ImGui::BeginPopupModal("이름", nullptr, ImGuiWindowFlags_AlwaysAutoResize)) return;

    ImGui::InputText(name_target_ == NameTarget::NewProject ? "건물명" : "이름", &name_buf_);
    if (name_target_ == NameTarget::NewSubPart)
        ImGui::InputText("도면 이미지", &image_buf_);
    if (ImGui::Button("확인")) {
        apply_name_dialog();
        name_target_ = NameTarget::None;
        ImGui::CloseCurrentPopup();
    }
    ImGui::SameLine();
    if (ImGui::Button("취소")) {
        name_target_ = NameTarget::None;
        ImGui::CloseCurrentPopup();
    }
    ImGui::EndPopup();
}

void ProjectBrowser::open_inspection_dialog(InspectionDialog mode) {
    inspection_dialog_ = mode;
    insp_name_buf_.clear();
    insp_start_buf_.clear();
    insp_end_buf_.clear();
    if (mode == InspectionDialog::Edit) {
        if (auto* sp = current_subpart(); sp && sp->inspections.count(selected_inspection_)) {
            const auto& insp = sp->inspections.at(selected_inspection_);
            insp_name_buf_ = insp.name;
            insp_start_buf_ = insp.start_date;
            insp_end_buf_ = insp.end_date.value_or("");
        }
    }
    inspection_dialog_pending_ = true;
}

void ProjectBrowser::apply_inspection_dialog() {
    auto* sp = current_subpart();
    if (!sp) return;
    inspection_model::InspectionFields fields;
    fields.name = insp_name_buf_;
    fields.start_date = insp_start_buf_;
    if (!insp_end_buf_.empty()) fields.end_date = insp_end_buf_;
    if (!inspection_model::is_valid(fields)) {
        warn("점검 이름과 시작일을 입력하세요.");
        return;
    }

    switch (inspection_dialog_) {
    case InspectionDialog::Add:
        if (auto key = inspection_model::add_inspection(*sp, fields)) selected_inspection_ = *key;
        break;
    case InspectionDialog::Edit:
        inspection_model::update_inspection(*sp, selected_inspection_, fields);
        break;
    case InspectionDialog::Copy:
        if (auto key = inspection_model::duplicate_inspection(*sp, selected_inspection_, fields))
            selected_inspection_ = *key;
        break;
    case InspectionDialog::None:
        return;
    }
    if (!save_project()) critical("프로젝트 저장에 실패했습니다:\n" + project_path_);
}

void ProjectBrowser::draw_inspection_dialog() {
    if (inspection_dialog_pending_) {
        ImGui::OpenPopup("점검");
        inspection_dialog_pending_ = false;
    }
    if (!ImGui::BeginPopupModal("점검", nullptr, ImGuiWindowFlags_AlwaysAutoResize)) return;

    ImGui::InputText("점검명", &insp_name_buf_);
    ImGui::InputTextWithHint("시작일", "YYYY-MM-DD", &insp_start_buf_);
    ImGui::InputTextWithHint("종료일", "YYYY-MM-DD", &insp_end_buf_);
    if (ImGui::Button("확인")) {
        apply_inspection_dialog();
        inspection_dialog_ = InspectionDialog::None;
        ImGui::CloseCurrentPopup();
    }
    ImGui::SameLine();
    if (ImGui::Button("취소")) {
        inspection_dialog_ = InspectionDialog::None;
        ImGui::CloseCurrentPopup();
    }
    ImGui::EndPopup();
}

void ProjectBrowser::apply_delete() {
    switch (delete_target_) {
    case DeleteTarget::Part:
        inspection_model::remove_part(*project_, selected_part_);
        selected_part_.clear();
        selected_subpart_.clear();
        selected_inspection_.clear();
        break;
    case DeleteTarget::SubPart:
        if (auto* part = current_part()) inspection_model::remove_subpart(*part, selected_subpart_);
        selected_subpart_.clear();
        selected_inspection_.clear();
        break;
    case DeleteTarget::Inspection:
        if (auto* sp = current_subpart()) inspection_model::remove_inspection(*sp, selected_inspection_);
        selected_inspection_.clear();
        break;
    case DeleteTarget::None:
        return;
    }
    if (!save_project()) critical("프로젝트 저장에 실패했습니다:\n" + project_path_);
}

void ProjectBrowser::draw_delete_confirmation() {
    if (delete_pending_) {
        ImGui::OpenPopup("삭제 확인");
        delete_pending_ = false;
    }
    if (!ImGui::BeginPopupModal("삭제 확인", nullptr, ImGuiWindowFlags_AlwaysAutoResize)) return;

    ImGui::TextUnformatted("선택한 항목을 삭제하시겠습니까?");
    if (ImGui::Button("삭제")) {
        apply_delete();
        delete_target_ = DeleteTarget::None;
        ImGui::CloseCurrentPopup();
    }
    ImGui::SameLine();
    if (ImGui::Button("취소")) {
        delete_target_ = DeleteTarget::None;
        ImGui::CloseCurrentPopup();
    }
    ImGui::EndPopup();
}

void ProjectBrowser::draw_close_confirmation() {
    if (close_requested_ && !ImGui::IsPopupOpen("변경 사항")) ImGui::OpenPopup("변경 사항");
    if (!ImGui::BeginPopupModal("변경 사항", nullptr, ImGuiWindowFlags_AlwaysAutoResize)) return;

    ImGui::TextUnformatted("저장하지 않은 변경 사항이 있습니다. 저장하시겠습니까?");
    bool done = false;
    if (ImGui::Button("저장")) {
        session_->tick(mark_scene::Clock::now());
        session_->save_if_dirty();
        done = true;
    }
    ImGui::SameLine();
    if (ImGui::Button("저장 안 함")) done = true;
    ImGui::SameLine();
    if (ImGui::Button("취소")) {
        close_requested_ = false;
        quit_after_close_ = false;
        ImGui::CloseCurrentPopup();
    }
    if (done) {
        close_editor();
        if (quit_after_close_) quit_confirmed_ = true;
        ImGui::CloseCurrentPopup();
    }
    ImGui::EndPopup();
}

void ProjectBrowser::draw_messages() {
    if (warning_pending_) {
        ImGui::OpenPopup("알림");
        warning_pending_ = false;
    }
    if (ImGui::BeginPopupModal("알림", nullptr, ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::TextUnformatted(warning_.c_str());
        if (ImGui::Button("확인")) ImGui::CloseCurrentPopup();
        ImGui::EndPopup();
    }

    if (critical_pending_) {
        ImGui::OpenPopup("오류");
        critical_pending_ = false;
    }
    if (ImGui::BeginPopupModal("오류", nullptr, ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::TextColored(ImVec4(1.0f, 0.4f, 0.4f, 1.0f), "%s", critical_.c_str());
        if (ImGui::Button("확인")) ImGui::CloseCurrentPopup();
        ImGui::EndPopup();
    }
}
