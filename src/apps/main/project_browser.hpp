#pragma once

#include "image_texture.hpp"
#include <canvas/mark_canvas.hpp>
#include <inspection_model/project.hpp>
#include <mark_scene/editor_host.hpp>
#include <mark_scene/editor_session.hpp>
#include <memory>
#include <optional>
#include <string>

struct AppOptions {
    std::string index_path = "data/projects_index.json";
    std::string project_path;
    std::string templates_dir = "templates";
    // Empty: next to the project file.
    std::string reports_dir;
};

// Project / part / sub-part / inspection browser and host of the defect editor.
class ProjectBrowser : public mark_scene::EditorHost {
public:
    explicit ProjectBrowser(AppOptions options);
    ~ProjectBrowser() override;

    // Loads the index and, when given, the project named on the command line.
    void init();
    void draw(mark_scene::Clock::time_point now);
    // Releases GL resources; call while the context is still current.
    void shutdown() { close_editor(); }

    // True when the window may close now; otherwise a confirmation is raised.
    bool request_quit();
    bool quit_confirmed() const { return quit_confirmed_; }

    void on_dirty_changed(bool dirty) override;
    void on_save_requested(const nlohmann::json& defects) override;
    void on_open_defect_detail(mark_model::MarkId id) override;
    void on_zoom_changed(double zoom) override;

private:
    enum class NameTarget { None, NewProject, NewPart, RenamePart, NewSubPart, RenameSubPart };
    enum class InspectionDialog { None, Add, Edit, Copy };
    enum class DeleteTarget { None, Part, SubPart, Inspection };

    bool open_project(const std::string& path);
    bool save_project();
    void create_project(const std::string& building_name);

    inspection_model::Part* current_part();
    inspection_model::SubPart* current_subpart();

    void begin_defect_editing();
    void close_editor();
    void export_reports();

    void warn(std::string message);
    void critical(std::string message);

    void draw_project_list();
    void draw_building_info();
    void draw_parts();
    void draw_subparts();
    void draw_inspections();
    void draw_editor_window(mark_scene::Clock::time_point now);
    void draw_name_dialog();
    void draw_inspection_dialog();
    void draw_delete_confirmation();
    void draw_close_confirmation();
    void draw_messages();

    void open_name_dialog(NameTarget target, const std::string& initial);
    void open_inspection_dialog(InspectionDialog mode);
    void apply_name_dialog();
    void apply_inspection_dialog();
    void apply_delete();

    AppOptions options_;
    inspection_model::ProjectIndex index_;
    std::optional<inspection_model::Project> project_;
    std::string project_path_;
    std::string selected_part_;
    std::string selected_subpart_;
    std::string selected_inspection_;

    std::unique_ptr<mark_scene::EditorSession> session_;
    std::unique_ptr<canvas::MarkCanvas> canvas_;
    ImageTexture texture_;
    std::string editing_part_;
    std::string editing_subpart_;
    std::string editing_inspection_;
    bool close_requested_ = false;
    bool quit_after_close_ = false;
    bool quit_confirmed_ = false;

    NameTarget name_target_ = NameTarget::None;
    bool name_dialog_pending_ = false;
    std::string name_buf_;
    std::string image_buf_;

    InspectionDialog inspection_dialog_ = InspectionDialog::None;
    bool inspection_dialog_pending_ = false;
    std::string insp_name_buf_;
    std::string insp_start_buf_;
    std::string insp_end_buf_;

    DeleteTarget delete_target_ = DeleteTarget::None;
    bool delete_pending_ = false;

    std::string building_name_buf_;
    std::string building_address_buf_;
    std::string building_location_buf_;
    std::string building_memo_buf_;

    std::string warning_;
    std::string critical_;
    bool warning_pending_ = false;
    bool critical_pending_ = false;
};
