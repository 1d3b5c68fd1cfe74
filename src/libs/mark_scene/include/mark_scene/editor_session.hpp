#pragma once

#include <mark_scene/detail_panel.hpp>
#include <mark_scene/dirty_sink.hpp>
#include <mark_scene/editor_host.hpp>
#include <mark_scene/scene_controller.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace mark_scene {

// One defect-editing session over a sub-part image and an inspection's defect
// set. Tracks unsaved changes and hands saves to the host.
class EditorSession : public DirtySink {
public:
    explicit EditorSession(EditorHost* host = nullptr,
        mark_model::TextMeasure measure = mark_model::default_text_measure());

    EditorSession(const EditorSession&) = delete;
    EditorSession& operator=(const EditorSession&) = delete;

    // `stored_defects` may be the project mapping or an {"items": [...]} object.
    void open(const std::string& image_path, mark_model::Size image_size,
        const nlohmann::json& stored_defects);

    SceneController& controller() { return controller_; }
    const SceneController& controller() const { return controller_; }
    DetailPanel& detail_panel() { return detail_panel_; }

    IntentResult handle(const Intent& intent, Clock::time_point now);
    void tick(Clock::time_point now) { controller_.tick(now); }

    bool undo();
    bool redo();
    void delete_selected();

    nlohmann::json get_defects() const { return controller_.get_defects(); }

    void mark_dirty() override;
    bool is_dirty() const { return dirty_; }
    // Emits the save request and makes the saved state the new undo baseline.
    // Returns false when there was nothing to save.
    bool save_if_dirty();
    bool needs_close_confirmation() const { return dirty_; }

    void set_zoom(double zoom);
    double zoom() const { return zoom_; }

private:
    void drop_stale_panel();

    EditorHost* host_ = nullptr;
    SceneController controller_;
    DetailPanel detail_panel_;
    bool dirty_ = false;
    double zoom_ = 1.0;
};

} // namespace mark_scene
