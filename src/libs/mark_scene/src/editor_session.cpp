#include <mark_scene/editor_session.hpp>
#include <mark_scene/editor_log.hpp>
#include <mark_loaders/defect_set.hpp>
#include <utility>

namespace mark_scene {

EditorSession::EditorSession(EditorHost* host, mark_model::TextMeasure measure)
    : host_(host)
    , controller_(this, std::move(measure))
    , detail_panel_(controller_)
{
}

void EditorSession::open(const std::string& image_path, mark_model::Size image_size,
    const nlohmann::json& stored_defects)
{
    detail_panel_.hide();
    controller_.load_image(image_path, image_size);
    controller_.load_items(mark_loaders::defect_map_to_items(stored_defects));
    dirty_ = false;
    if (host_) host_->on_dirty_changed(false);
    set_zoom(1.0);
    editor_logger()->info("session_opened image={} marks={}", image_path, controller_.scene().size());
}

IntentResult EditorSession::handle(const Intent& intent, Clock::time_point now) {
    IntentResult result = controller_.handle(intent, now);
    if (result.open_detail && detail_panel_.show_for_circle(*result.open_detail)) {
        if (host_) host_->on_open_defect_detail(*result.open_detail);
    }
    drop_stale_panel();
    return result;
}

bool EditorSession::undo() {
    const bool done = controller_.undo();
    if (done) detail_panel_.hide();
    return done;
}

bool EditorSession::redo() {
    const bool done = controller_.redo();
    if (done) detail_panel_.hide();
    return done;
}

void EditorSession::delete_selected() {
    controller_.delete_selected();
    drop_stale_panel();
}

void EditorSession::mark_dirty() {
    if (dirty_) return;
    dirty_ = true;
    if (host_) host_->on_dirty_changed(true);
}

bool EditorSession::save_if_dirty() {
    if (!dirty_) return false;

    const nlohmann::json defects = get_defects();
    controller_.reset_history();

    if (host_) host_->on_save_requested(defects);
    dirty_ = false;
    if (host_) host_->on_dirty_changed(false);
    editor_logger()->info("save_requested items={}", defects["items"].size());
    return true;
}

void EditorSession::set_zoom(double zoom) {
    zoom_ = zoom;
    if (host_) host_->on_zoom_changed(zoom);
}

void EditorSession::drop_stale_panel() {
    if (auto id = detail_panel_.target(); id && !controller_.scene().find(*id))
        detail_panel_.hide();
}

} // namespace mark_scene
