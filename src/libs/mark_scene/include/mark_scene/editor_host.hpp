#pragma once

#include <mark_model/types.hpp>
#include <nlohmann/json.hpp>

namespace mark_scene {

// Notifications the editor sends to whoever embeds it (project browser, tests).
class EditorHost {
public:
    virtual ~EditorHost() = default;

    virtual void on_dirty_changed(bool dirty) = 0;
    // `defects` is {"items": [record, ...]}.
    virtual void on_save_requested(const nlohmann::json& defects) = 0;
    virtual void on_open_defect_detail(mark_model::MarkId id) = 0;
    virtual void on_zoom_changed(double zoom) = 0;
};

} // namespace mark_scene
