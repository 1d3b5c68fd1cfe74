#pragma once

#include <mark_scene/deadline_timer.hpp>
#include <mark_scene/scene.hpp>
#include <mark_model/types.hpp>
#include <optional>
#include <string>

namespace mark_scene {

class SceneController;

enum class DetailField {
    Member,
    Location,
    DefectType,
    WidthMm,
    LengthM,
    CountEa,
    Progress,
    Remark
};

// Defect attribute editor bound to one circle at a time. Every commit lands in
// the circle immediately and refreshes its label.
class DetailPanel {
public:
    explicit DetailPanel(SceneController& controller);

    // Forces single selection of the circle. Returns false for other marks.
    bool show_for_circle(MarkId id);
    void hide();
    bool is_visible() const { return target_.has_value(); }
    std::optional<MarkId> target() const { return target_; }

    // Current record of the bound circle, or nullptr when hidden.
    const mark_model::DefectInfo* info() const;
    void commit(const mark_model::DefectInfo& info, Clock::time_point now);
    // Replaces one text field of the bound record; the other fields keep
    // their stored values. Progress is not a text field and is ignored here.
    void commit_field(DetailField field, const std::string& value, Clock::time_point now);
    void commit_progress(bool in_progress, Clock::time_point now);

    // Global press observer: closes the panel for presses outside `panel_bounds`.
    // Returns true when it closed.
    bool handle_global_press(Point screen_pt, const Rect& panel_bounds);

    // First empty field among member, location and defect type.
    DetailField focus_field() const;

private:
    SceneController& controller_;
    std::optional<MarkId> target_;
};

} // namespace mark_scene
