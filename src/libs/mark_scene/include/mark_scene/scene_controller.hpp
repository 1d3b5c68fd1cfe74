#pragma once

#include <mark_scene/deadline_timer.hpp>
#include <mark_scene/dirty_sink.hpp>
#include <mark_scene/intents.hpp>
#include <mark_scene/scene.hpp>
#include <mark_scene/undo_history.hpp>
#include <mark_model/text_measure.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace mark_scene {

enum class Tool {
    Circle,
    Square,
    Triangle,
    SCurve,
    Text,
    MemoLine,
    MemoFree
};

enum class EditMode {
    Select,
    AreaSelect
};

enum class DragMode {
    None,
    Create,
    Move,
    MoveAnchor
};

const char* drag_mode_name(DragMode mode);

// Owns the scene and its history and turns pointer intents into mark edits.
class SceneController {
public:
    explicit SceneController(DirtySink* dirty_sink = nullptr,
        mark_model::TextMeasure measure = mark_model::default_text_measure());

    SceneController(const SceneController&) = delete;
    SceneController& operator=(const SceneController&) = delete;

    Scene& scene() { return scene_; }
    const Scene& scene() const { return scene_; }
    UndoHistory& history() { return history_; }
    const UndoHistory& history() const { return history_; }

    void set_tool(Tool tool) { tool_ = tool; }
    Tool tool() const { return tool_; }
    void set_edit_mode(EditMode mode);
    EditMode edit_mode() const { return edit_mode_; }
    DragMode drag_mode() const { return drag_mode_; }

    // Screen pixels per scene unit; converts pixel radii into scene distances.
    void set_view_scale(double px_per_unit);
    double view_scale() const { return view_scale_; }

    IntentResult handle(const Intent& intent, Clock::time_point now);
    // Fires due timers. Call once per frame.
    void tick(Clock::time_point now);

    std::optional<MarkId> anchor_handle_target() const { return anchor_target_; }
    std::optional<Point> anchor_handle_pos() const;
    std::optional<Rect> rubber_band() const;

    // Multiplies the scale of every selected mark; consecutive calls coalesce
    // into one history entry. Returns false when nothing is selected.
    bool scale_selected(double factor, Clock::time_point now);
    void delete_selected();
    void renumber_circle_ids();
    int next_defect_index() const { return next_defect_index_; }
    int calc_next_defect_index() const;
    bool can_create_at(Point p) const { return scene_.can_create_at(p); }

    void apply_defect_info(MarkId id, const mark_model::DefectInfo& info, Clock::time_point now);
    bool begin_label_edit(MarkId id);
    void commit_label_edit(MarkId id, const std::string& text);
    void cancel_label_edit(MarkId id);
    bool begin_note_edit(MarkId id);
    void commit_note_text(MarkId id, const std::string& text);

    // Clears the marks and shows a new background.
    void load_image(const std::string& path, mark_model::Size pixel_size);
    // Replaces the marks with `defects` ({"items": [...]}) and rebaselines history.
    void load_items(const nlohmann::json& defects);
    nlohmann::json get_defects() const;
    nlohmann::json collect_memos() const;
    nlohmann::json make_snapshot() const;
    void restore_snapshot(const nlohmann::json& snapshot);
    void reset_history();

    void begin_edit();
    void end_edit();
    bool undo();
    bool redo();

    // Escape hatch for mode switches: drops any gesture in progress.
    void cancel_gesture();

private:
    IntentResult on_press(const PressAt& e, Clock::time_point now);
    IntentResult on_move(const MoveTo& e);
    IntentResult on_release(const ReleaseAt& e, Clock::time_point now);
    IntentResult on_double_click(const DoubleClickAt& e);

    void begin_drag_create();
    void update_anchor_hover(Point p);
    bool is_basic_tool() const;
    double anchor_radius_scene() const;
    double min_creation_distance(const Mark& mark) const;
    void init_defect_for_item(Mark& mark);
    void restore_item(const nlohmann::json& record);
    void restore_memo(const nlohmann::json& record);
    void discard_drag_item(const char* reason);
    void reset_mouse_drag();
    void mark_dirty();

    mark_model::TextMeasure measure_;
    Scene scene_;
    UndoHistory history_;

    Tool tool_ = Tool::Circle;
    EditMode edit_mode_ = EditMode::Select;
    DragMode drag_mode_ = DragMode::None;
    double view_scale_ = 1.0;

    std::optional<MarkId> drag_item_;
    std::vector<MarkId> move_items_;
    Point press_pos_;
    Point last_move_pos_;

    bool pressing_ = false;
    std::optional<Point> pending_press_pos_;
    DeadlineTimer press_timer_;
    DeadlineTimer edit_end_timer_;

    std::optional<MarkId> anchor_target_;
    std::optional<Point> band_origin_;
    Point band_corner_;
    std::vector<MarkId> band_base_;

    int next_defect_index_ = 1;
};

} // namespace mark_scene
