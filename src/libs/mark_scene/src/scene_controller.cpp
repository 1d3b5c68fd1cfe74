#include <mark_scene/scene_controller.hpp>
#include <mark_scene/editor_log.hpp>
#include <mark_scene/editor_tuning.hpp>
#include <mark_loaders/mark_records.hpp>
#include <mark_loaders/snapshot.hpp>
#include <mark_model/label.hpp>
#include <mark_model/leader_line.hpp>
#include <mark_model/mark.hpp>
#include <mark_model/mark_constants.hpp>
#include <mark_geometry/types.hpp>
#include <uuid.h>
#include <algorithm>
#include <array>
#include <charconv>
#include <limits>
#include <functional>
#include <random>
#include <utility>

namespace mark_scene {

namespace {

std::string new_internal_id() {
    static std::mt19937 engine = [] {
        std::random_device rd;
        std::array<int, std::mt19937::state_size> seed_data{};
        std::generate(seed_data.begin(), seed_data.end(), std::ref(rd));
        std::seed_seq seq(seed_data.begin(), seed_data.end());
        return std::mt19937(seq);
    }();
    static uuids::uuid_random_generator generator{engine};
    return uuids::to_string(generator());
}

// Trailing "-N" of a legacy display id such as "D-12".
std::optional<int> legacy_index(const std::string& id) {
    const auto dash = id.rfind('-');
    const std::string_view tail = dash == std::string::npos
        ? std::string_view(id)
        : std::string_view(id).substr(dash + 1);
    int value = 0;
    auto [ptr, ec] = std::from_chars(tail.data(), tail.data() + tail.size(), value);
    if (ec != std::errc() || ptr != tail.data() + tail.size()) return std::nullopt;
    return value;
}

} // namespace

const char* drag_mode_name(DragMode mode) {
    switch (mode) {
    case DragMode::None: return "none";
    case DragMode::Create: return "create";
    case DragMode::Move: return "move";
    case DragMode::MoveAnchor: return "move_anchor";
    }
    return "unknown";
}

SceneController::SceneController(DirtySink* dirty_sink, mark_model::TextMeasure measure)
    : measure_(std::move(measure))
    , scene_(dirty_sink)
    , history_([this] { return make_snapshot(); },
               [this](const nlohmann::json& snapshot) { restore_snapshot(snapshot); })
{
    if (!measure_) measure_ = mark_model::default_text_measure();
    history_.reset(make_snapshot());
}

void SceneController::set_edit_mode(EditMode mode) {
    if (edit_mode_ == mode) return;
    cancel_gesture();
    edit_mode_ = mode;
}

void SceneController::set_view_scale(double px_per_unit) {
    if (px_per_unit > 0.0) view_scale_ = px_per_unit;
}

IntentResult SceneController::handle(const Intent& intent, Clock::time_point now) {
    if (const auto* e = std::get_if<PressAt>(&intent)) return on_press(*e, now);
    if (const auto* e = std::get_if<MoveTo>(&intent)) return on_move(*e);
    if (const auto* e = std::get_if<ReleaseAt>(&intent)) return on_release(*e, now);
    if (const auto* e = std::get_if<DoubleClickAt>(&intent)) return on_double_click(*e);
    return {};
}

void SceneController::tick(Clock::time_point now) {
    if (press_timer_.fire_if_due(now)) begin_drag_create();
    if (edit_end_timer_.fire_if_due(now)) {
        editor_logger()->debug("edit_session_coalesced");
        end_edit();
    }
}

std::optional<Point> SceneController::anchor_handle_pos() const {
    if (!anchor_target_) return std::nullopt;
    const Mark* m = scene_.find(*anchor_target_);
    if (!m || !m->leader) return std::nullopt;
    return m->leader->anchor;
}

std::optional<Rect> SceneController::rubber_band() const {
    if (!band_origin_) return std::nullopt;
    return mark_geometry::bounding_rect({*band_origin_, band_corner_});
}

IntentResult SceneController::on_press(const PressAt& e, Clock::time_point now) {
    IntentResult result;
    if (!scene_.has_background()) return result;

    const Point pos = e.pos;

    if (anchor_target_) {
        const Mark* target = scene_.find(*anchor_target_);
        if (target && target->leader
            && mark_geometry::distance(pos, target->leader->anchor) <= anchor_radius_scene())
        {
            begin_edit();
            drag_mode_ = DragMode::MoveAnchor;
            drag_item_ = anchor_target_;
            result.consumed = true;
            return result;
        }
    }

    const auto pick = scene_.pick_at(pos);
    const Mark* hit = pick ? scene_.find(pick->id) : nullptr;

    if (hit && mark_model::is_memo(hit->kind)) {
        if (edit_mode_ != EditMode::AreaSelect) {
            if (!e.mods.ctrl && !e.mods.shift) {
                scene_.select_only(pick->id);
            } else {
                scene_.set_selected(pick->id, !hit->selected);
            }
        }
        result.consumed = true;
        return result;
    }

    if (edit_mode_ == EditMode::Select) {
        scene_.clear_selection();

        if (hit) {
            begin_edit();
            scene_.set_selected(pick->id, true);
            drag_mode_ = DragMode::Move;
            drag_item_ = pick->id;
            move_items_ = {pick->id};
            last_move_pos_ = pos;
            result.consumed = true;
            return result;
        }

        if (tool_ == Tool::MemoLine || tool_ == Tool::MemoFree) {
            press_timer_.stop();
            pressing_ = false;
            pending_press_pos_.reset();

            begin_edit();
            drag_mode_ = DragMode::Create;
            press_pos_ = pos;
            drag_item_ = scene_.add(tool_ == Tool::MemoLine
                ? mark_model::make_memo_line(pos, pos)
                : mark_model::make_memo_free_path(pos));
            result.consumed = true;
            return result;
        }

        pressing_ = true;
        pending_press_pos_ = pos;
        press_timer_.start(now, tuning::press_hold_delay);
        return result;
    }

    // Area selection: presses on marks extend or toggle the selection and
    // move the whole selection; presses on empty space open a rubber band.
    if (hit) {
        if (e.mods.ctrl || e.mods.shift) {
            scene_.set_selected(pick->id, !hit->selected);
        } else if (!hit->selected) {
            scene_.select_only(pick->id);
        }
        const Mark* picked = scene_.find(pick->id);
        if (picked && picked->selected) {
            begin_edit();
            drag_mode_ = DragMode::Move;
            drag_item_ = pick->id;
            move_items_.clear();
            for (MarkId id : scene_.selected_ids()) {
                const Mark* m = scene_.find(id);
                if (m && !mark_model::is_memo(m->kind)) move_items_.push_back(id);
            }
            last_move_pos_ = pos;
        }
        result.consumed = true;
        return result;
    }

    if (!e.mods.ctrl && !e.mods.shift) scene_.clear_selection();
    band_base_ = scene_.selected_ids();
    band_origin_ = pos;
    band_corner_ = pos;
    result.consumed = true;
    return result;
}

IntentResult SceneController::on_move(const MoveTo& e) {
    IntentResult result;
    const Point pos = e.pos;

    switch (drag_mode_) {
    case DragMode::None:
        if (band_origin_) {
            band_corner_ = pos;
            const auto inside = scene_.marks_in_rect(*rubber_band());
            for (auto& [id, mark] : scene_.marks()) {
                mark.selected = std::find(inside.begin(), inside.end(), id) != inside.end()
                    || std::find(band_base_.begin(), band_base_.end(), id) != band_base_.end();
            }
            result.consumed = true;
        } else {
            update_anchor_hover(pos);
        }
        return result;

    case DragMode::MoveAnchor:
        if (Mark* m = drag_item_ ? scene_.find(*drag_item_) : nullptr) {
            mark_model::move_anchor(*m, pos);
            anchor_target_ = drag_item_;
        }
        result.consumed = true;
        return result;

    case DragMode::Move: {
        const Point delta = pos - last_move_pos_;
        last_move_pos_ = pos;
        for (MarkId id : move_items_) {
            if (Mark* m = scene_.find(id)) mark_model::translate(*m, delta);
        }
        result.consumed = true;
        return result;
    }

    case DragMode::Create: {
        Mark* m = drag_item_ ? scene_.find(*drag_item_) : nullptr;
        if (!m) return result;
        if (m->kind == mark_model::MarkKind::MemoLine) {
            mark_model::set_memo_end(*m, pos);
        } else if (m->kind == mark_model::MarkKind::MemoFreePath) {
            mark_model::add_memo_point(*m, pos);
        } else if (m->kind == mark_model::MarkKind::Circle && e.button_down) {
            m->visible = true;
            mark_model::set_position(*m, pos);
            mark_model::update_preview(*m, pos);
            if (m->display_id) mark_model::set_circle_id(*m, *m->display_id);
        }
        result.consumed = true;
        return result;
    }
    }
    return result;
}

IntentResult SceneController::on_release(const ReleaseAt& e, Clock::time_point now) {
    IntentResult result;
    band_origin_.reset();
    band_base_.clear();

    Mark* item = drag_item_ ? scene_.find(*drag_item_) : nullptr;

    if (drag_mode_ == DragMode::Create && item && item->kind == mark_model::MarkKind::MemoLine
        && mark_model::memo_line_length(*item) < tuning::min_memo_line_length)
    {
        discard_drag_item("undersized");
        return result;
    }

    if (drag_mode_ == DragMode::Create && item && item->kind == mark_model::MarkKind::MemoFreePath) {
        const Rect r = mark_geometry::bounding_rect(item->points);
        if (r.width < tuning::min_memo_path_extent && r.height < tuning::min_memo_path_extent) {
            discard_drag_item("undersized");
            return result;
        }
    }

    if (drag_mode_ == DragMode::Move || drag_mode_ == DragMode::MoveAnchor) {
        if (drag_mode_ == DragMode::Move) {
            for (MarkId id : move_items_) {
                if (Mark* m = scene_.find(id)) mark_model::sync_attachments(*m);
            }
        }
        edit_end_timer_.start(now, tuning::edit_coalesce_delay);
        drag_mode_ = DragMode::None;
        drag_item_.reset();
        move_items_.clear();
        mark_dirty();
        result.consumed = true;
        return result;
    }

    press_timer_.stop();
    pressing_ = false;
    pending_press_pos_.reset();

    if (drag_mode_ == DragMode::Create && item && mark_model::is_memo(item->kind)) {
        editor_logger()->info("mark_created kind={} points={}",
            mark_model::kind_name(item->kind), item->points.size());
        end_edit();
        reset_mouse_drag();
        mark_dirty();
        result.consumed = true;
        return result;
    }

    if (drag_mode_ == DragMode::Create && item) {
        const Point end_pos = e.pos;
        if (item->kind != mark_model::MarkKind::NoteText
            && mark_geometry::distance(press_pos_, end_pos) < min_creation_distance(*item))
        {
            discard_drag_item("undersized");
            return result;
        }
        if (!scene_.can_create_at(press_pos_, drag_item_)) {
            discard_drag_item("placement_blocked");
            return result;
        }

        item->visible = true;
        mark_model::set_position(*item, end_pos);
        mark_model::confirm_attach(*item);
        init_defect_for_item(*item);
        editor_logger()->info("mark_created kind={} display_id={} pos=({}, {})",
            mark_model::kind_name(item->kind), item->display_id.value_or(0), end_pos.x, end_pos.y);

        end_edit();
        mark_dirty();
        reset_mouse_drag();
        result.consumed = true;
        return result;
    }

    return result;
}

IntentResult SceneController::on_double_click(const DoubleClickAt& e) {
    IntentResult result;
    press_timer_.stop();
    pressing_ = false;
    pending_press_pos_.reset();

    if (!scene_.has_background()) return result;
    const Point pos = e.pos;

    if (is_basic_tool() && edit_mode_ == EditMode::Select && scene_.can_create_at(pos)) {
        Mark mark;
        switch (tool_) {
        case Tool::Circle: mark = mark_model::make_circle(pos); break;
        case Tool::Square: mark = mark_model::make_square(pos); break;
        case Tool::Triangle: mark = mark_model::make_triangle(pos); break;
        case Tool::SCurve: mark = mark_model::make_scurve(pos); break;
        case Tool::Text:
            mark = mark_model::make_note_text(pos, mark_model::defaults::note_text, measure_);
            break;
        default: return result;
        }

        begin_edit();
        init_defect_for_item(mark);
        const MarkId id = scene_.add(std::move(mark));
        scene_.select_only(id);
        const Mark& added = *scene_.find(id);
        editor_logger()->info("mark_created kind={} display_id={} pos=({}, {})",
            mark_model::kind_name(added.kind), added.display_id.value_or(0), pos.x, pos.y);
        end_edit();
        mark_dirty();
        result.consumed = true;
        return result;
    }

    const auto pick = scene_.pick_at(pos);
    if (!pick) return result;
    const Mark* hit = scene_.find(pick->id);
    if (!hit) return result;

    if (pick->on_label) {
        if (begin_label_edit(pick->id)) result.edit_label = pick->id;
        result.consumed = true;
        return result;
    }
    if (hit->kind == mark_model::MarkKind::Circle) {
        result.open_detail = pick->id;
        result.consumed = true;
        return result;
    }
    if (hit->kind == mark_model::MarkKind::NoteText) {
        if (begin_note_edit(pick->id)) result.edit_note = pick->id;
        result.consumed = true;
    }
    return result;
}

void SceneController::begin_drag_create() {
    if (tool_ != Tool::Circle) return;
    if (drag_mode_ != DragMode::None) return;
    if (edit_mode_ != EditMode::Select) return;
    if (!pressing_ || !pending_press_pos_) return;

    begin_edit();

    const Point anchor = *pending_press_pos_;
    pressing_ = false;
    pending_press_pos_.reset();

    Mark circle = mark_model::make_circle(anchor);
    circle.visible = false;
    mark_model::set_circle_id(circle, next_defect_index_);
    mark_model::begin_attach(circle, anchor);

    drag_mode_ = DragMode::Create;
    press_pos_ = anchor;
    drag_item_ = scene_.add(std::move(circle));
}

void SceneController::update_anchor_hover(Point p) {
    anchor_target_ = scene_.nearest_anchor(p, anchor_radius_scene());
}

bool SceneController::is_basic_tool() const {
    switch (tool_) {
    case Tool::Circle:
    case Tool::Square:
    case Tool::Triangle:
    case Tool::SCurve:
    case Tool::Text:
        return true;
    default:
        return false;
    }
}

double SceneController::anchor_radius_scene() const {
    return tuning::anchor_handle_radius_px / view_scale_;
}

double SceneController::min_creation_distance(const Mark& mark) const {
    const Rect r = mark_model::local_bounds(mark);
    return std::max(r.width, r.height) + tuning::creation_margin;
}

void SceneController::init_defect_for_item(Mark& mark) {
    mark.internal_id = new_internal_id();
    if (mark.kind != mark_model::MarkKind::Circle) return;

    mark_model::set_circle_id(mark, next_defect_index_);
    if (next_defect_index_ < std::numeric_limits<int>::max()) ++next_defect_index_;
    mark.defect = mark_model::DefectInfo::initial();
    mark_model::enable_label(mark, mark.defect->member, measure_);
}

bool SceneController::scale_selected(double factor, Clock::time_point now) {
    std::vector<MarkId> targets;
    for (MarkId id : scene_.selected_ids()) {
        const Mark* m = scene_.find(id);
        if (m && !mark_model::is_memo(m->kind)) targets.push_back(id);
    }
    if (targets.empty()) return false;

    if (!history_.is_editing()) begin_edit();
    for (MarkId id : targets) {
        Mark* m = scene_.find(id);
        mark_model::set_scale(*m, m->scale * factor);
    }
    edit_end_timer_.start(now, tuning::edit_coalesce_delay);
    return true;
}

void SceneController::delete_selected() {
    const auto ids = scene_.selected_ids();
    if (ids.empty()) return;

    begin_edit();
    for (MarkId id : ids) scene_.remove(id);
    if (anchor_target_ && !scene_.find(*anchor_target_)) anchor_target_.reset();

    renumber_circle_ids();
    next_defect_index_ = calc_next_defect_index();
    editor_logger()->info("marks_deleted count={} next_defect_index={}", ids.size(), next_defect_index_);

    scene_.clear_selection();
    end_edit();
    mark_dirty();
}

void SceneController::renumber_circle_ids() {
    std::vector<std::pair<int, MarkId>> circles;
    for (const auto& [id, mark] : scene_.marks()) {
        if (mark.kind == mark_model::MarkKind::Circle && mark.display_id)
            circles.emplace_back(*mark.display_id, id);
    }
    std::sort(circles.begin(), circles.end());

    int next = 1;
    for (const auto& [old_id, mark_id] : circles) {
        Mark* m = scene_.find(mark_id);
        if (m->display_id != next) mark_model::set_circle_id(*m, next);
        ++next;
    }
}

int SceneController::calc_next_defect_index() const {
    int max_n = 0;
    for (const auto& [id, mark] : scene_.marks()) {
        if (mark.display_id) {
            max_n = std::max(max_n, *mark.display_id);
        } else if (!mark.legacy_display_id.empty()) {
            if (auto n = legacy_index(mark.legacy_display_id)) max_n = std::max(max_n, *n);
        }
    }
    return max_n < std::numeric_limits<int>::max() ? max_n + 1 : max_n;
}

void SceneController::apply_defect_info(MarkId id, const mark_model::DefectInfo& info, Clock::time_point now) {
    Mark* m = scene_.find(id);
    if (!m || !mark_model::has_defect_record(m->kind)) return;

    if (!history_.is_editing()) begin_edit();
    m->defect = info;
    if (m->label)
        mark_model::update_label(*m, info.member, measure_);
    else
        mark_model::enable_label(*m, info.member, measure_);
    edit_end_timer_.start(now, tuning::edit_coalesce_delay);
    mark_dirty();
}

bool SceneController::begin_label_edit(MarkId id) {
    Mark* m = scene_.find(id);
    if (!m || !m->label) return false;
    m->label->editing = true;
    return true;
}

void SceneController::commit_label_edit(MarkId id, const std::string& text) {
    Mark* m = scene_.find(id);
    if (!m || !m->label) return;

    begin_edit();
    m->label->editing = false;
    if (m->defect) m->defect->member = text;
    mark_model::update_label(*m, text, measure_);
    end_edit();
    mark_dirty();
}

void SceneController::cancel_label_edit(MarkId id) {
    Mark* m = scene_.find(id);
    if (m && m->label) m->label->editing = false;
}

bool SceneController::begin_note_edit(MarkId id) {
    const Mark* m = scene_.find(id);
    if (!m || m->kind != mark_model::MarkKind::NoteText) return false;
    begin_edit();
    return true;
}

void SceneController::commit_note_text(MarkId id, const std::string& text) {
    Mark* m = scene_.find(id);
    if (!m || m->kind != mark_model::MarkKind::NoteText) return;
    if (!history_.is_editing()) begin_edit();

    if (m->text != text) {
        mark_model::set_note_text(*m, text, measure_);
        mark_dirty();
    }
    end_edit();
}

void SceneController::load_image(const std::string& path, mark_model::Size pixel_size) {
    cancel_gesture();
    scene_.clear();
    anchor_target_.reset();
    scene_.set_background(path, pixel_size);
    next_defect_index_ = 1;
}

void SceneController::load_items(const nlohmann::json& defects) {
    cancel_gesture();
    scene_.clear();
    anchor_target_.reset();

    const nlohmann::json items = mark_loaders::snapshot_items(defects);
    for (const auto& record : items) restore_item(record);
    next_defect_index_ = calc_next_defect_index();

    editor_logger()->info("defects_loaded items={} marks={} next_defect_index={}",
        items.size(), scene_.size(), next_defect_index_);
    reset_history();
}

nlohmann::json SceneController::get_defects() const {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& [id, mark] : scene_.marks()) {
        if (mark_model::is_serializable(mark.kind)) items.push_back(mark_loaders::mark_to_record(mark));
    }
    return {{"items", items}};
}

nlohmann::json SceneController::collect_memos() const {
    nlohmann::json memos = nlohmann::json::array();
    for (const auto& [id, mark] : scene_.marks()) {
        if (mark_model::is_memo(mark.kind)) memos.push_back(mark_loaders::memo_to_record(mark));
    }
    return memos;
}

nlohmann::json SceneController::make_snapshot() const {
    return mark_loaders::make_snapshot(scene_.background_path(),
        get_defects()["items"], collect_memos());
}

void SceneController::restore_snapshot(const nlohmann::json& snapshot) {
    cancel_gesture();
    scene_.clear();
    anchor_target_.reset();

    const std::string image = mark_loaders::snapshot_image(snapshot);
    if (!image.empty() && image != scene_.background_path())
        scene_.set_background(image, {});

    for (const auto& record : mark_loaders::snapshot_items(snapshot)) restore_item(record);
    for (const auto& record : mark_loaders::snapshot_memos(snapshot)) restore_memo(record);
    next_defect_index_ = calc_next_defect_index();
}

void SceneController::reset_history() {
    edit_end_timer_.stop();
    history_.reset(make_snapshot());
}

void SceneController::begin_edit() {
    history_.begin_edit();
}

void SceneController::end_edit() {
    if (history_.end_edit()) mark_dirty();
}

bool SceneController::undo() {
    edit_end_timer_.stop();
    if (history_.is_editing()) end_edit();
    if (!history_.undo()) return false;
    editor_logger()->info("undo undo_depth={} redo_depth={}", history_.undo_depth(), history_.redo_depth());
    mark_dirty();
    return true;
}

bool SceneController::redo() {
    edit_end_timer_.stop();
    if (history_.is_editing()) end_edit();
    if (!history_.redo()) return false;
    editor_logger()->info("redo undo_depth={} redo_depth={}", history_.undo_depth(), history_.redo_depth());
    mark_dirty();
    return true;
}

void SceneController::cancel_gesture() {
    press_timer_.stop();
    pressing_ = false;
    pending_press_pos_.reset();
    band_origin_.reset();
    if (drag_mode_ == DragMode::Create && drag_item_) {
        discard_drag_item("cancelled");
        return;
    }
    const bool was_dragging = drag_mode_ != DragMode::None;
    reset_mouse_drag();
    if (was_dragging) end_edit();
}

void SceneController::restore_item(const nlohmann::json& record) {
    auto mark = mark_loaders::mark_from_record(record, measure_);
    if (!mark) {
        const std::string type = record.is_object() && record.contains("type") && record["type"].is_string()
            ? record["type"].get<std::string>()
            : std::string("<missing>");
        editor_logger()->warn("record_dropped type={}", type);
        return;
    }

    if (mark->internal_id.empty()) mark->internal_id = new_internal_id();

    if (mark->kind == mark_model::MarkKind::Circle && mark->display_id) {
        mark_model::set_circle_id(*mark, *mark->display_id);
        mark_model::enable_label(*mark, mark->defect ? mark->defect->member : std::string(), measure_);
    } else {
        const std::string text = mark_model::label_text_for(*mark);
        if (!text.empty()) mark_model::enable_label(*mark, text, measure_);
    }

    if (auto line = mark_loaders::record_line(record))
        mark_model::restore_attach(*mark, line->first, line->second);

    scene_.add(std::move(*mark));
}

void SceneController::restore_memo(const nlohmann::json& record) {
    auto memo = mark_loaders::memo_from_record(record);
    if (!memo) {
        editor_logger()->warn("memo_dropped record={}", record.dump());
        return;
    }
    scene_.add(std::move(*memo));
}

void SceneController::discard_drag_item(const char* reason) {
    if (drag_item_) {
        if (Mark* m = scene_.find(*drag_item_)) {
            editor_logger()->info("mark_discarded kind={} reason={}", mark_model::kind_name(m->kind), reason);
            mark_model::cancel_attach(*m);
        }
        scene_.remove(*drag_item_);
    }
    history_.abort_edit();
    reset_mouse_drag();
}

void SceneController::reset_mouse_drag() {
    drag_mode_ = DragMode::None;
    drag_item_.reset();
    move_items_.clear();
    press_pos_ = {};
}

void SceneController::mark_dirty() {
    scene_.touch();
}

} // namespace mark_scene
