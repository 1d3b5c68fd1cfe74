#pragma once

#include <mark_model/types.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mark_scene {

class DirtySink;

using mark_model::Mark;
using mark_model::MarkId;
using mark_model::Point;
using mark_model::Rect;

struct Pick {
    MarkId id = 0;
    bool on_label = false;
};

// Arena of marks keyed by ids that are never reused. Later ids stack on top.
class Scene {
public:
    explicit Scene(DirtySink* dirty_sink = nullptr);

    MarkId add(Mark mark);
    bool remove(MarkId id);
    // Removes every mark; the background is kept.
    void clear();

    Mark* find(MarkId id);
    const Mark* find(MarkId id) const;
    std::map<MarkId, Mark>& marks() { return marks_; }
    const std::map<MarkId, Mark>& marks() const { return marks_; }
    std::size_t size() const { return marks_.size(); }

    void set_background(std::string path, mark_model::Size pixel_size);
    const std::string& background_path() const { return background_path_; }
    mark_model::Size background_size() const { return background_size_; }
    bool has_background() const { return has_background_; }

    void clear_selection();
    void select_only(MarkId id);
    void set_selected(MarkId id, bool selected);
    std::vector<MarkId> selected_ids() const;

    // Topmost visible mark under the point; labels sit above every body.
    std::optional<Pick> pick_at(Point p) const;
    // Marks whose scene bounds intersect `r`.
    std::vector<MarkId> marks_in_rect(const Rect& r) const;
    // False when the point is over any serializable mark or its label.
    bool can_create_at(Point p, std::optional<MarkId> ignore = std::nullopt) const;
    // Closest leader-line anchor strictly within `radius`.
    std::optional<MarkId> nearest_anchor(Point p, double radius) const;

    // Forwards a change notification to the injected sink.
    void touch();

private:
    DirtySink* dirty_sink_ = nullptr;
    std::map<MarkId, Mark> marks_;
    MarkId next_id_ = 1;
    std::string background_path_;
    mark_model::Size background_size_;
    bool has_background_ = false;
};

} // namespace mark_scene
