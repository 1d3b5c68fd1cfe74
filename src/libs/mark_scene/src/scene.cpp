#include <mark_scene/scene.hpp>
#include <mark_scene/dirty_sink.hpp>
#include <mark_model/label.hpp>
#include <mark_model/mark.hpp>
#include <mark_geometry/types.hpp>
#include <utility>

namespace mark_scene {

Scene::Scene(DirtySink* dirty_sink)
    : dirty_sink_(dirty_sink)
{
}

MarkId Scene::add(Mark mark) {
    const MarkId id = next_id_++;
    marks_.emplace(id, std::move(mark));
    return id;
}

bool Scene::remove(MarkId id) {
    return marks_.erase(id) > 0;
}

void Scene::clear() {
    marks_.clear();
}

Mark* Scene::find(MarkId id) {
    auto it = marks_.find(id);
    return it == marks_.end() ? nullptr : &it->second;
}

const Mark* Scene::find(MarkId id) const {
    auto it = marks_.find(id);
    return it == marks_.end() ? nullptr : &it->second;
}

void Scene::set_background(std::string path, mark_model::Size pixel_size) {
    background_path_ = std::move(path);
    background_size_ = pixel_size;
    has_background_ = !background_path_.empty();
}

void Scene::clear_selection() {
    for (auto& [id, mark] : marks_) mark.selected = false;
}

void Scene::select_only(MarkId id) {
    for (auto& [mid, mark] : marks_) mark.selected = (mid == id);
}

void Scene::set_selected(MarkId id, bool selected) {
    if (Mark* m = find(id)) m->selected = selected;
}

std::vector<MarkId> Scene::selected_ids() const {
    std::vector<MarkId> out;
    for (const auto& [id, mark] : marks_) {
        if (mark.selected) out.push_back(id);
    }
    return out;
}

std::optional<Pick> Scene::pick_at(Point p) const {
    for (auto it = marks_.rbegin(); it != marks_.rend(); ++it) {
        if (mark_model::label_hit_test(it->second, p)) return Pick{it->first, true};
    }
    for (auto it = marks_.rbegin(); it != marks_.rend(); ++it) {
        if (mark_model::hit_test(it->second, p)) return Pick{it->first, false};
    }
    return std::nullopt;
}

std::vector<MarkId> Scene::marks_in_rect(const Rect& r) const {
    std::vector<MarkId> out;
    for (const auto& [id, mark] : marks_) {
        if (!mark.visible) continue;
        if (mark_model::scene_bounds(mark).intersects(r)) out.push_back(id);
    }
    return out;
}

bool Scene::can_create_at(Point p, std::optional<MarkId> ignore) const {
    for (const auto& [id, mark] : marks_) {
        if (ignore && *ignore == id) continue;
        if (!mark_model::is_serializable(mark.kind)) continue;
        if (mark_model::hit_test(mark, p) || mark_model::label_hit_test(mark, p)) return false;
    }
    return true;
}

std::optional<MarkId> Scene::nearest_anchor(Point p, double radius) const {
    std::optional<MarkId> best;
    double best_dist = radius;
    for (const auto& [id, mark] : marks_) {
        if (!mark.leader || !mark.visible) continue;
        const double d = mark_geometry::distance(p, mark.leader->anchor);
        if (d < best_dist) {
            best_dist = d;
            best = id;
        }
    }
    return best;
}

void Scene::touch() {
    if (dirty_sink_) dirty_sink_->mark_dirty();
}

} // namespace mark_scene
