#include <mark_model/label.hpp>
#include <mark_model/mark.hpp>
#include <mark_model/mark_constants.hpp>
#include <string>

namespace mark_model {

void enable_label(Mark& m, std::string_view text, const TextMeasure& measure) {
    if (!owns_label(m.kind)) return;
    if (m.label) {
        update_label(m, text, measure);
        return;
    }
    Label label;
    label.text = std::string(text);
    label.size = measure(label.text, defaults::label_font_px);
    m.label = label;
    reposition_label(m);
}

void update_label(Mark& m, std::string_view text, const TextMeasure& measure) {
    if (!m.label) return;
    m.label->text = std::string(text);
    m.label->size = measure(m.label->text, defaults::label_font_px);
    reposition_label(m);
}

void reposition_label(Mark& m) {
    if (!m.label) return;
    const Rect rect = local_bounds(m);
    if (rect.is_null()) return;
    m.label->local_pos = {
        rect.right() + defaults::label_margin_x,
        rect.bottom() - m.label->size.height + defaults::label_margin_y,
    };
}

Rect label_scene_bounds(const Mark& m) {
    if (!m.label) return {};
    const Rect local{m.label->local_pos.x, m.label->local_pos.y,
        m.label->size.width, m.label->size.height};
    return transform_of(m).map_bounds(local);
}

bool label_hit_test(const Mark& m, Point scene_pt) {
    if (!m.visible || !m.label) return false;
    return label_scene_bounds(m).contains(scene_pt);
}

std::string label_text_for(const Mark& m) {
    if (has_defect_record(m.kind))
        return m.defect ? m.defect->member : std::string();
    if (!m.legacy_display_id.empty()) return m.legacy_display_id;
    if (m.display_id) return std::to_string(*m.display_id);
    return {};
}

} // namespace mark_model
