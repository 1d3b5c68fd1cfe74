#include <mark_render/render_scene.hpp>
#include <mark_scene/editor_tuning.hpp>
#include <mark_scene/scene_controller.hpp>
#include <mark_model/label.hpp>
#include <mark_model/mark.hpp>
#include <mark_model/mark_constants.hpp>
#include <algorithm>
#include <cfloat>
#include <cmath>
#include <string>
#include <vector>

namespace mark_render {

namespace {

using mark_model::Mark;
using mark_model::MarkKind;
namespace defaults = mark_model::defaults;

const unsigned int mark_color = IM_COL32(220, 40, 40, 255);
const unsigned int circle_fill = IM_COL32(255, 255, 255, 200);
const unsigned int memo_color = IM_COL32(30, 90, 220, 255);
const unsigned int note_color = IM_COL32(20, 20, 20, 255);
const unsigned int label_fill = IM_COL32(255, 255, 240, 230);
const unsigned int label_border = IM_COL32(120, 120, 120, 255);
const unsigned int selection_color = IM_COL32(0, 120, 215, 255);
const unsigned int handle_color = IM_COL32(255, 160, 0, 255);
const unsigned int band_fill = IM_COL32(0, 120, 215, 40);

ImVec2 world_to_screen(double wx, double wy, float offset_x, float offset_y, float zoom) {
    return ImVec2((float)wx * zoom + offset_x, (float)wy * zoom + offset_y);
}

ImVec2 world_to_screen(mark_model::Point p, float offset_x, float offset_y, float zoom) {
    return world_to_screen(p.x, p.y, offset_x, offset_y, zoom);
}

unsigned int with_alpha(unsigned int color, double opacity) {
    const auto a = (unsigned int)std::clamp(opacity * 255.0, 0.0, 255.0);
    return (color & ~IM_COL32_A_MASK) | (a << IM_COL32_A_SHIFT);
}

struct DrawContext {
    ImDrawList* draw_list;
    float offset_x;
    float offset_y;
    float zoom;
    ImFont* font;

    ImVec2 to_screen(mark_model::Point p) const { return world_to_screen(p, offset_x, offset_y, zoom); }
};

void draw_polyline(const DrawContext& ctx, const mark_model::Polyline& pts, unsigned int color,
    float thickness, bool closed)
{
    if (pts.size() < 2) return;
    std::vector<ImVec2> screen;
    screen.reserve(pts.size());
    for (const auto& p : pts) screen.push_back(ctx.to_screen(p));
    ctx.draw_list->AddPolyline(screen.data(), (int)screen.size(), color,
        closed ? ImDrawFlags_Closed : ImDrawFlags_None, thickness);
}

void draw_dashed_rect(const DrawContext& ctx, const mark_model::Rect& r, unsigned int color) {
    const ImVec2 a = ctx.to_screen({r.x, r.y});
    const ImVec2 b = ctx.to_screen({r.right(), r.bottom()});
    const float dash = 4.0f;
    auto dashed = [&](ImVec2 from, ImVec2 to) {
        const float dx = to.x - from.x;
        const float dy = to.y - from.y;
        const float len = std::sqrt(dx * dx + dy * dy);
        if (len <= 0.0f) return;
        for (float t = 0.0f; t < len; t += dash * 2.0f) {
            const float t2 = std::min(t + dash, len);
            ctx.draw_list->AddLine(ImVec2(from.x + dx * t / len, from.y + dy * t / len),
                ImVec2(from.x + dx * t2 / len, from.y + dy * t2 / len), color, 1.0f);
        }
    };
    dashed(a, ImVec2(b.x, a.y));
    dashed(ImVec2(b.x, a.y), b);
    dashed(b, ImVec2(a.x, b.y));
    dashed(ImVec2(a.x, b.y), a);
}

void draw_leader_line(const DrawContext& ctx, const Mark& m) {
    if (!m.leader || !m.visible) return;
    const auto& line = *m.leader;
    const unsigned int color = with_alpha(mark_color, line.opacity);
    const ImVec2 a = ctx.to_screen(line.anchor);
    ctx.draw_list->AddLine(a, ctx.to_screen(line.terminus), color,
        (float)defaults::leader_width * ctx.zoom);
    ctx.draw_list->AddCircleFilled(a, 2.5f * ctx.zoom, color);
}

void draw_circle_numeral(const DrawContext& ctx, const Mark& m) {
    if (!m.display_id) return;
    const std::string text = std::to_string(*m.display_id);
    const float font_px = (float)(m.radius * m.scale) * ctx.zoom;
    const ImVec2 size = ctx.font->CalcTextSizeA(font_px, FLT_MAX, 0.0f, text.c_str());
    const ImVec2 c = ctx.to_screen(mark_model::scene_center(m));
    ctx.draw_list->AddText(ctx.font, font_px, ImVec2(c.x - size.x * 0.5f, c.y - size.y * 0.5f),
        mark_color, text.c_str());
}

void draw_mark_body(const DrawContext& ctx, const Mark& m) {
    const float stroke = 2.0f * ctx.zoom;
    const auto outlines = mark_model::outline_scene(m);

    switch (m.kind) {
    case MarkKind::Circle: {
        const ImVec2 c = ctx.to_screen(mark_model::scene_center(m));
        const float r = (float)(m.radius * m.scale) * ctx.zoom;
        ctx.draw_list->AddCircleFilled(c, r, circle_fill);
        ctx.draw_list->AddCircle(c, r, mark_color, 0, stroke);
        draw_circle_numeral(ctx, m);
        break;
    }
    case MarkKind::Square:
    case MarkKind::Triangle:
        for (const auto& o : outlines) draw_polyline(ctx, o, mark_color, stroke, true);
        break;
    case MarkKind::SCurve:
        if (!outlines.empty())
            draw_polyline(ctx, outlines[0], mark_color, (float)defaults::scurve_stroke * ctx.zoom, false);
        if (outlines.size() > 1) {
            const ImVec2 c = ctx.to_screen(mark_model::scene_center(m));
            ctx.draw_list->AddCircleFilled(c, (float)(m.mid_radius * m.scale) * ctx.zoom, mark_color);
        }
        break;
    case MarkKind::NoteText: {
        const ImVec2 p = ctx.to_screen(m.pos + mark_model::Point{defaults::text_margin, defaults::text_margin});
        ctx.draw_list->AddText(ctx.font, (float)(defaults::note_font_px * m.scale) * ctx.zoom, p,
            note_color, m.text.c_str());
        break;
    }
    case MarkKind::MemoLine:
    case MarkKind::MemoFreePath:
        draw_polyline(ctx, m.points, memo_color, (float)defaults::memo_stroke * ctx.zoom, false);
        break;
    }
}

void draw_label(const DrawContext& ctx, const Mark& m) {
    if (!m.label || m.label->editing || m.label->text.empty()) return;
    const auto box = mark_model::label_scene_bounds(m);
    const ImVec2 a = ctx.to_screen({box.x, box.y});
    const ImVec2 b = ctx.to_screen({box.right(), box.bottom()});
    ctx.draw_list->AddRectFilled(ImVec2(a.x - 2, a.y - 1), ImVec2(b.x + 2, b.y + 1), label_fill);
    ctx.draw_list->AddRect(ImVec2(a.x - 2, a.y - 1), ImVec2(b.x + 2, b.y + 1), label_border);
    ctx.draw_list->AddText(ctx.font, (float)defaults::label_font_px * ctx.zoom, a,
        note_color, m.label->text.c_str());
}

} // namespace

void render_scene(ImDrawList* draw_list,
    const mark_scene::SceneController& controller,
    ImTextureID background,
    float offset_x, float offset_y, float zoom)
{
    if (!draw_list) return;
    const DrawContext ctx{draw_list, offset_x, offset_y, zoom, ImGui::GetFont()};
    const auto& scene = controller.scene();

    if (background && scene.has_background()) {
        const auto size = scene.background_size();
        draw_list->AddImage(background, ctx.to_screen({0, 0}), ctx.to_screen({size.width, size.height}));
    }

    // Leader lines stay below every mark body.
    for (const auto& [id, m] : scene.marks()) draw_leader_line(ctx, m);

    for (const auto& [id, m] : scene.marks()) {
        if (m.visible) draw_mark_body(ctx, m);
    }
    for (const auto& [id, m] : scene.marks()) {
        if (m.visible) draw_label(ctx, m);
    }
    for (const auto& [id, m] : scene.marks()) {
        if (m.visible && m.selected) draw_dashed_rect(ctx, mark_model::scene_bounds(m), selection_color);
    }

    if (auto handle = controller.anchor_handle_pos()) {
        const ImVec2 c = ctx.to_screen(*handle);
        draw_list->AddCircle(c, (float)mark_scene::tuning::anchor_handle_radius_px, handle_color, 0, 2.0f);
        draw_list->AddCircleFilled(c, 3.0f, handle_color);
    }

    if (auto band = controller.rubber_band()) {
        const ImVec2 a = ctx.to_screen({band->x, band->y});
        const ImVec2 b = ctx.to_screen({band->right(), band->bottom()});
        draw_list->AddRectFilled(a, b, band_fill);
        draw_list->AddRect(a, b, selection_color);
    }
}

} // namespace mark_render
