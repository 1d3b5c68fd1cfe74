#pragma once

#include "imgui.h"

namespace mark_scene {
class SceneController;
}

namespace mark_render {

// Draws the background floor plan, leader lines, marks, labels and the edit
// overlays (selection, anchor handle, rubber band) of one controller.
// `background` may be null when no texture is loaded.
void render_scene(ImDrawList* draw_list,
    const mark_scene::SceneController& controller,
    ImTextureID background,
    float offset_x, float offset_y, float zoom);

} // namespace mark_render
