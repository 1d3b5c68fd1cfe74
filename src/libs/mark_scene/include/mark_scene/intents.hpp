#pragma once

#include <mark_model/types.hpp>
#include <optional>
#include <variant>

namespace mark_scene {

struct Modifiers {
    bool ctrl = false;
    bool shift = false;
};

// Pointer events of the primary button, already mapped to scene coordinates.
struct PressAt {
    mark_model::Point pos;
    Modifiers mods;
};

// Emitted for every pointer motion; `button_down` is false while hovering.
struct MoveTo {
    mark_model::Point pos;
    bool button_down = false;
};

struct ReleaseAt {
    mark_model::Point pos;
};

struct DoubleClickAt {
    mark_model::Point pos;
};

using Intent = std::variant<PressAt, MoveTo, ReleaseAt, DoubleClickAt>;

// What the embedding UI should do after an intent was handled.
struct IntentResult {
    bool consumed = false;
    std::optional<mark_model::MarkId> open_detail;
    std::optional<mark_model::MarkId> edit_label;
    std::optional<mark_model::MarkId> edit_note;
};

} // namespace mark_scene
