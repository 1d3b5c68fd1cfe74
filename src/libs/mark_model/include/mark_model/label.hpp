#pragma once

#include <mark_model/text_measure.hpp>
#include <mark_model/types.hpp>
#include <string_view>

namespace mark_model {

void enable_label(Mark& m, std::string_view text, const TextMeasure& measure);
void update_label(Mark& m, std::string_view text, const TextMeasure& measure);
void reposition_label(Mark& m);

Rect label_scene_bounds(const Mark& m);
bool label_hit_test(const Mark& m, Point scene_pt);

// Label text a mark should carry: the member name for circles, the legacy
// display id for old shape records, empty otherwise.
std::string label_text_for(const Mark& m);

} // namespace mark_model
