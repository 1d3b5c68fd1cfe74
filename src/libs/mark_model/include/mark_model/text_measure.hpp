#pragma once

#include <mark_model/types.hpp>
#include <functional>
#include <string_view>

namespace mark_model {

// Returns the rendered size of `text` at `font_px`. The UI layer supplies one
// backed by its font atlas.
using TextMeasure = std::function<Size(std::string_view text, double font_px)>;

// Font-independent estimate: 0.6 em per code point, 1.3 em per line.
Size estimate_text_size(std::string_view text, double font_px);

const TextMeasure& default_text_measure();

} // namespace mark_model
