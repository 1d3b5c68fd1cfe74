#include <mark_model/text_measure.hpp>
#include <algorithm>
#include <cstddef>

namespace mark_model {

namespace {

bool is_continuation_byte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // namespace

Size estimate_text_size(std::string_view text, double font_px) {
    std::size_t lines = 1;
    std::size_t longest = 0;
    std::size_t current = 0;
    for (char ch : text) {
        const auto c = static_cast<unsigned char>(ch);
        if (c == '\n') {
            longest = std::max(longest, current);
            current = 0;
            ++lines;
            continue;
        }
        if (!is_continuation_byte(c)) ++current;
    }
    longest = std::max(longest, current);
    return {static_cast<double>(longest) * font_px * 0.6, static_cast<double>(lines) * font_px * 1.3};
}

const TextMeasure& default_text_measure() {
    static const TextMeasure measure = estimate_text_size;
    return measure;
}

} // namespace mark_model
