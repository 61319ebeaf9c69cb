#include "ui/PillMetrics.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <format>

namespace halcyon::ui {

PillMetrics::PillMetrics(FontMetrics font, float padding, float icon_overlap)
    : font_(font), padding_(padding), icon_overlap_(icon_overlap) {
    recompute();
}

float PillMetrics::measure(const std::string& text) const {
    float width = 0.0f;
    for (unsigned char c : text) {
        // UTF-8 continuation bytes belong to the code point already counted
        if ((c & 0xC0) == 0x80) continue;

        if (c >= '0' && c <= '9') {
            width += font_.digit_advance;
        } else if (c == '%') {
            width += font_.percent_advance;
        } else {
            width += font_.glyph_advance;
        }
    }
    return width;
}

bool PillMetrics::set_font_metrics(const FontMetrics& font) {
    if (font == font_) return false;
    font_ = font;
    recompute();
    return true;
}

bool PillMetrics::set_padding(float padding, float icon_overlap) {
    if (padding == padding_ && icon_overlap == icon_overlap_) return false;
    padding_ = padding;
    icon_overlap_ = icon_overlap;
    recompute();
    return true;
}

void PillMetrics::recompute() {
    max_width_ = std::max(0.0f, measure(WIDEST_LABEL) + padding_ + icon_overlap_);
    ++generation_;
    util::Logger::debug(std::format("PillMetrics: Max pill width {:.1f}px (generation {})",
                                    max_width_, generation_));
}

}  // namespace halcyon::ui
