#pragma once

#include <cstdint>
#include <string>

namespace halcyon::ui {

/// Horizontal advances (in pixels) of the label font
struct FontMetrics {
    float digit_advance = 9.0f;
    float percent_advance = 12.0f;
    float glyph_advance = 9.0f;  // any other code point

    bool operator==(const FontMetrics&) const = default;
};

/**
 * Measures pill labels and caches the fully expanded pill width.
 *
 * The maximum width is the measured width of the widest label ("100%")
 * plus the horizontal padding and the overlap with the volume icon. It is
 * recomputed only when the font metrics or the padding change.
 */
class PillMetrics {
public:
    static constexpr const char* WIDEST_LABEL = "100%";

    PillMetrics(FontMetrics font, float padding, float icon_overlap);

    [[nodiscard]] float max_width() const { return max_width_; }
    [[nodiscard]] float measure(const std::string& text) const;

    // Both return true if the cached width was recomputed
    bool set_font_metrics(const FontMetrics& font);
    bool set_padding(float padding, float icon_overlap);

    [[nodiscard]] const FontMetrics& font() const { return font_; }
    [[nodiscard]] float padding() const { return padding_; }
    [[nodiscard]] float icon_overlap() const { return icon_overlap_; }

    // Bumped on every recompute
    [[nodiscard]] uint64_t generation() const { return generation_; }

private:
    void recompute();

    FontMetrics font_;
    float padding_;
    float icon_overlap_;
    float max_width_ = 0.0f;
    uint64_t generation_ = 0;
};

}  // namespace halcyon::ui
