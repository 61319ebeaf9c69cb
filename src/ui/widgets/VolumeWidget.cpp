#include "ui/widgets/VolumeWidget.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace halcyon::ui::widgets {

model::IconGlyph current_icon_glyph(int volume, bool muted) {
    if (muted || volume <= 0) {
        return model::IconGlyph::Muted;
    }
    if (volume < 30) {
        return model::IconGlyph::Low;
    }
    return model::IconGlyph::High;
}

VolumeWidget::VolumeWidget(const config::Config& cfg, const config::Theme& theme)
    : config_(cfg),
      theme_(theme),
      metrics_(FontMetrics{cfg.digit_advance, cfg.percent_advance, cfg.glyph_advance},
               cfg.pill_padding, cfg.icon_overlap),
      animator_(scheduler_, state_,
                PillAnimator::Timing{Duration(std::max(0, cfg.ramp_ms)), Duration(std::max(0, cfg.hold_ms))},
                metrics_.max_width()),
      debouncer_(scheduler_, Duration(std::max(0, cfg.quiet_window_ms)),
                 [this](const model::AudioSnapshot& settled) { animator_.on_changed(settled); }) {
    util::Logger::info("VolumeWidget: Created (max pill width " +
                       std::to_string(metrics_.max_width()) + "px, theme " + theme_.name + ")");
}

void VolumeWidget::observe(const model::AudioSnapshot& snapshot) {
    model::AudioSnapshot normalized = snapshot;

    if (!normalized.sink_id) {
        // No sink bound: render as silent rather than keeping stale values
        normalized.volume_percent = 0;
        normalized.muted = true;
    } else if (normalized.volume_percent < 0 || normalized.volume_percent > 100) {
        util::Logger::warn("VolumeWidget: Clamping out-of-range volume " +
                           std::to_string(normalized.volume_percent) + "%");
        normalized.volume_percent = std::clamp(normalized.volume_percent, 0, 100);
    }

    debouncer_.push(normalized);
}

model::Projection VolumeWidget::tick(Duration elapsed) {
    if (elapsed.count() < 0) {
        throw std::invalid_argument("VolumeWidget::tick: negative elapsed time (" +
                                    std::to_string(elapsed.count()) + "ms)");
    }

    scheduler_.advance(elapsed);
    animator_.update();
    return projection();
}

void VolumeWidget::flush() {
    debouncer_.flush();
}

model::Projection VolumeWidget::projection() const {
    model::Projection out;
    out.pill_width = state_.pill_width;
    out.pill_opacity = state_.pill_opacity;
    out.icon_glyph = current_icon_glyph(state_.displayed_volume, state_.displayed_muted);
    out.icon_text = icon_text(out.icon_glyph);
    out.icon_background = theme_.icon_background_for(out.icon_glyph == model::IconGlyph::Muted);
    out.pill_background = theme_.pill_background;
    out.label_text = std::to_string(state_.displayed_volume) + "%";
    out.label_color = theme_.foreground;
    out.phase = state_.phase;
    return out;
}

void VolumeWidget::set_font_metrics(const FontMetrics& font) {
    if (metrics_.set_font_metrics(font)) {
        animator_.set_max_width(metrics_.max_width());
    }
}

void VolumeWidget::set_padding(float padding, float icon_overlap) {
    if (metrics_.set_padding(padding, icon_overlap)) {
        animator_.set_max_width(metrics_.max_width());
    }
}

const std::string& VolumeWidget::icon_text(model::IconGlyph glyph) const {
    switch (glyph) {
        case model::IconGlyph::Muted: return config_.icon_muted;
        case model::IconGlyph::Low:   return config_.icon_low;
        case model::IconGlyph::High:  return config_.icon_high;
    }
    return config_.icon_muted;
}

}  // namespace halcyon::ui::widgets
