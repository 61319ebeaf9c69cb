#pragma once

#include "config/Config.hpp"
#include "config/Theme.hpp"
#include "events/ChangeDebouncer.hpp"
#include "events/Scheduler.hpp"
#include "model/Snapshot.hpp"
#include "ui/PillAnimator.hpp"
#include "ui/PillMetrics.hpp"
#include <chrono>

namespace halcyon::ui::widgets {

/**
 * Icon for a volume level: muted or silent -> Muted, below 30% -> Low,
 * otherwise High.
 */
model::IconGlyph current_icon_glyph(int volume, bool muted);

/**
 * Root controller of the volume widget.
 *
 * Owns the WidgetState, the virtual clock and every timer that drives it.
 * Audio snapshots go in through observe(), time goes in through tick(),
 * and a render-ready Projection comes out. Nothing else leaves the widget.
 */
class VolumeWidget {
public:
    using Duration = std::chrono::milliseconds;

    VolumeWidget(const config::Config& cfg, const config::Theme& theme);

    VolumeWidget(const VolumeWidget&) = delete;
    VolumeWidget& operator=(const VolumeWidget&) = delete;

    /**
     * Feed one observation from the audio source.
     *
     * Volume is clamped to [0, 100]. A snapshot without a sink is shown as
     * muted at 0%. Never blocks and never throws.
     */
    void observe(const model::AudioSnapshot& snapshot);

    /**
     * Advance the widget's clock by `elapsed` and return the projection.
     *
     * Throws std::invalid_argument for negative `elapsed` without touching
     * any state.
     */
    model::Projection tick(Duration elapsed);

    // Current projection without advancing time
    [[nodiscard]] model::Projection projection() const;

    // Apply a snapshot still inside the quiet window without advancing time
    void flush();

    // Text measurement changes; the pill is re-aimed if the width moved
    void set_font_metrics(const FontMetrics& font);
    void set_padding(float padding, float icon_overlap);

    [[nodiscard]] const model::WidgetState& state() const { return state_; }
    [[nodiscard]] const PillAnimator& animator() const { return animator_; }
    [[nodiscard]] const PillMetrics& metrics() const { return metrics_; }
    [[nodiscard]] float max_pill_width() const { return metrics_.max_width(); }
    [[nodiscard]] Duration now() const { return scheduler_.now(); }

private:
    const std::string& icon_text(model::IconGlyph glyph) const;

    config::Config config_;
    config::Theme theme_;

    // Declaration order matters: timers reference the state and must be
    // cancelled (by the animator/debouncer destructors) before the scheduler dies
    events::Scheduler scheduler_;
    model::WidgetState state_;
    PillMetrics metrics_;
    PillAnimator animator_;
    events::ChangeDebouncer debouncer_;
};

}  // namespace halcyon::ui::widgets
