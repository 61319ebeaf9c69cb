#pragma once

#include "events/Scheduler.hpp"
#include "model/Snapshot.hpp"
#include "ui/Animation.hpp"
#include <chrono>
#include <cstdint>

namespace halcyon::ui {

/**
 * Expand -> hold -> collapse state machine for the percentage pill.
 *
 *   Idle --changed--> Expanding --ramp done--> Holding --hold done--> Collapsing --ramp done--> Idle
 *                         ^                       |                         |
 *                         +-------changed---------+-----------changed-------+
 *
 * Ramps into Expanding always start from the width and opacity the pill has
 * at that instant, so an interrupted hold or collapse never snaps back to
 * zero. At most one phase timer is pending at any time; entering a phase
 * replaces it, so a superseded hold can never fire into a later phase.
 *
 * Writes only to the WidgetState it is given; the widget controller owns it.
 */
class PillAnimator {
public:
    using Duration = std::chrono::milliseconds;

    struct Timing {
        Duration ramp{250};
        Duration hold{2500};
    };

    static constexpr const char* PHASE_TIMER = "pill.phase";

    PillAnimator(events::Scheduler& scheduler, model::WidgetState& state, Timing timing, float max_width);
    ~PillAnimator();

    PillAnimator(const PillAnimator&) = delete;
    PillAnimator& operator=(const PillAnimator&) = delete;

    // A settled change from the debouncer
    void on_changed(const model::AudioSnapshot& snapshot);

    // Resample width/opacity at the scheduler's current time
    void update();

    // Re-aim the phase in progress at a new fully expanded width
    void set_max_width(float max_width);

    [[nodiscard]] model::PillPhase phase() const { return state_.phase; }
    [[nodiscard]] float max_width() const { return max_width_; }
    [[nodiscard]] const Timing& timing() const { return timing_; }

    // Number of entries into Expanding since construction
    [[nodiscard]] uint64_t expansions() const { return expansions_; }

private:
    void enter_expanding();
    void enter_holding();
    void enter_collapsing();
    void enter_idle();
    void set_phase(model::PillPhase phase);

    [[nodiscard]] Duration time_in_phase() const { return scheduler_.now() - phase_start_; }

    events::Scheduler& scheduler_;
    model::WidgetState& state_;
    Timing timing_;
    float max_width_;

    Ramp ramp_;
    Duration phase_start_{0};
    uint64_t expansions_ = 0;
};

}  // namespace halcyon::ui
