#include "ui/PillAnimator.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <format>

namespace halcyon::ui {

using model::PillPhase;

PillAnimator::PillAnimator(events::Scheduler& scheduler, model::WidgetState& state,
                           Timing timing, float max_width)
    : scheduler_(scheduler), state_(state), timing_(timing), max_width_(max_width) {
    state_.phase = PillPhase::Idle;
    state_.pill_width = 0.0f;
    state_.pill_opacity = 0.0f;
}

PillAnimator::~PillAnimator() {
    scheduler_.cancel(PHASE_TIMER);
}

void PillAnimator::on_changed(const model::AudioSnapshot& snapshot) {
    // Bring width/opacity to this instant before anything reads them as a start point
    update();

    // Text must read correctly before the pill starts to grow
    state_.displayed_volume = snapshot.volume_percent;
    state_.displayed_muted = snapshot.muted;

    switch (state_.phase) {
        case PillPhase::Idle:
        case PillPhase::Holding:
        case PillPhase::Collapsing:
            enter_expanding();
            break;
        case PillPhase::Expanding:
            // Already heading to full width; the hold starts when it gets there
            util::Logger::debug(std::format("PillAnimator: Change during expand, label updated to {}%",
                                            snapshot.volume_percent));
            break;
    }
}

void PillAnimator::update() {
    switch (state_.phase) {
        case PillPhase::Idle:
            state_.pill_width = 0.0f;
            state_.pill_opacity = 0.0f;
            break;
        case PillPhase::Holding:
            state_.pill_width = max_width_;
            state_.pill_opacity = 1.0f;
            break;
        case PillPhase::Expanding:
        case PillPhase::Collapsing: {
            RampSample s = ramp_.sample(time_in_phase());
            state_.pill_width = s.width;
            state_.pill_opacity = s.opacity;
            break;
        }
    }
}

void PillAnimator::set_max_width(float max_width) {
    update();
    max_width_ = std::max(0.0f, max_width);

    RampSample from = ramp_.from();
    from.width = std::min(from.width, max_width_);

    switch (state_.phase) {
        case PillPhase::Expanding:
            ramp_ = Ramp(from, {max_width_, 1.0f}, timing_.ramp, EasingFunction::EaseOut);
            break;
        case PillPhase::Collapsing:
            ramp_ = Ramp(from, {0.0f, 0.0f}, timing_.ramp, EasingFunction::EaseIn);
            break;
        case PillPhase::Idle:
        case PillPhase::Holding:
            break;
    }
    update();
}

void PillAnimator::enter_expanding() {
    RampSample from{state_.pill_width, state_.pill_opacity};
    ramp_ = Ramp(from, {max_width_, 1.0f}, timing_.ramp, EasingFunction::EaseOut);
    ++expansions_;
    set_phase(PillPhase::Expanding);

    // Replaces a pending hold or collapse timer
    scheduler_.schedule(PHASE_TIMER, timing_.ramp, [this]() { enter_holding(); });
    update();
}

void PillAnimator::enter_holding() {
    set_phase(PillPhase::Holding);
    scheduler_.schedule(PHASE_TIMER, timing_.hold, [this]() { enter_collapsing(); });
    update();
}

void PillAnimator::enter_collapsing() {
    RampSample from{state_.pill_width, state_.pill_opacity};
    if (state_.phase == PillPhase::Holding) {
        from = {max_width_, 1.0f};
    }
    ramp_ = Ramp(from, {0.0f, 0.0f}, timing_.ramp, EasingFunction::EaseIn);
    set_phase(PillPhase::Collapsing);
    scheduler_.schedule(PHASE_TIMER, timing_.ramp, [this]() { enter_idle(); });
    update();
}

void PillAnimator::enter_idle() {
    set_phase(PillPhase::Idle);
    scheduler_.cancel(PHASE_TIMER);
    update();
}

void PillAnimator::set_phase(PillPhase phase) {
    util::Logger::debug(std::format("PillAnimator: {} -> {} at {}ms", model::to_string(state_.phase),
                                    model::to_string(phase), scheduler_.now().count()));
    state_.phase = phase;
    phase_start_ = scheduler_.now();
}

}  // namespace halcyon::ui
