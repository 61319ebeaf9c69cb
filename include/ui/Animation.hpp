#pragma once

#include <chrono>
#include <algorithm>

namespace halcyon::ui {

/**
 * Easing functions for smooth animations
 */
enum class EasingFunction {
    Linear,         // No easing, constant speed
    EaseIn,         // Starts slow, ends fast (acceleration)
    EaseOut         // Starts fast, ends slow (deceleration)
};

/**
 * Apply easing function to linear progress in [0, 1]
 */
float apply_easing(float t, EasingFunction easing);

struct RampSample {
    float width = 0.0f;
    float opacity = 0.0f;
};

/**
 * Timed interpolation of the pill's width and opacity between two endpoints.
 *
 * A ramp holds no clock of its own; callers pass the time spent in it,
 * which keeps it usable from a virtual-time tick.
 */
class Ramp {
public:
    using Duration = std::chrono::milliseconds;

    Ramp() = default;
    Ramp(RampSample from, RampSample to, Duration duration, EasingFunction easing)
        : from_(from), to_(to), duration_(duration), easing_(easing) {}

    /**
     * Eased progress [0.0, 1.0] after `elapsed` in the ramp.
     * Returns 1.0 once the duration is reached (or for a zero-length ramp).
     */
    float progress(Duration elapsed) const;

    RampSample sample(Duration elapsed) const;

    bool is_complete(Duration elapsed) const { return elapsed >= duration_; }

    const RampSample& from() const { return from_; }
    const RampSample& to() const { return to_; }
    Duration duration() const { return duration_; }

private:
    static float lerp(float a, float b, float t) {
        return a + (b - a) * t;
    }

    RampSample from_;
    RampSample to_;
    Duration duration_{0};
    EasingFunction easing_ = EasingFunction::Linear;
};

}  // namespace halcyon::ui
