#include "ui/Animation.hpp"
#include <cmath>

namespace halcyon::ui {

float apply_easing(float t, EasingFunction easing) {
    // Clamp to [0, 1]
    t = std::clamp(t, 0.0f, 1.0f);

    switch (easing) {
        case EasingFunction::Linear:
            return t;

        case EasingFunction::EaseIn:
            // Quadratic acceleration: f(t) = t^2
            return t * t;

        case EasingFunction::EaseOut:
            // Quadratic deceleration: f(t) = 1 - (1-t)^2
            return 1.0f - std::pow(1.0f - t, 2.0f);

        default:
            return t;
    }
}

float Ramp::progress(Duration elapsed) const {
    if (elapsed >= duration_) {
        return 1.0f;
    }
    if (elapsed.count() <= 0) {
        return 0.0f;
    }

    float linear_progress = static_cast<float>(elapsed.count()) / static_cast<float>(duration_.count());
    return apply_easing(linear_progress, easing_);
}

RampSample Ramp::sample(Duration elapsed) const {
    // Endpoints are returned exactly so settled phases compare equal to their targets
    if (elapsed >= duration_) {
        return to_;
    }
    float t = progress(elapsed);
    RampSample result;
    result.width = std::clamp(lerp(from_.width, to_.width, t),
                              std::min(from_.width, to_.width),
                              std::max(from_.width, to_.width));
    result.opacity = std::clamp(lerp(from_.opacity, to_.opacity, t), 0.0f, 1.0f);
    return result;
}

}  // namespace halcyon::ui
