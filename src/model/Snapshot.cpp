#include "model/Snapshot.hpp"
#include <algorithm>

namespace halcyon::model {

int StepCommand::apply(int current_volume) const {
    int delta = (direction == StepDirection::Increase) ? magnitude : -magnitude;
    return std::clamp(current_volume + delta, 0, 100);
}

const char* to_string(PillPhase phase) {
    switch (phase) {
        case PillPhase::Idle:       return "idle";
        case PillPhase::Expanding:  return "expanding";
        case PillPhase::Holding:    return "holding";
        case PillPhase::Collapsing: return "collapsing";
    }
    return "unknown";
}

const char* to_string(IconGlyph glyph) {
    switch (glyph) {
        case IconGlyph::Muted: return "muted";
        case IconGlyph::Low:   return "low";
        case IconGlyph::High:  return "high";
    }
    return "unknown";
}

}  // namespace halcyon::model
