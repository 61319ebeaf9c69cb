#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace halcyon::model {

/// Identifies one output device on the audio server.
/// `name` is stable across reconnects, `id` is the server's object id.
struct SinkHandle {
    uint32_t id = 0;
    std::string name;

    bool operator==(const SinkHandle&) const = default;
};

/// One consistent observation of the sink's volume state.
/// Superseded as a whole on every update; never patched in place.
struct AudioSnapshot {
    int volume_percent = 0;
    bool muted = false;
    std::optional<std::string> sink_id;  // absent when no sink is bound

    bool operator==(const AudioSnapshot&) const = default;

    /// True if the audible state differs (sink identity is ignored)
    bool differs_audibly(const AudioSnapshot& other) const {
        return volume_percent != other.volume_percent || muted != other.muted;
    }
};

enum class StepDirection {
    Increase,
    Decrease,
};

struct StepCommand {
    StepDirection direction = StepDirection::Increase;
    int magnitude = 5;

    /// Target volume after applying this step, clamped to [0, 100]
    int apply(int current_volume) const;
};

enum class PillPhase {
    Idle,
    Expanding,
    Holding,
    Collapsing,
};

enum class IconGlyph {
    Muted,
    Low,
    High,
};

/// Mutable state of the volume widget. Owned by the widget controller,
/// written only by the animator's transitions and timer callbacks.
struct WidgetState {
    PillPhase phase = PillPhase::Idle;
    int displayed_volume = 0;
    bool displayed_muted = true;
    float pill_width = 0.0f;
    float pill_opacity = 0.0f;

    bool operator==(const WidgetState&) const = default;
};

/// Render-ready values re-read by the host on every frame
struct Projection {
    float pill_width = 0.0f;
    float pill_opacity = 0.0f;
    IconGlyph icon_glyph = IconGlyph::Muted;
    std::string icon_text;
    std::string icon_background;
    std::string pill_background;
    std::string label_text;
    std::string label_color;
    PillPhase phase = PillPhase::Idle;

    bool operator==(const Projection&) const = default;
};

const char* to_string(PillPhase phase);
const char* to_string(IconGlyph glyph);

}  // namespace halcyon::model
