#pragma once

#include "audio/AudioService.hpp"
#include "config/Config.hpp"
#include "model/Snapshot.hpp"
#include "ui/InputEvent.hpp"
#include "util/ProcessLauncher.hpp"

namespace halcyon::ui::widgets {

/**
 * Turns pointer input on the volume widget into audio-sink commands.
 *
 * Holds no state of its own and never touches the widget: the effect of a
 * command comes back through the audio service's snapshot stream.
 */
class VolumeInput {
public:
    VolumeInput(audio::AudioService& service, util::ProcessLauncher& launcher, const config::Config& cfg);

    // Toggle mute on the default sink; silently does nothing without one
    void on_primary_click();

    // Launch the mixer application. The outcome goes to `callback` later;
    // a failure is also published as Event::Type::LaunchFailed.
    void on_secondary_click(util::ProcessLauncher::LaunchCallback callback = {});

    void on_scroll(model::StepDirection direction, int current_volume);

    void handle_input(const InputEvent& event, int current_volume);

    [[nodiscard]] model::StepCommand make_step(model::StepDirection direction) const {
        return model::StepCommand{direction, step_percent_};
    }

private:
    audio::AudioService& service_;
    util::ProcessLauncher& launcher_;
    int step_percent_;
    std::string mixer_command_;
};

}  // namespace halcyon::ui::widgets
