#include "ui/widgets/VolumeInput.hpp"
#include "events/EventBus.hpp"
#include "util/Logger.hpp"

namespace halcyon::ui::widgets {

VolumeInput::VolumeInput(audio::AudioService& service, util::ProcessLauncher& launcher,
                         const config::Config& cfg)
    : service_(service),
      launcher_(launcher),
      step_percent_(cfg.step_percent),
      mixer_command_(cfg.mixer_command) {
}

void VolumeInput::on_primary_click() {
    auto sink = service_.get_default_sink();
    if (!sink) {
        util::Logger::debug("VolumeInput: Mute toggle ignored, no sink bound");
        return;
    }

    auto snap = service_.last_snapshot(*sink);
    bool muted = snap ? snap->muted : false;

    util::Logger::info("VolumeInput: " + std::string(muted ? "Unmuting " : "Muting ") + sink->name);
    if (!service_.set_muted(*sink, !muted)) {
        util::Logger::warn("VolumeInput: Mute command could not be sent to " + sink->name);
    }
}

void VolumeInput::on_secondary_click(util::ProcessLauncher::LaunchCallback callback) {
    util::Logger::info("VolumeInput: Opening mixer '" + mixer_command_ + "'");

    launcher_.launch(mixer_command_, [callback](const util::LaunchResult& result) {
        if (!result.success) {
            events::EventBus::instance().publish({
                events::Event::Type::LaunchFailed,
                "Cannot open " + result.command + ": " + result.error
            });
        }
        if (callback) {
            callback(result);
        }
    });
}

void VolumeInput::on_scroll(model::StepDirection direction, int current_volume) {
    auto sink = service_.get_default_sink();
    if (!sink) {
        util::Logger::debug("VolumeInput: Scroll ignored, no sink bound");
        return;
    }

    int target = make_step(direction).apply(current_volume);
    util::Logger::debug("VolumeInput: Scroll " + std::to_string(current_volume) + "% -> " +
                        std::to_string(target) + "%");
    if (!service_.set_volume(*sink, target)) {
        util::Logger::warn("VolumeInput: Volume command could not be sent to " + sink->name);
    }
}

void VolumeInput::handle_input(const InputEvent& event, int current_volume) {
    switch (event.type) {
        case InputEvent::Type::ButtonPress:
            if (event.is_button(InputEvent::Button::Primary)) {
                on_primary_click();
            } else if (event.is_button(InputEvent::Button::Secondary)) {
                on_secondary_click();
            }
            break;
        case InputEvent::Type::Scroll:
            on_scroll(event.scroll, current_volume);
            break;
    }
}

}  // namespace halcyon::ui::widgets
