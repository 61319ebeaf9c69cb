#pragma once

#include "audio/AudioService.hpp"
#include "model/Snapshot.hpp"
#include "ui/widgets/VolumeWidget.hpp"
#include <optional>

namespace halcyon::collectors {

/**
 * Keeps the volume widget fed from whatever sink is currently the default.
 *
 * On a device change the old volume subscription is dropped before the new
 * one is made, so snapshots from a previous sink can never reach the widget.
 * Losing the default sink feeds an absent-sink snapshot.
 */
class SinkCollector {
public:
    SinkCollector(audio::AudioService& service, ui::widgets::VolumeWidget& widget);
    ~SinkCollector();

    SinkCollector(const SinkCollector&) = delete;
    SinkCollector& operator=(const SinkCollector&) = delete;

    // Bind the current default sink and start following device changes
    void start();

    [[nodiscard]] const std::optional<model::SinkHandle>& current_sink() const { return sink_; }

private:
    void bind(const std::optional<model::SinkHandle>& sink);

    audio::AudioService& service_;
    ui::widgets::VolumeWidget& widget_;

    std::optional<model::SinkHandle> sink_;
    std::optional<audio::AudioService::SubscriptionId> volume_subscription_;
    std::optional<audio::AudioService::SubscriptionId> device_subscription_;
    bool bound_once_ = false;
};

}  // namespace halcyon::collectors
