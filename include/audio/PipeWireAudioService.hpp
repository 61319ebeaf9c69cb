#pragma once

#include "audio/AudioService.hpp"
#include <memory>

namespace halcyon::audio {

/**
 * AudioService backed by the PipeWire daemon.
 *
 * Every Audio/Sink node is bound and its Props parameter followed
 * (channelVolumes on the cubic scale, mute). The default sink comes from
 * "default.audio.sink" in the "default" metadata object.
 *
 * PipeWire callbacks run on the PipeWire loop thread and only queue
 * notifications. dispatch() delivers them on the caller's thread, in the
 * order they arrived, so observers never run concurrently with the widget.
 */
class PipeWireAudioService : public AudioService {
public:
    PipeWireAudioService();
    ~PipeWireAudioService() override;

    bool connect();
    [[nodiscard]] bool is_connected() const;

    // Deliver queued snapshots and sink changes; returns notifications delivered
    size_t dispatch();

    [[nodiscard]] std::optional<model::SinkHandle> get_default_sink() const override;
    SubscriptionId observe_volume(const model::SinkHandle& sink, SnapshotCallback callback) override;
    SubscriptionId on_default_sink_changed(SinkChangedCallback callback) override;
    void unobserve(SubscriptionId id) override;
    [[nodiscard]] std::optional<model::AudioSnapshot> last_snapshot(const model::SinkHandle& sink) const override;
    bool set_volume(const model::SinkHandle& sink, int percent) override;
    bool set_muted(const model::SinkHandle& sink, bool muted) override;

    // Cubic volume curve used by PipeWire/WirePlumber mixers
    static int linear_to_percent(float linear);
    static float percent_to_linear(int percent);

    // Extracts "name" from a metadata value such as {"name":"alsa_output.pci"}
    static std::string parse_metadata_name(const std::string& json);

    // Visible to the C callbacks in the implementation file
    struct Impl;

private:
    std::unique_ptr<Impl> impl_;
};

}  // namespace halcyon::audio
