#pragma once

#include "model/Snapshot.hpp"
#include <cstdint>
#include <functional>
#include <optional>

namespace halcyon::audio {

/**
 * Volume-level view of an audio server.
 *
 * Commands are fire-and-forget: their effect comes back later through the
 * observe_volume() stream, never as a synchronous confirmation. A `false`
 * return only means the command could not be sent at all.
 */
class AudioService {
public:
    using SnapshotCallback = std::function<void(const model::AudioSnapshot&)>;
    using SinkChangedCallback = std::function<void(const std::optional<model::SinkHandle>&)>;
    using SubscriptionId = uint64_t;

    virtual ~AudioService() = default;

    [[nodiscard]] virtual std::optional<model::SinkHandle> get_default_sink() const = 0;

    // The callback receives the sink's current state right away if it is known
    virtual SubscriptionId observe_volume(const model::SinkHandle& sink, SnapshotCallback callback) = 0;

    // Device-change notifications; absent when the default sink disappears
    virtual SubscriptionId on_default_sink_changed(SinkChangedCallback callback) = 0;

    // Removes either kind of subscription
    virtual void unobserve(SubscriptionId id) = 0;

    [[nodiscard]] virtual std::optional<model::AudioSnapshot> last_snapshot(const model::SinkHandle& sink) const = 0;

    virtual bool set_volume(const model::SinkHandle& sink, int percent) = 0;
    virtual bool set_muted(const model::SinkHandle& sink, bool muted) = 0;
};

}  // namespace halcyon::audio
