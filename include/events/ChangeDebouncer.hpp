#pragma once

#include "events/Scheduler.hpp"
#include "model/Snapshot.hpp"
#include <functional>
#include <optional>
#include <string>

namespace halcyon::events {

/**
 * Collapses bursts of audio snapshots into one "changed" notification.
 *
 * Every snapshot that differs from the last emitted one (volume or mute)
 * becomes the pending value and restarts the quiet window. Only when the
 * window elapses without another push is the pending snapshot emitted.
 * Latest value wins; nothing is queued.
 */
class ChangeDebouncer {
public:
    using ChangedHandler = std::function<void(const model::AudioSnapshot&)>;

    ChangeDebouncer(Scheduler& scheduler,
                    Scheduler::Duration quiet_window,
                    ChangedHandler on_changed,
                    std::string timer_name = "debounce.quiet_window");
    ~ChangeDebouncer();

    ChangeDebouncer(const ChangeDebouncer&) = delete;
    ChangeDebouncer& operator=(const ChangeDebouncer&) = delete;

    void push(const model::AudioSnapshot& snapshot);

    // Emit the pending snapshot now instead of waiting for the window
    void flush();

    [[nodiscard]] bool pending() const { return pending_.has_value(); }
    [[nodiscard]] const std::optional<model::AudioSnapshot>& last_emitted() const { return last_emitted_; }

private:
    void emit();

    Scheduler& scheduler_;
    Scheduler::Duration quiet_window_;
    ChangedHandler on_changed_;
    std::string timer_name_;

    std::optional<model::AudioSnapshot> pending_;
    std::optional<model::AudioSnapshot> last_emitted_;
};

}  // namespace halcyon::events
