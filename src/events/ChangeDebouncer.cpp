#include "events/ChangeDebouncer.hpp"
#include "util/Logger.hpp"

namespace halcyon::events {

ChangeDebouncer::ChangeDebouncer(Scheduler& scheduler,
                                 Scheduler::Duration quiet_window,
                                 ChangedHandler on_changed,
                                 std::string timer_name)
    : scheduler_(scheduler),
      quiet_window_(quiet_window),
      on_changed_(std::move(on_changed)),
      timer_name_(std::move(timer_name)) {
}

ChangeDebouncer::~ChangeDebouncer() {
    // The scheduler may outlive us; a timer left behind would call into a dead object
    scheduler_.cancel(timer_name_);
}

void ChangeDebouncer::push(const model::AudioSnapshot& snapshot) {
    // GUARD: Nothing pending and nothing audible changed - keep the sink id fresh, skip the timer
    if (!pending_ && last_emitted_ && !snapshot.differs_audibly(*last_emitted_)) {
        last_emitted_->sink_id = snapshot.sink_id;
        return;
    }

    pending_ = snapshot;
    scheduler_.schedule(timer_name_, quiet_window_, [this]() { emit(); });
}

void ChangeDebouncer::flush() {
    if (!pending_) return;
    scheduler_.cancel(timer_name_);
    emit();
}

void ChangeDebouncer::emit() {
    model::AudioSnapshot settled = *pending_;
    pending_.reset();

    // A burst that returned to the last emitted value settles without an event
    if (last_emitted_ && !settled.differs_audibly(*last_emitted_)) {
        last_emitted_ = settled;
        util::Logger::debug("ChangeDebouncer: Burst settled on unchanged value, no event");
        return;
    }

    last_emitted_ = settled;
    util::Logger::debug("ChangeDebouncer: Settled at " + std::to_string(settled.volume_percent) +
                        "% muted=" + (settled.muted ? "true" : "false"));
    if (on_changed_) {
        on_changed_(settled);
    }
}

}  // namespace halcyon::events
