#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <string>

namespace halcyon::events {

/**
 * Virtual-time scheduler for named one-shot callbacks.
 *
 * Time only moves when advance() is called, so every timer in the widget
 * is driven by the same tick and stays deterministic under test.
 *
 * Scheduling a name that is already pending replaces it. A replaced or
 * cancelled callback never fires.
 */
class Scheduler {
public:
    using Task = std::function<void()>;
    using Duration = std::chrono::milliseconds;

    void schedule(const std::string& name, Duration delay, Task task);
    bool cancel(const std::string& name);
    [[nodiscard]] bool is_scheduled(const std::string& name) const;

    /**
     * Move the clock forward by `elapsed`, firing due callbacks in deadline
     * order. While a callback runs, now() equals its deadline, so anything it
     * schedules is measured from the exact expiry rather than the tick end.
     *
     * Throws std::invalid_argument for negative `elapsed`.
     */
    void advance(Duration elapsed);

    [[nodiscard]] Duration now() const { return now_; }
    [[nodiscard]] size_t size() const { return tasks_.size(); }

private:
    struct ScheduledTask {
        Task task;
        Duration deadline;
        uint64_t order;  // FIFO among equal deadlines
    };

    std::map<std::string, ScheduledTask> tasks_;
    Duration now_{0};
    uint64_t next_order_ = 0;
};

}  // namespace halcyon::events
