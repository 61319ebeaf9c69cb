#include "events/Scheduler.hpp"
#include <stdexcept>

namespace halcyon::events {

void Scheduler::schedule(const std::string& name, Duration delay, Task task) {
    if (delay.count() < 0) {
        throw std::invalid_argument("Scheduler: negative delay for task '" + name + "'");
    }
    tasks_[name] = {std::move(task), now_ + delay, next_order_++};
}

bool Scheduler::cancel(const std::string& name) {
    return tasks_.erase(name) > 0;
}

bool Scheduler::is_scheduled(const std::string& name) const {
    return tasks_.count(name) > 0;
}

void Scheduler::advance(Duration elapsed) {
    if (elapsed.count() < 0) {
        throw std::invalid_argument("Scheduler: negative elapsed time (" +
                                    std::to_string(elapsed.count()) + "ms)");
    }

    const Duration target = now_ + elapsed;

    // Callbacks may schedule or cancel other tasks, so the earliest due task
    // is looked up again after every run instead of iterating the map.
    while (true) {
        auto due = tasks_.end();
        for (auto it = tasks_.begin(); it != tasks_.end(); ++it) {
            if (it->second.deadline > target) continue;
            if (due == tasks_.end() ||
                it->second.deadline < due->second.deadline ||
                (it->second.deadline == due->second.deadline && it->second.order < due->second.order)) {
                due = it;
            }
        }
        if (due == tasks_.end()) break;

        now_ = due->second.deadline;
        Task task = std::move(due->second.task);
        tasks_.erase(due);
        task();
    }

    now_ = target;
}

}  // namespace halcyon::events
