#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <vector>

namespace halcyon::util {

struct LaunchResult {
    std::string command;
    bool success = false;
    std::string error;  // empty on success
};

/**
 * Starts external applications without waiting for them.
 */
class ProcessLauncher {
public:
    using LaunchCallback = std::function<void(const LaunchResult&)>;

    virtual ~ProcessLauncher() = default;

    // The callback never runs inside launch(); it is delivered later
    virtual void launch(const std::string& command, LaunchCallback callback) = 0;
};

/**
 * posix_spawnp-based launcher.
 *
 * Results are queued and handed to their callbacks from poll(), which the
 * host calls from its main loop. poll() also reaps children that exited.
 */
class SpawnLauncher : public ProcessLauncher {
public:
    SpawnLauncher() = default;
    ~SpawnLauncher() override;

    void launch(const std::string& command, LaunchCallback callback) override;

    // Deliver queued results and reap exited children; returns results delivered
    size_t poll();

    [[nodiscard]] size_t running() const;

private:
    struct PendingResult {
        LaunchResult result;
        LaunchCallback callback;
    };

    std::vector<PendingResult> pending_;
    std::vector<pid_t> children_;
    mutable std::mutex mutex_;
};

}  // namespace halcyon::util
