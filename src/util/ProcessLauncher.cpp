#include "util/ProcessLauncher.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <algorithm>
#include <cstring>
#include <spawn.h>
#include <sys/wait.h>

extern char** environ;

namespace halcyon::util {

SpawnLauncher::~SpawnLauncher() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!children_.empty()) {
        // Launched applications outlive the bar; init adopts them
        Logger::debug("SpawnLauncher: Leaving " + std::to_string(children_.size()) + " child(ren) running");
    }
}

void SpawnLauncher::launch(const std::string& command, LaunchCallback callback) {
    LaunchResult result;
    result.command = command;

    auto args = Platform::split_command(command);
    if (args.empty()) {
        result.error = "empty command";
        Logger::warn("SpawnLauncher: Refusing to launch empty command");
    } else {
        std::vector<char*> argv;
        argv.reserve(args.size() + 1);
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        posix_spawnattr_t attr;
        posix_spawnattr_init(&attr);
        // New session: the application must not die with the bar's terminal
        posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSID);

        pid_t pid = 0;
        int rc = posix_spawnp(&pid, argv[0], nullptr, &attr, argv.data(), environ);
        posix_spawnattr_destroy(&attr);

        if (rc == 0) {
            result.success = true;
            Logger::info("SpawnLauncher: Launched '" + command + "' (pid " + std::to_string(pid) + ")");
            std::lock_guard<std::mutex> lock(mutex_);
            children_.push_back(pid);
        } else {
            result.error = std::strerror(rc);
            Logger::warn("SpawnLauncher: Failed to launch '" + command + "': " + result.error);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back({std::move(result), std::move(callback)});
}

size_t SpawnLauncher::poll() {
    std::vector<PendingResult> ready;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ready.swap(pending_);

        children_.erase(std::remove_if(children_.begin(), children_.end(), [](pid_t pid) {
            int status = 0;
            pid_t rc = waitpid(pid, &status, WNOHANG);
            if (rc == pid) {
                Logger::debug("SpawnLauncher: Reaped pid " + std::to_string(pid) +
                              (WIFEXITED(status) ? " exit=" + std::to_string(WEXITSTATUS(status)) : ""));
                return true;
            }
            // rc < 0: not our child any more (ECHILD), stop tracking it
            return rc < 0;
        }), children_.end());
    }

    // Callbacks run outside the lock; they may launch again
    for (auto& item : ready) {
        if (item.callback) {
            item.callback(item.result);
        }
    }
    return ready.size();
}

size_t SpawnLauncher::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return children_.size();
}

}  // namespace halcyon::util
