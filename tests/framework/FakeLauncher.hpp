#pragma once

#include "util/ProcessLauncher.hpp"
#include <vector>

namespace halcyon::test {

// Records launches and holds their callbacks until complete() is called
class FakeLauncher : public util::ProcessLauncher {
public:
    void launch(const std::string& command, LaunchCallback callback) override {
        launched.push_back(command);
        pending_.push_back({command, std::move(callback)});
    }

    // Finish every pending launch with the given outcome
    void complete(bool success, const std::string& error = "") {
        auto pending = std::move(pending_);
        pending_.clear();
        for (auto& [command, callback] : pending) {
            if (callback) {
                callback(util::LaunchResult{command, success, success ? "" : error});
            }
        }
    }

    [[nodiscard]] size_t pending() const { return pending_.size(); }

    std::vector<std::string> launched;

private:
    std::vector<std::pair<std::string, LaunchCallback>> pending_;
};

} // namespace halcyon::test
