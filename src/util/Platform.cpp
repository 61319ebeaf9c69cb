#include "util/Platform.hpp"
#include "util/Logger.hpp"
#include <cstdlib>

namespace halcyon::util {

std::filesystem::path Platform::get_config_directory() {
    util::Logger::debug("Platform: Detecting config directory");
    if (auto xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "halcyon";
    }
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".config" / "halcyon";
    }
    util::Logger::warn("Platform: HOME env var not set, using fallback: .config/halcyon");
    return ".config/halcyon";
}

std::vector<std::string> Platform::split_command(const std::string& command) {
    std::vector<std::string> args;
    std::string current;
    bool in_quotes = false;
    bool has_token = false;

    for (char c : command) {
        if (c == '"') {
            in_quotes = !in_quotes;
            has_token = true;
        } else if ((c == ' ' || c == '\t') && !in_quotes) {
            if (has_token) {
                args.push_back(current);
                current.clear();
                has_token = false;
            }
        } else {
            current += c;
            has_token = true;
        }
    }
    if (has_token) {
        args.push_back(current);
    }
    return args;
}

}  // namespace halcyon::util
