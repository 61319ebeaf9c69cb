#pragma once

#include <string>

namespace halcyon::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    // Opens `path` truncated; calling it again with the path already open only changes the level
    static void init(const std::string& path = default_path(), Level min_level = Level::Debug);
    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    // Accepts "debug", "info", "warn"/"warning", "error"; anything else maps to Info
    static Level parse_level(const std::string& name);
    static std::string default_path() { return "/tmp/halcyon_debug.log"; }
};

}  // namespace halcyon::util
