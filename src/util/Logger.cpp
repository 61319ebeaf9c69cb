#include "util/Logger.hpp"
#include <iostream>
#include <fstream>
#include <iomanip>
#include <ctime>
#include <mutex>
#include <format>

namespace halcyon::util {

static std::mutex log_mutex;
static std::ofstream log_file;  // Keep file open for performance
static std::string log_path;    // File this run is writing to
static Logger::Level log_min_level = Logger::Level::Debug;

void Logger::init(const std::string& path, Level min_level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_min_level = min_level;

    // Re-init on the file already in use keeps the lines written so far this run
    if (log_file.is_open() && path == log_path) {
        return;
    }
    if (log_file.is_open()) {
        log_file.close();
    }
    log_path = path;
    log_file.open(path, std::ios::trunc);
    if (!log_file) {
        std::cerr << "halcyon: cannot open log file " << path << std::endl;
    }
}

void Logger::log(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < log_min_level) return;

    if (!log_file.is_open()) {
        // Fallback: open if not initialized
        log_path = default_path();
        log_file.open(log_path, std::ios::trunc);
    }
    if (!log_file) return;

    auto now = std::time(nullptr);
    auto tm = *std::localtime(&now);

    std::string_view level_str;
    switch (level) {
        case Level::Debug: level_str = "[DEBUG] "; break;
        case Level::Info:  level_str = "[INFO]  "; break;
        case Level::Warn:  level_str = "[WARN]  "; break;
        case Level::Error: level_str = "[ERROR] "; break;
    }

    log_file << std::put_time(&tm, "[%H:%M:%S] ");
    log_file << std::format("{}{}\n", level_str, message);
    log_file.flush();
}

void Logger::debug(const std::string& message) { log(Level::Debug, message); }
void Logger::info(const std::string& message) { log(Level::Info, message); }
void Logger::warn(const std::string& message) { log(Level::Warn, message); }
void Logger::error(const std::string& message) { log(Level::Error, message); }

Logger::Level Logger::parse_level(const std::string& name) {
    if (name == "debug") return Level::Debug;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error") return Level::Error;
    return Level::Info;
}

}  // namespace halcyon::util
