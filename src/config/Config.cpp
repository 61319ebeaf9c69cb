#include "config/Config.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <string>

namespace halcyon::config {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

void parse_int(const std::string& key, const std::string& value, int& out) {
    try {
        out = std::stoi(value);
    } catch (const std::exception&) {
        util::Logger::warn("Config: Invalid integer for '" + key + "': " + value + " (keeping " +
                           std::to_string(out) + ")");
    }
}

void parse_float(const std::string& key, const std::string& value, float& out) {
    try {
        out = std::stof(value);
    } catch (const std::exception&) {
        util::Logger::warn("Config: Invalid number for '" + key + "': " + value + " (keeping " +
                           std::to_string(out) + ")");
    }
}

}  // namespace

Config ConfigLoader::load_config() {
    util::Logger::info("Config: Loading configuration");

    auto config_file = get_config_file();
    if (std::filesystem::exists(config_file)) {
        return load_from_file(config_file);
    }

    util::Logger::info("Config: No config at " + config_file.string() + ", writing defaults");
    Config cfg = create_default_config();
    save_config(cfg, config_file);
    return cfg;
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    util::Logger::debug("Config: Loading from " + path.string());

    Config cfg = create_default_config();

    std::ifstream file(path);
    if (!file) {
        util::Logger::warn("Config: Cannot open " + path.string() + ", using defaults");
        return cfg;
    }

    std::string line, current_section;
    while (std::getline(file, line)) {
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        // Key = value
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            util::Logger::warn("Config: Ignoring malformed line: " + line);
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes from strings
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        // Parse based on section
        if (current_section == "volume") {
            if (key == "step") parse_int(key, value, cfg.step_percent);
        }
        else if (current_section == "animation") {
            if (key == "ramp_ms") parse_int(key, value, cfg.ramp_ms);
            else if (key == "hold_ms") parse_int(key, value, cfg.hold_ms);
            else if (key == "quiet_window_ms") parse_int(key, value, cfg.quiet_window_ms);
        }
        else if (current_section == "pill") {
            if (key == "padding") parse_float(key, value, cfg.pill_padding);
            else if (key == "icon_overlap") parse_float(key, value, cfg.icon_overlap);
            else if (key == "digit_advance") parse_float(key, value, cfg.digit_advance);
            else if (key == "percent_advance") parse_float(key, value, cfg.percent_advance);
            else if (key == "glyph_advance") parse_float(key, value, cfg.glyph_advance);
        }
        else if (current_section == "icons") {
            if (key == "muted") cfg.icon_muted = value;
            else if (key == "low") cfg.icon_low = value;
            else if (key == "high") cfg.icon_high = value;
        }
        else if (current_section == "ui") {
            if (key == "theme") cfg.theme = value;
        }
        else if (current_section == "theme") {
            cfg.theme_overrides[key] = value;
        }
        else if (current_section == "commands") {
            if (key == "mixer") cfg.mixer_command = value;
        }
        else if (current_section == "log") {
            if (key == "level") cfg.log_level = value;
            else if (key == "file") cfg.log_file = value;
        }
    }

    sanitize(cfg);
    return cfg;
}

void ConfigLoader::save_config(const Config& cfg, const std::filesystem::path& path) {
    util::Logger::info("Config: Saving configuration to " + path.string());

    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        util::Logger::warn("Config: Cannot create " + path.parent_path().string() + ": " + ec.message());
        return;
    }

    std::ofstream file(path);
    if (!file) {
        util::Logger::warn("Config: Cannot write " + path.string());
        return;
    }

    file << "# HALCYON Config\n";
    file << "# Generated on first run; edit with care\n\n";

    file << "[volume]\n";
    file << "# Percentage added or removed per scroll step\n";
    file << "step = " << cfg.step_percent << "\n\n";

    file << "[animation]\n";
    file << "# Pill grow/shrink duration\n";
    file << "ramp_ms = " << cfg.ramp_ms << "\n";
    file << "# How long the pill stays fully open after a change\n";
    file << "hold_ms = " << cfg.hold_ms << "\n";
    file << "# Changes closer together than this collapse into one animation\n";
    file << "quiet_window_ms = " << cfg.quiet_window_ms << "\n\n";

    file << "[pill]\n";
    file << "padding = " << cfg.pill_padding << "\n";
    file << "icon_overlap = " << cfg.icon_overlap << "\n";
    file << "# Label font advances in pixels\n";
    file << "digit_advance = " << cfg.digit_advance << "\n";
    file << "percent_advance = " << cfg.percent_advance << "\n";
    file << "glyph_advance = " << cfg.glyph_advance << "\n\n";

    file << "[icons]\n";
    file << "muted = \"" << cfg.icon_muted << "\"\n";
    file << "low = \"" << cfg.icon_low << "\"\n";
    file << "high = \"" << cfg.icon_high << "\"\n\n";

    file << "[ui]\n";
    file << "# Theme: \"dark\", \"light\"\n";
    file << "theme = \"" << cfg.theme << "\"\n\n";

    file << "[theme]\n";
    file << "# Per-color overrides: icon_background, icon_background_muted, pill_background, foreground\n";
    for (const auto& [key, value] : cfg.theme_overrides) {
        file << key << " = \"" << value << "\"\n";
    }
    file << "\n";

    file << "[commands]\n";
    file << "# Launched on right click\n";
    file << "mixer = \"" << cfg.mixer_command << "\"\n\n";

    file << "[log]\n";
    file << "# Level: \"debug\", \"info\", \"warn\", \"error\"\n";
    file << "level = \"" << cfg.log_level << "\"\n";
    file << "file = \"" << cfg.log_file << "\"\n";
}

std::filesystem::path ConfigLoader::get_config_file() {
    return util::Platform::get_config_directory() / "config.toml";
}

Config ConfigLoader::create_default_config() {
    return Config{};
}

void ConfigLoader::sanitize(Config& cfg) {
    auto clamp_non_negative = [](const char* name, int& value) {
        if (value < 0) {
            util::Logger::warn(std::string("Config: ") + name + " cannot be negative, using 0");
            value = 0;
        }
    };
    clamp_non_negative("ramp_ms", cfg.ramp_ms);
    clamp_non_negative("hold_ms", cfg.hold_ms);
    clamp_non_negative("quiet_window_ms", cfg.quiet_window_ms);

    if (cfg.step_percent < 1 || cfg.step_percent > 100) {
        util::Logger::warn("Config: step " + std::to_string(cfg.step_percent) + " out of range, using 5");
        cfg.step_percent = 5;
    }
}

}  // namespace halcyon::config
