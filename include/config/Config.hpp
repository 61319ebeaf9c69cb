#pragma once

#include <string>
#include <unordered_map>
#include <filesystem>

namespace halcyon::config {

struct Config {
    // Volume settings
    int step_percent = 5;

    // Animation timing
    int ramp_ms = 250;
    int hold_ms = 2500;
    int quiet_window_ms = 100;

    // Pill geometry (pixels)
    float pill_padding = 16.0f;       // left + right
    float icon_overlap = 10.0f;
    float digit_advance = 9.0f;
    float percent_advance = 12.0f;
    float glyph_advance = 9.0f;

    // Icon glyphs (Nerd Font code points by default)
    std::string icon_muted = "\U000F075F";
    std::string icon_low = "\U000F057F";
    std::string icon_high = "\U000F057E";

    // UI settings
    std::string theme = "dark";
    std::unordered_map<std::string, std::string> theme_overrides;

    // External commands
    std::string mixer_command = "pavucontrol";

    // Logging
    std::string log_level = "info";
    std::string log_file = "/tmp/halcyon_debug.log";
};

class ConfigLoader {
public:
    static Config load_config();
    static Config load_from_file(const std::filesystem::path& path);
    static void save_config(const Config& cfg, const std::filesystem::path& path);

    static std::filesystem::path get_config_file();

private:
    static Config create_default_config();
    static void sanitize(Config& cfg);
};

}  // namespace halcyon::config
