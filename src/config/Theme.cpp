#include "config/Theme.hpp"
#include "util/Logger.hpp"

namespace halcyon::config {

// Define the static member
std::unordered_map<std::string, Theme> ThemeManager::themes_;

void ThemeManager::init_default_themes() {
    themes_["dark"] = {
        "dark",
        "#89b4fa",    // icon_background
        "#f38ba8",    // icon_background_muted
        "#313244",    // pill_background
        "#cdd6f4"     // foreground
    };
    themes_["light"] = {
        "light",
        "#1e66f5",
        "#d20f39",
        "#ccd0da",
        "#4c4f69"
    };
}

Theme ThemeManager::get_theme(const std::string& name) {
    // Initialize themes on first call
    if (themes_.empty()) {
        init_default_themes();
    }

    auto it = themes_.find(name);
    if (it != themes_.end()) {
        return it->second;
    }
    util::Logger::warn("ThemeManager: Unknown theme '" + name + "', falling back to dark");
    return themes_["dark"];
}

void ThemeManager::register_theme(const std::string& name, const Theme& theme) {
    if (themes_.empty()) {
        init_default_themes();
    }
    themes_[name] = theme;
}

Theme ThemeManager::apply_overrides(Theme theme, const std::unordered_map<std::string, std::string>& overrides) {
    for (const auto& [key, value] : overrides) {
        if (key == "icon_background") theme.icon_background = value;
        else if (key == "icon_background_muted") theme.icon_background_muted = value;
        else if (key == "pill_background") theme.pill_background = value;
        else if (key == "foreground") theme.foreground = value;
        else util::Logger::warn("ThemeManager: Unknown color key '" + key + "'");
    }
    return theme;
}

}  // namespace halcyon::config
