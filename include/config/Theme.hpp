#pragma once

#include <string>
#include <unordered_map>

namespace halcyon::config {

// Colors are "#rrggbb" strings handed through to the host untouched
struct Theme {
    std::string name;
    std::string icon_background;
    std::string icon_background_muted;
    std::string pill_background;
    std::string foreground;

    const std::string& icon_background_for(bool silent) const {
        return silent ? icon_background_muted : icon_background;
    }
};

class ThemeManager {
public:
    // Unknown names fall back to "dark"
    static Theme get_theme(const std::string& name);
    static void register_theme(const std::string& name, const Theme& theme);

    // Replace individual colors by key (icon_background, icon_background_muted, ...)
    static Theme apply_overrides(Theme theme, const std::unordered_map<std::string, std::string>& overrides);

private:
    static std::unordered_map<std::string, Theme> themes_;
    static void init_default_themes();
};

}  // namespace halcyon::config
