#include "../framework/SimpleTest.hpp"
#include "config/Config.hpp"
#include "config/Theme.hpp"
#include "util/Logger.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <unistd.h>

using namespace halcyon::config;
using halcyon::util::Logger;

namespace {

std::filesystem::path temp_config(const std::string& tag) {
    return std::filesystem::temp_directory_path() /
           ("halcyon_test_" + tag + "_" + std::to_string(::getpid()) + ".toml");
}

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream f(path);
    f << content;
}

}  // namespace

TEST_CASE(test_config_defaults) {
    Config cfg;
    ASSERT_EQ(cfg.step_percent, 5);
    ASSERT_EQ(cfg.ramp_ms, 250);
    ASSERT_EQ(cfg.hold_ms, 2500);
    ASSERT_EQ(cfg.quiet_window_ms, 100);
    ASSERT_EQ(cfg.mixer_command, "pavucontrol");
    ASSERT_EQ(cfg.theme, "dark");
}

TEST_CASE(test_config_file_overrides_defaults) {
    auto path = temp_config("override");
    write_file(path,
        "# comment\n"
        "[volume]\n"
        "step = 10\n"
        "\n"
        "[animation]\n"
        "ramp_ms = 150\n"
        "hold_ms = 1000\n"
        "quiet_window_ms = 50\n"
        "[pill]\n"
        "padding = 20.5\n"
        "[icons]\n"
        "muted = \"M\"\n"
        "[ui]\n"
        "theme = \"light\"\n"
        "[theme]\n"
        "foreground = \"#ffffff\"\n"
        "[commands]\n"
        "mixer = \"pwvucontrol\"\n"
        "[log]\n"
        "level = \"debug\"\n");

    Config cfg = ConfigLoader::load_from_file(path);
    std::filesystem::remove(path);

    ASSERT_EQ(cfg.step_percent, 10);
    ASSERT_EQ(cfg.ramp_ms, 150);
    ASSERT_EQ(cfg.hold_ms, 1000);
    ASSERT_EQ(cfg.quiet_window_ms, 50);
    ASSERT_NEAR(cfg.pill_padding, 20.5f, 0.001f);
    ASSERT_EQ(cfg.icon_muted, "M");
    ASSERT_EQ(cfg.icon_low, Config{}.icon_low);
    ASSERT_EQ(cfg.theme, "light");
    ASSERT_EQ(cfg.theme_overrides.at("foreground"), "#ffffff");
    ASSERT_EQ(cfg.mixer_command, "pwvucontrol");
    ASSERT_EQ(cfg.log_level, "debug");
}

TEST_CASE(test_config_malformed_values_keep_defaults) {
    auto path = temp_config("malformed");
    write_file(path,
        "[volume]\n"
        "step = lots\n"
        "[animation]\n"
        "ramp_ms = fast\n"
        "hold_ms = -40\n"
        "this line has no equals sign\n"
        "[pill]\n"
        "icon_overlap = wide\n");

    Config cfg = ConfigLoader::load_from_file(path);
    std::filesystem::remove(path);

    ASSERT_EQ(cfg.step_percent, 5);
    ASSERT_EQ(cfg.ramp_ms, 250);
    ASSERT_EQ(cfg.hold_ms, 0);  // negative durations are clamped
    ASSERT_NEAR(cfg.icon_overlap, 10.0f, 0.001f);
}

TEST_CASE(test_config_step_out_of_range) {
    auto path = temp_config("step");
    write_file(path, "[volume]\nstep = 250\n");
    Config cfg = ConfigLoader::load_from_file(path);
    std::filesystem::remove(path);
    ASSERT_EQ(cfg.step_percent, 5);
}

TEST_CASE(test_config_missing_file_gives_defaults) {
    Config cfg = ConfigLoader::load_from_file("/nonexistent/halcyon/config.toml");
    ASSERT_EQ(cfg.hold_ms, 2500);
}

TEST_CASE(test_config_save_then_load) {
    auto path = temp_config("save");
    Config out;
    out.step_percent = 7;
    out.hold_ms = 1800;
    out.mixer_command = "kitty -e pulsemixer";
    out.theme_overrides["icon_background"] = "#123456";
    ConfigLoader::save_config(out, path);

    Config in = ConfigLoader::load_from_file(path);
    std::filesystem::remove(path);

    ASSERT_EQ(in.step_percent, 7);
    ASSERT_EQ(in.hold_ms, 1800);
    ASSERT_EQ(in.mixer_command, "kitty -e pulsemixer");
    ASSERT_EQ(in.icon_high, out.icon_high);
    ASSERT_EQ(in.theme_overrides.at("icon_background"), "#123456");
}

// ===== Themes =====

TEST_CASE(test_theme_builtin_and_fallback) {
    Theme dark = ThemeManager::get_theme("dark");
    Theme light = ThemeManager::get_theme("light");
    ASSERT_EQ(dark.name, "dark");
    ASSERT_EQ(light.name, "light");
    ASSERT_TRUE(dark.icon_background != light.icon_background);

    Theme unknown = ThemeManager::get_theme("solarized-neon");
    ASSERT_EQ(unknown.name, "dark");
}

TEST_CASE(test_theme_overrides_and_registration) {
    Theme theme = ThemeManager::apply_overrides(ThemeManager::get_theme("dark"),
                                                {{"icon_background_muted", "#000000"}, {"bogus", "#111111"}});
    ASSERT_EQ(theme.icon_background_muted, "#000000");
    ASSERT_EQ(theme.icon_background, ThemeManager::get_theme("dark").icon_background);

    ThemeManager::register_theme("mono", {"mono", "#ffffff", "#888888", "#000000", "#ffffff"});
    ASSERT_EQ(ThemeManager::get_theme("mono").icon_background_muted, "#888888");
}

// ===== Logger =====

TEST_CASE(test_logger_parse_level) {
    ASSERT_TRUE(Logger::parse_level("debug") == Logger::Level::Debug);
    ASSERT_TRUE(Logger::parse_level("warning") == Logger::Level::Warn);
    ASSERT_TRUE(Logger::parse_level("error") == Logger::Level::Error);
    ASSERT_TRUE(Logger::parse_level("chatty") == Logger::Level::Info);
}

TEST_CASE(test_logger_reinit_keeps_config_warnings) {
    auto log_path = std::filesystem::temp_directory_path() /
                    ("halcyon_test_log_" + std::to_string(::getpid()) + ".log");
    auto config_path = temp_config("logged");
    write_file(config_path, "[animation]\nramp_ms = banana\n");

    // Startup order: default logger, config load, then the configured logger
    Logger::init(log_path.string(), Logger::Level::Debug);
    Config cfg = ConfigLoader::load_from_file(config_path);
    Logger::init(log_path.string(), Logger::parse_level("info"));
    Logger::info("after re-init");
    std::filesystem::remove(config_path);

    std::ifstream in(log_path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    std::filesystem::remove(log_path);
    Logger::init(Logger::default_path(), Logger::Level::Debug);

    ASSERT_EQ(cfg.ramp_ms, 250);
    ASSERT_TRUE(content.find("[WARN]  Config: Invalid integer for 'ramp_ms': banana") != std::string::npos);
    ASSERT_TRUE(content.find("after re-init") != std::string::npos);
    ASSERT_TRUE(content.find("Invalid integer") < content.find("after re-init"));
}

TEST_CASE(test_logger_reinit_filters_by_new_level) {
    auto log_path = std::filesystem::temp_directory_path() /
                    ("halcyon_test_level_" + std::to_string(::getpid()) + ".log");
    Logger::init(log_path.string(), Logger::Level::Debug);
    Logger::debug("kept debug line");
    Logger::init(log_path.string(), Logger::Level::Warn);
    Logger::info("dropped info line");

    std::ifstream in(log_path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    std::filesystem::remove(log_path);
    Logger::init(Logger::default_path(), Logger::Level::Debug);

    ASSERT_TRUE(content.find("kept debug line") != std::string::npos);
    ASSERT_TRUE(content.find("dropped info line") == std::string::npos);
}

int main(int argc, char** argv) {
    return halcyon::test::TestRunner::instance().run_all(argc, argv);
}
