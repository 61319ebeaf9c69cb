#include "audio/PipeWireAudioService.hpp"
#include "collectors/SinkCollector.hpp"
#include "config/Config.hpp"
#include "config/Theme.hpp"
#include "events/EventBus.hpp"
#include "ui/InputEvent.hpp"
#include "ui/widgets/VolumeInput.hpp"
#include "ui/widgets/VolumeWidget.hpp"
#include "util/Logger.hpp"
#include "util/ProcessLauncher.hpp"
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <poll.h>
#include <unistd.h>

using namespace std::chrono_literals;

// Global shutdown flag
static std::atomic<bool> g_shutdown{false};

// Signal handler for graceful shutdown (Ctrl+C, kill, etc.)
static void signal_handler(int) {
    g_shutdown.store(true);
}

namespace {

std::string format_status(const halcyon::model::Projection& p) {
    return std::format("{} {}|width={:.1f}|opacity={:.2f}|bg={}",
                       p.icon_text, p.label_text, p.pill_width, p.pill_opacity, p.icon_background);
}

// One stdin line -> one bus event; unknown commands are logged and dropped
std::optional<halcyon::events::Event::Type> parse_command(const std::string& line) {
    using Type = halcyon::events::Event::Type;
    if (line == "click 1") return Type::PrimaryClick;
    if (line == "click 3") return Type::SecondaryClick;
    if (line == "scroll up") return Type::ScrollUp;
    if (line == "scroll down") return Type::ScrollDown;
    if (line == "quit") return Type::Quit;
    return std::nullopt;
}

// Splits complete lines out of `buffer`, leaving any partial line behind
void drain_lines(std::string& buffer) {
    size_t pos;
    while ((pos = buffer.find('\n')) != std::string::npos) {
        std::string line = buffer.substr(0, pos);
        buffer.erase(0, pos + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        if (auto type = parse_command(line)) {
            halcyon::events::EventBus::instance().publish({*type, line});
        } else {
            halcyon::util::Logger::warn("Main: Unknown command '" + line + "'");
        }
    }
}

}  // namespace

int main() {
    try {
        // Initialize logger first so config warnings land in this run's log
        halcyon::util::Logger::init();
        halcyon::util::Logger::info("HALCYON starting...");

        // The config names the final log file and level
        auto config = halcyon::config::ConfigLoader::load_config();
        halcyon::util::Logger::init(config.log_file, halcyon::util::Logger::parse_level(config.log_level));
        halcyon::util::Logger::info("Configuration loaded from " +
                                    halcyon::config::ConfigLoader::get_config_file().string());

        auto theme = halcyon::config::ThemeManager::apply_overrides(
            halcyon::config::ThemeManager::get_theme(config.theme), config.theme_overrides);

        std::signal(SIGINT, signal_handler);   // Ctrl+C
        std::signal(SIGTERM, signal_handler);  // kill command

        halcyon::audio::PipeWireAudioService audio;
        if (!audio.connect()) {
            // Keep running: the widget shows an absent sink until restart
            halcyon::util::Logger::error("Main: PipeWire unavailable, running without a sink");
        }
        bool audio_connected = audio.is_connected();

        halcyon::ui::widgets::VolumeWidget widget(config, theme);
        halcyon::collectors::SinkCollector collector(audio, widget);
        halcyon::util::SpawnLauncher launcher;
        halcyon::ui::widgets::VolumeInput input(audio, launcher, config);

        // Freshest known volume for scroll steps; the widget's displayed value lags by the quiet window
        auto current_volume = [&audio, &widget]() {
            if (auto sink = audio.get_default_sink()) {
                if (auto snap = audio.last_snapshot(*sink)) {
                    return snap->volume_percent;
                }
            }
            return widget.state().displayed_volume;
        };

        // Setup EventBus handlers
        auto& event_bus = halcyon::events::EventBus::instance();
        using halcyon::events::Event;
        using halcyon::ui::InputEvent;

        event_bus.subscribe(Event::Type::PrimaryClick, [&](const Event&) {
            input.handle_input(InputEvent::click(InputEvent::Button::Primary), current_volume());
        });
        event_bus.subscribe(Event::Type::SecondaryClick, [&](const Event&) {
            input.handle_input(InputEvent::click(InputEvent::Button::Secondary), current_volume());
        });
        event_bus.subscribe(Event::Type::ScrollUp, [&](const Event&) {
            input.handle_input(InputEvent::wheel(halcyon::model::StepDirection::Increase), current_volume());
        });
        event_bus.subscribe(Event::Type::ScrollDown, [&](const Event&) {
            input.handle_input(InputEvent::wheel(halcyon::model::StepDirection::Decrease), current_volume());
        });
        event_bus.subscribe(Event::Type::Quit, [](const Event&) {
            halcyon::util::Logger::info("Main: Quit requested");
            g_shutdown.store(true);
        });
        event_bus.subscribe(Event::Type::LaunchFailed, [](const Event& evt) {
            halcyon::util::Logger::error("Main: " + evt.data);
            std::cerr << "halcyon: " << evt.data << std::endl;
        });
        event_bus.subscribe(Event::Type::SinkChanged, [](const Event& evt) {
            halcyon::util::Logger::info("Main: Sink changed to '" + evt.data + "'");
        });

        collector.start();
        audio.dispatch();

        std::string last_line;
        std::string input_buffer;
        bool stdin_open = true;
        auto last_tick = std::chrono::steady_clock::now();

        halcyon::util::Logger::info("Main: Entering main loop");

        while (!g_shutdown.load()) {
            // Deliver PipeWire notifications and launch results on this thread
            audio.dispatch();
            launcher.poll();

            if (audio_connected && !audio.is_connected()) {
                halcyon::util::Logger::error("Main: Lost connection to PipeWire");
                audio_connected = false;
            }

            auto now = std::chrono::steady_clock::now();
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_tick);
            // Keep the sub-millisecond remainder for the next tick
            last_tick += elapsed;

            auto projection = widget.tick(elapsed);
            std::string line = format_status(projection);
            if (line != last_line) {
                std::cout << line << std::endl;
                last_line = std::move(line);
            }

            // ~60Hz; stdin wakes us early
            struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
            int ret = poll(&pfd, stdin_open ? 1 : 0, 16);

            if (ret < 0) {
                if (errno == EINTR) {
                    halcyon::util::Logger::debug("Poll interrupted by signal (EINTR), continuing");
                    continue;
                }
                halcyon::util::Logger::error("Poll failed: " + std::string(std::strerror(errno)));
                break;
            }

            if (ret > 0 && (pfd.revents & (POLLIN | POLLHUP))) {
                char chunk[256];
                ssize_t n = read(STDIN_FILENO, chunk, sizeof(chunk));
                if (n > 0) {
                    input_buffer.append(chunk, static_cast<size_t>(n));
                    drain_lines(input_buffer);
                } else if (n == 0) {
                    // EOF: the panel went away
                    halcyon::util::Logger::info("Main: stdin closed, shutting down");
                    stdin_open = false;
                    g_shutdown.store(true);
                } else if (errno != EINTR) {
                    halcyon::util::Logger::error("Main: stdin read failed: " + std::string(std::strerror(errno)));
                    stdin_open = false;
                }
            }
        }

        // A change still inside the quiet window gets its final line
        widget.flush();
        std::string line = format_status(widget.projection());
        if (line != last_line) {
            std::cout << line << std::endl;
        }

        halcyon::util::Logger::info("HALCYON shutdown");
        return 0;
    } catch (const std::exception& e) {
        halcyon::util::Logger::error("Fatal error: " + std::string(e.what()));
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
