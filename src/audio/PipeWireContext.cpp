#include "audio/PipeWireContext.hpp"
#include "util/Logger.hpp"
#include <pipewire/pipewire.h>

namespace halcyon::audio {

PipeWireContext::PipeWireContext() {
}

PipeWireContext::~PipeWireContext() {
    if (loop_) {
        pw_thread_loop_stop(loop_);
    }
    // Loop thread is gone; no lock needed from here on
    if (core_) {
        pw_core_disconnect(core_);
        core_ = nullptr;
    }
    if (context_) {
        pw_context_destroy(context_);
        context_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
    // Safe to leave initialized until process exit
    // pw_deinit();
}

bool PipeWireContext::init(const char* loop_name) {
    if (core_) return true; // Already initialized

    pw_init(nullptr, nullptr);
    loop_ = pw_thread_loop_new(loop_name, nullptr);
    if (!loop_) {
        util::Logger::error("PipeWireContext: Failed to create thread loop");
        return false;
    }

    context_ = pw_context_new(pw_thread_loop_get_loop(loop_), nullptr, 0);
    if (!context_) {
        util::Logger::error("PipeWireContext: Failed to create context");
        return false;
    }

    if (pw_thread_loop_start(loop_) < 0) {
        util::Logger::error("PipeWireContext: Failed to start thread loop");
        return false;
    }

    pw_thread_loop_lock(loop_);
    core_ = pw_context_connect(context_, nullptr, 0);
    pw_thread_loop_unlock(loop_);

    if (!core_) {
        util::Logger::error("PipeWireContext: Cannot connect to the PipeWire daemon");
        return false;
    }

    util::Logger::info("PipeWireContext: Connected (library " + std::string(pw_get_library_version()) + ")");
    return true;
}

void PipeWireContext::lock() {
    if (loop_) pw_thread_loop_lock(loop_);
}

void PipeWireContext::unlock() {
    if (loop_) pw_thread_loop_unlock(loop_);
}

} // namespace halcyon::audio
