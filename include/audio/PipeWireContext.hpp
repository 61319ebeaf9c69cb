#pragma once

struct pw_thread_loop;
struct pw_context;
struct pw_core;

namespace halcyon::audio {

/**
 * Owns the PipeWire thread loop and the connection to the daemon.
 * Every call into a proxy created from get_core() must hold the loop lock.
 */
class PipeWireContext {
public:
    PipeWireContext();
    ~PipeWireContext();

    PipeWireContext(const PipeWireContext&) = delete;
    PipeWireContext& operator=(const PipeWireContext&) = delete;

    [[nodiscard]] bool init(const char* loop_name = "halcyon-audio");

    struct pw_thread_loop* get_loop() const { return loop_; }
    struct pw_core* get_core() const { return core_; }

    void lock();
    void unlock();

    // Scoped loop lock
    class Guard {
    public:
        explicit Guard(PipeWireContext& ctx) : ctx_(ctx) { ctx_.lock(); }
        ~Guard() { ctx_.unlock(); }
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
    private:
        PipeWireContext& ctx_;
    };

private:
    struct pw_thread_loop* loop_ = nullptr;
    struct pw_context* context_ = nullptr;
    struct pw_core* core_ = nullptr;
};

} // namespace halcyon::audio
