#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <vector>
#include <string>
#include <mutex>

namespace halcyon::events {

struct Event {
    enum class Type {
        // Pointer input routed from the host
        PrimaryClick,
        SecondaryClick,
        ScrollUp,
        ScrollDown,
        Quit,

        // Notifications for the host
        SinkChanged,
        LaunchFailed,
    };
    Type type;
    std::string data;         // Sink name, failure message, ...
};

const char* to_string(Event::Type type);

class EventBus {
public:
    using Handler = std::function<void(const Event&)>;
    using SubscriptionId = uint64_t;

    static EventBus& instance() {
        static EventBus instance;
        return instance;
    }

    SubscriptionId subscribe(Event::Type type, Handler handler);
    void unsubscribe(SubscriptionId id);
    void publish(const Event& event);

private:
    EventBus() = default;

    struct Subscriber {
        SubscriptionId id;
        Handler handler;
    };

    std::map<Event::Type, std::vector<Subscriber>> subscribers_;
    SubscriptionId next_id_ = 1;
    std::mutex mutex_;
};

}  // namespace halcyon::events
