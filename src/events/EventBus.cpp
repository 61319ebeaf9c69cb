#include "events/EventBus.hpp"
#include "util/Logger.hpp"
#include <algorithm>

namespace halcyon::events {

const char* to_string(Event::Type type) {
    switch (type) {
        case Event::Type::PrimaryClick:   return "PrimaryClick";
        case Event::Type::SecondaryClick: return "SecondaryClick";
        case Event::Type::ScrollUp:       return "ScrollUp";
        case Event::Type::ScrollDown:     return "ScrollDown";
        case Event::Type::Quit:           return "Quit";
        case Event::Type::SinkChanged:    return "SinkChanged";
        case Event::Type::LaunchFailed:   return "LaunchFailed";
    }
    return "Unknown";
}

EventBus::SubscriptionId EventBus::subscribe(Event::Type type, Handler handler) {
    util::Logger::debug(std::string("EventBus: Subscribing to ") + to_string(type));

    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    subscribers_[type].push_back({id, std::move(handler)});
    return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [type, subs] : subscribers_) {
        subs.erase(std::remove_if(subs.begin(), subs.end(),
                                  [id](const Subscriber& s) { return s.id == id; }),
                   subs.end());
    }
}

void EventBus::publish(const Event& event) {
    util::Logger::debug(std::string("EventBus: Publishing ") + to_string(event.type) +
                        (event.data.empty() ? "" : " (" + event.data + ")"));

    // Copy handlers to avoid holding lock during execution
    std::vector<Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(event.type);
        if (it != subscribers_.end()) {
            for (const auto& sub : it->second) {
                handlers.push_back(sub.handler);
            }
        }
    }

    for (const auto& handler : handlers) {
        handler(event);
    }
}

}  // namespace halcyon::events
