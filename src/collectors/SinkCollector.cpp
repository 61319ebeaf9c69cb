#include "collectors/SinkCollector.hpp"
#include "events/EventBus.hpp"
#include "util/Logger.hpp"

namespace halcyon::collectors {

SinkCollector::SinkCollector(audio::AudioService& service, ui::widgets::VolumeWidget& widget)
    : service_(service), widget_(widget) {
}

SinkCollector::~SinkCollector() {
    if (volume_subscription_) {
        service_.unobserve(*volume_subscription_);
    }
    if (device_subscription_) {
        service_.unobserve(*device_subscription_);
    }
}

void SinkCollector::start() {
    if (device_subscription_) return;  // Already following

    device_subscription_ = service_.on_default_sink_changed(
        [this](const std::optional<model::SinkHandle>& sink) { bind(sink); });

    bind(service_.get_default_sink());
}

void SinkCollector::bind(const std::optional<model::SinkHandle>& sink) {
    // GUARD: Same sink re-announced, keep the existing subscription
    if (bound_once_ && sink == sink_) {
        return;
    }
    bound_once_ = true;

    if (volume_subscription_) {
        service_.unobserve(*volume_subscription_);
        volume_subscription_.reset();
    }

    sink_ = sink;

    if (!sink_) {
        util::Logger::info("SinkCollector: No default sink, widget goes silent");
        widget_.observe(model::AudioSnapshot{0, true, std::nullopt});
        events::EventBus::instance().publish({events::Event::Type::SinkChanged, ""});
        return;
    }

    util::Logger::info("SinkCollector: Following sink " + sink_->name + " (id " +
                       std::to_string(sink_->id) + ")");
    volume_subscription_ = service_.observe_volume(*sink_,
        [this](const model::AudioSnapshot& snap) { widget_.observe(snap); });
    events::EventBus::instance().publish({events::Event::Type::SinkChanged, sink_->name});
}

}  // namespace halcyon::collectors
