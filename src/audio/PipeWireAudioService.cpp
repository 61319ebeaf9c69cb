#include "audio/PipeWireAudioService.hpp"
#include "audio/PipeWireContext.hpp"
#include "util/Logger.hpp"
#include <pipewire/pipewire.h>
#include <pipewire/extensions/metadata.h>
#include <spa/param/props.h>
#include <spa/param/audio/raw.h>
#include <spa/pod/builder.h>
#include <spa/pod/iter.h>
#include <spa/utils/dict.h>
#include <spa/utils/result.h>
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <deque>
#include <map>
#include <mutex>

namespace halcyon::audio {

namespace {

constexpr const char* DEFAULT_SINK_KEY = "default.audio.sink";
constexpr const char* SINK_MEDIA_CLASS = "Audio/Sink";

}  // namespace

struct PipeWireAudioService::Impl {
    struct BoundSink {
        Impl* impl = nullptr;
        model::SinkHandle handle;
        struct pw_node* node = nullptr;
        struct spa_hook listener{};

        // Last Props seen; volume stays unknown until channelVolumes arrives
        uint32_t channels = 2;
        std::optional<float> linear_volume;
        bool muted = false;
    };

    struct Notification {
        enum class Kind { Snapshot, SinkChanged };
        Kind kind;
        std::optional<model::SinkHandle> sink;
        model::AudioSnapshot snapshot;
    };

    struct VolumeObserver {
        std::string sink_name;
        SnapshotCallback callback;
    };

    PipeWireContext context;
    std::atomic<bool> connected{false};

    // ===== Loop-thread state (guarded by the PipeWire loop lock) =====
    struct pw_registry* registry = nullptr;
    struct spa_hook registry_listener{};
    struct spa_hook core_listener{};
    struct pw_metadata* metadata = nullptr;
    struct spa_hook metadata_listener{};
    uint32_t metadata_id = SPA_ID_INVALID;
    std::map<uint32_t, std::unique_ptr<BoundSink>> sinks;
    std::string default_sink_name;

    // ===== Shared with the main thread (guarded by mutex) =====
    mutable std::mutex mutex;
    std::optional<model::SinkHandle> default_sink;
    std::map<std::string, model::AudioSnapshot> snapshots;  // by sink name
    std::deque<Notification> queue;

    // ===== Main-thread only =====
    std::map<SubscriptionId, VolumeObserver> volume_observers;
    std::map<SubscriptionId, SinkChangedCallback> device_observers;
    SubscriptionId next_id = 1;

    ~Impl();

    void bind_sink(uint32_t id, const std::string& name);
    void bind_metadata(uint32_t id);
    void remove_global(uint32_t id);
    void publish_default();
    void publish_snapshot(const BoundSink& sink);
    BoundSink* find_sink(const model::SinkHandle& handle);
    bool send_props(const model::SinkHandle& handle, const std::optional<int>& percent,
                    const std::optional<bool>& muted);
};

// ============================================================================
// PipeWire callbacks (loop thread)
// ============================================================================

static void on_core_error(void* data, uint32_t id, int seq, int res, const char* message) {
    auto* impl = static_cast<PipeWireAudioService::Impl*>(data);
    (void)seq;
    util::Logger::error("PipeWireAudioService: Core error on id " + std::to_string(id) + ": " +
                        std::string(message ? message : spa_strerror(res)));
    if (id == PW_ID_CORE && res == -EPIPE) {
        impl->connected.store(false);
    }
}

static const struct pw_core_events core_events = {
    .version = PW_VERSION_CORE_EVENTS,
    .info = nullptr,
    .done = nullptr,
    .ping = nullptr,
    .error = on_core_error,
};

static void on_node_param(void* data, int seq, uint32_t id, uint32_t index, uint32_t next,
                          const struct spa_pod* param) {
    (void)seq;
    (void)index;
    (void)next;
    auto* sink = static_cast<PipeWireAudioService::Impl::BoundSink*>(data);

    if (id != SPA_PARAM_Props || !param || !spa_pod_is_object_type(param, SPA_TYPE_OBJECT_Props)) {
        return;
    }

    bool touched = false;
    const auto* obj = reinterpret_cast<const struct spa_pod_object*>(param);
    const struct spa_pod_prop* prop;
    SPA_POD_OBJECT_FOREACH(obj, prop) {
        switch (prop->key) {
            case SPA_PROP_mute: {
                bool muted = false;
                if (spa_pod_get_bool(&prop->value, &muted) == 0) {
                    sink->muted = muted;
                    touched = true;
                }
                break;
            }
            case SPA_PROP_channelVolumes: {
                float volumes[SPA_AUDIO_MAX_CHANNELS];
                uint32_t n = spa_pod_copy_array(&prop->value, SPA_TYPE_Float, volumes, SPA_AUDIO_MAX_CHANNELS);
                if (n > 0) {
                    // Mixers show the loudest channel
                    sink->linear_volume = *std::max_element(volumes, volumes + n);
                    sink->channels = n;
                    touched = true;
                }
                break;
            }
            default:
                break;
        }
    }

    if (touched && sink->linear_volume) {
        sink->impl->publish_snapshot(*sink);
    }
}

static const struct pw_node_events node_events = {
    .version = PW_VERSION_NODE_EVENTS,
    .info = nullptr,
    .param = on_node_param,
};

static int on_metadata_property(void* data, uint32_t subject, const char* key, const char* type,
                                const char* value) {
    (void)type;
    auto* impl = static_cast<PipeWireAudioService::Impl*>(data);
    if (subject != PW_ID_CORE) return 0;

    // key == nullptr: every property of the subject was removed
    if (key == nullptr || std::strcmp(key, DEFAULT_SINK_KEY) == 0) {
        impl->default_sink_name = (key && value) ? PipeWireAudioService::parse_metadata_name(value) : "";
        util::Logger::info("PipeWireAudioService: Default sink is now '" + impl->default_sink_name + "'");
        impl->publish_default();
    }
    return 0;
}

static const struct pw_metadata_events metadata_events = {
    .version = PW_VERSION_METADATA_EVENTS,
    .property = on_metadata_property,
};

static void on_registry_global(void* data, uint32_t id, uint32_t permissions, const char* type,
                               uint32_t version, const struct spa_dict* props) {
    (void)permissions;
    (void)version;
    auto* impl = static_cast<PipeWireAudioService::Impl*>(data);
    if (!props) return;

    if (std::strcmp(type, PW_TYPE_INTERFACE_Node) == 0) {
        const char* media_class = spa_dict_lookup(props, PW_KEY_MEDIA_CLASS);
        if (!media_class || std::strcmp(media_class, SINK_MEDIA_CLASS) != 0) return;

        const char* name = spa_dict_lookup(props, PW_KEY_NODE_NAME);
        impl->bind_sink(id, name ? name : "");
    } else if (std::strcmp(type, PW_TYPE_INTERFACE_Metadata) == 0) {
        const char* name = spa_dict_lookup(props, PW_KEY_METADATA_NAME);
        if (name && std::strcmp(name, "default") == 0) {
            impl->bind_metadata(id);
        }
    }
}

static void on_registry_global_remove(void* data, uint32_t id) {
    static_cast<PipeWireAudioService::Impl*>(data)->remove_global(id);
}

static const struct pw_registry_events registry_events = {
    .version = PW_VERSION_REGISTRY_EVENTS,
    .global = on_registry_global,
    .global_remove = on_registry_global_remove,
};

// ============================================================================
// Impl (loop thread unless noted)
// ============================================================================

PipeWireAudioService::Impl::~Impl() {
    if (!context.get_loop()) return;

    // CRITICAL: proxies must go before the core disconnects in ~PipeWireContext
    PipeWireContext::Guard guard(context);
    for (auto& [id, sink] : sinks) {
        spa_hook_remove(&sink->listener);
        pw_proxy_destroy(reinterpret_cast<struct pw_proxy*>(sink->node));
    }
    sinks.clear();
    if (metadata) {
        spa_hook_remove(&metadata_listener);
        pw_proxy_destroy(reinterpret_cast<struct pw_proxy*>(metadata));
        metadata = nullptr;
    }
    if (registry) {
        spa_hook_remove(&registry_listener);
        pw_proxy_destroy(reinterpret_cast<struct pw_proxy*>(registry));
        registry = nullptr;
    }
    if (context.get_core()) {
        spa_hook_remove(&core_listener);
    }
}

void PipeWireAudioService::Impl::bind_sink(uint32_t id, const std::string& name) {
    auto sink = std::make_unique<BoundSink>();
    sink->impl = this;
    sink->handle = {id, name};
    sink->node = static_cast<struct pw_node*>(
        pw_registry_bind(registry, id, PW_TYPE_INTERFACE_Node, PW_VERSION_NODE, 0));
    if (!sink->node) {
        util::Logger::error("PipeWireAudioService: Failed to bind sink node " + std::to_string(id));
        return;
    }

    pw_node_add_listener(sink->node, &sink->listener, &node_events, sink.get());
    uint32_t params[] = {SPA_PARAM_Props};
    pw_node_subscribe_params(sink->node, params, 1);

    util::Logger::debug("PipeWireAudioService: Bound sink " + name + " (id " + std::to_string(id) + ")");
    sinks[id] = std::move(sink);

    if (name == default_sink_name) {
        publish_default();
    }
}

void PipeWireAudioService::Impl::bind_metadata(uint32_t id) {
    if (metadata) return;  // Only one "default" metadata object matters

    metadata = static_cast<struct pw_metadata*>(
        pw_registry_bind(registry, id, PW_TYPE_INTERFACE_Metadata, PW_VERSION_METADATA, 0));
    if (!metadata) {
        util::Logger::error("PipeWireAudioService: Failed to bind default metadata");
        return;
    }
    metadata_id = id;
    pw_metadata_add_listener(metadata, &metadata_listener, &metadata_events, this);
    util::Logger::debug("PipeWireAudioService: Bound default metadata (id " + std::to_string(id) + ")");
}

void PipeWireAudioService::Impl::remove_global(uint32_t id) {
    if (id == metadata_id && metadata) {
        spa_hook_remove(&metadata_listener);
        pw_proxy_destroy(reinterpret_cast<struct pw_proxy*>(metadata));
        metadata = nullptr;
        metadata_id = SPA_ID_INVALID;
        util::Logger::warn("PipeWireAudioService: Default metadata removed");
        return;
    }

    auto it = sinks.find(id);
    if (it == sinks.end()) return;

    std::string name = it->second->handle.name;
    spa_hook_remove(&it->second->listener);
    pw_proxy_destroy(reinterpret_cast<struct pw_proxy*>(it->second->node));
    sinks.erase(it);
    util::Logger::info("PipeWireAudioService: Sink removed: " + name);

    {
        std::lock_guard<std::mutex> lock(mutex);
        snapshots.erase(name);
    }
    if (name == default_sink_name) {
        publish_default();
    }
}

void PipeWireAudioService::Impl::publish_default() {
    std::optional<model::SinkHandle> handle;
    for (const auto& [id, sink] : sinks) {
        if (!default_sink_name.empty() && sink->handle.name == default_sink_name) {
            handle = sink->handle;
            break;
        }
    }

    std::lock_guard<std::mutex> lock(mutex);
    if (handle == default_sink) return;
    default_sink = handle;
    queue.push_back({Notification::Kind::SinkChanged, handle, {}});
}

void PipeWireAudioService::Impl::publish_snapshot(const BoundSink& sink) {
    model::AudioSnapshot snap;
    snap.volume_percent = linear_to_percent(*sink.linear_volume);
    snap.muted = sink.muted;
    snap.sink_id = sink.handle.name;

    std::lock_guard<std::mutex> lock(mutex);
    auto it = snapshots.find(sink.handle.name);
    // GUARD: Props also fire for unrelated properties; only queue real changes
    if (it != snapshots.end() && it->second == snap) return;
    snapshots[sink.handle.name] = snap;
    queue.push_back({Notification::Kind::Snapshot, sink.handle, snap});
}

PipeWireAudioService::Impl::BoundSink* PipeWireAudioService::Impl::find_sink(const model::SinkHandle& handle) {
    auto it = sinks.find(handle.id);
    if (it == sinks.end() || it->second->handle.name != handle.name) {
        return nullptr;
    }
    return it->second.get();
}

// Called from the main thread
bool PipeWireAudioService::Impl::send_props(const model::SinkHandle& handle,
                                            const std::optional<int>& percent,
                                            const std::optional<bool>& muted) {
    if (!connected.load()) return false;

    PipeWireContext::Guard guard(context);
    BoundSink* sink = find_sink(handle);
    if (!sink || !sink->node) {
        util::Logger::warn("PipeWireAudioService: Sink " + handle.name + " is gone");
        return false;
    }

    uint8_t buffer[1024];
    struct spa_pod_builder builder = SPA_POD_BUILDER_INIT(buffer, sizeof(buffer));
    struct spa_pod_frame frame;
    spa_pod_builder_push_object(&builder, &frame, SPA_TYPE_OBJECT_Props, SPA_PARAM_Props);

    if (percent) {
        float volumes[SPA_AUDIO_MAX_CHANNELS];
        uint32_t n = std::clamp<uint32_t>(sink->channels, 1, SPA_AUDIO_MAX_CHANNELS);
        std::fill(volumes, volumes + n, percent_to_linear(*percent));
        spa_pod_builder_prop(&builder, SPA_PROP_channelVolumes, 0);
        spa_pod_builder_array(&builder, sizeof(float), SPA_TYPE_Float, n, volumes);
    }
    if (muted) {
        spa_pod_builder_prop(&builder, SPA_PROP_mute, 0);
        spa_pod_builder_bool(&builder, *muted);
    }

    auto* pod = static_cast<struct spa_pod*>(spa_pod_builder_pop(&builder, &frame));
    int res = pw_node_set_param(sink->node, SPA_PARAM_Props, 0, pod);
    if (res < 0) {
        util::Logger::error("PipeWireAudioService: set_param failed on " + handle.name + ": " +
                            spa_strerror(res));
        return false;
    }
    return true;
}

// ============================================================================
// Public API (main thread)
// ============================================================================

PipeWireAudioService::PipeWireAudioService() : impl_(std::make_unique<Impl>()) {
    util::Logger::debug("PipeWireAudioService: Created instance");
}

PipeWireAudioService::~PipeWireAudioService() {
    util::Logger::debug("PipeWireAudioService: Destroying instance");
}

bool PipeWireAudioService::connect() {
    if (impl_->connected.load()) return true;

    util::Logger::info("PipeWireAudioService: Connecting to PipeWire");
    if (!impl_->context.init()) {
        return false;
    }

    PipeWireContext::Guard guard(impl_->context);
    pw_core_add_listener(impl_->context.get_core(), &impl_->core_listener, &core_events, impl_.get());

    impl_->registry = pw_core_get_registry(impl_->context.get_core(), PW_VERSION_REGISTRY, 0);
    if (!impl_->registry) {
        util::Logger::error("PipeWireAudioService: Failed to get registry");
        return false;
    }
    pw_registry_add_listener(impl_->registry, &impl_->registry_listener, &registry_events, impl_.get());

    impl_->connected.store(true);
    return true;
}

bool PipeWireAudioService::is_connected() const {
    return impl_->connected.load();
}

size_t PipeWireAudioService::dispatch() {
    std::deque<Impl::Notification> ready;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        ready.swap(impl_->queue);
    }

    for (const auto& note : ready) {
        if (note.kind == Impl::Notification::Kind::SinkChanged) {
            // Copy: callbacks may subscribe or unsubscribe
            auto observers = impl_->device_observers;
            for (const auto& [id, callback] : observers) {
                callback(note.sink);
            }
        } else {
            auto observers = impl_->volume_observers;
            for (const auto& [id, observer] : observers) {
                // Skip observers removed by an earlier callback in this round
                if (!impl_->volume_observers.count(id)) continue;
                if (note.sink && observer.sink_name == note.sink->name) {
                    observer.callback(note.snapshot);
                }
            }
        }
    }
    return ready.size();
}

std::optional<model::SinkHandle> PipeWireAudioService::get_default_sink() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->default_sink;
}

AudioService::SubscriptionId PipeWireAudioService::observe_volume(const model::SinkHandle& sink,
                                                                  SnapshotCallback callback) {
    SubscriptionId id = impl_->next_id++;
    impl_->volume_observers[id] = {sink.name, callback};

    if (auto snap = last_snapshot(sink)) {
        callback(*snap);
    }
    return id;
}

AudioService::SubscriptionId PipeWireAudioService::on_default_sink_changed(SinkChangedCallback callback) {
    SubscriptionId id = impl_->next_id++;
    impl_->device_observers[id] = std::move(callback);
    return id;
}

void PipeWireAudioService::unobserve(SubscriptionId id) {
    impl_->volume_observers.erase(id);
    impl_->device_observers.erase(id);
}

std::optional<model::AudioSnapshot> PipeWireAudioService::last_snapshot(const model::SinkHandle& sink) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->snapshots.find(sink.name);
    if (it == impl_->snapshots.end()) return std::nullopt;
    return it->second;
}

bool PipeWireAudioService::set_volume(const model::SinkHandle& sink, int percent) {
    percent = std::clamp(percent, 0, 100);
    util::Logger::debug("PipeWireAudioService: SET VOLUME " + sink.name + " -> " + std::to_string(percent) + "%");
    return impl_->send_props(sink, percent, std::nullopt);
}

bool PipeWireAudioService::set_muted(const model::SinkHandle& sink, bool muted) {
    util::Logger::debug("PipeWireAudioService: SET MUTE " + sink.name + " -> " + (muted ? "true" : "false"));
    return impl_->send_props(sink, std::nullopt, muted);
}

int PipeWireAudioService::linear_to_percent(float linear) {
    if (!std::isfinite(linear) || linear <= 0.0f) return 0;
    int percent = static_cast<int>(std::lround(std::cbrt(linear) * 100.0f));
    return std::clamp(percent, 0, 100);
}

float PipeWireAudioService::percent_to_linear(int percent) {
    float v = std::clamp(percent, 0, 100) / 100.0f;
    return v * v * v;
}

std::string PipeWireAudioService::parse_metadata_name(const std::string& json) {
    // Values look like {"name":"alsa_output.pci-0000_00_1f.3.analog-stereo"}
    auto key = json.find("\"name\"");
    if (key == std::string::npos) return "";
    auto colon = json.find(':', key + 6);
    if (colon == std::string::npos) return "";
    auto open = json.find('"', colon + 1);
    if (open == std::string::npos) return "";

    std::string name;
    for (size_t i = open + 1; i < json.size(); ++i) {
        char c = json[i];
        if (c == '\\' && i + 1 < json.size()) {
            name += json[++i];
        } else if (c == '"') {
            return name;
        } else {
            name += c;
        }
    }
    return "";  // Unterminated string
}

}  // namespace halcyon::audio
