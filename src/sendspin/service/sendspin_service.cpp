#include "sendspin_service.h"

#include "../utils/runtime_paths.h"

#include <algorithm>
#include <exception>
#include <stdexcept>

#include <sys/utsname.h>

#ifndef SENDSPIN_PLAYER_VERSION
#define SENDSPIN_PLAYER_VERSION "0.0.0"
#endif

namespace sendspin {
namespace audio {

SendspinService::SendspinService(SendspinSettingsPtr settings,
                                 logging::LoggerPtr logger,
                                 std::shared_ptr<IAudioOutput> output,
                                 std::unique_ptr<ISessionListener> listener,
                                 utils::TimeSource time_source)
    : settings_(resolve_settings(settings)),
      logger_(std::move(logger)),
      output_(std::move(output)),
      listener_(std::move(listener)) {
    if (!output_) {
        throw std::invalid_argument("SendspinService requires an audio output");
    }
    if (!time_source) {
        time_source = utils::default_time_source();
    }

    buffer_ = std::make_shared<AudioChunkBuffer>(settings_->buffer.capacity_bytes);
    clock_ = std::make_shared<ClockSynchronizer>(settings_->clock_sync, std::move(time_source), logger_);
    state_store_ = std::make_shared<PlayerStateStore>();
    events_ = std::make_shared<SessionEventQueue>();
    engine_ = std::make_unique<PlaybackEngine>(buffer_, clock_, state_store_, output_, settings_, logger_);
    device_name_ = settings_->service.device_name;
    apply_output_volume();
}

SendspinService::~SendspinService() {
    stop();
}

void SendspinService::set_hooks(HostHooks hooks) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    hooks_ = std::move(hooks);
}

bool SendspinService::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (running_) {
        return true;
    }

    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        if (!identity_) {
            const std::string state_dir = settings_->service.state_dir.empty()
                                              ? utils::sendspin_state_dir()
                                              : utils::strip_trailing_slashes(settings_->service.state_dir);
            identity_ = ClientIdentity::load_or_create(state_dir, logger_);
        }
    }

    events_->reset();
    running_ = true;
    dispatch_thread_ = std::thread(&SendspinService::dispatch_loop, this);

    const bool listening = listener_ && listener_->start(
        settings_->service,
        [this](std::shared_ptr<ISessionTransport> transport) { return accept_session(std::move(transport)); });
    if (!listening) {
        LOG_CPP_ERROR(logger_, "[Service] Failed to start the session listener on port %u.",
                      settings_->service.port);
        running_ = false;
        events_->stop();
        if (dispatch_thread_.joinable()) {
            dispatch_thread_.join();
        }
        return false;
    }

    if (settings_->service.advertise_mdns) {
        advertiser_ = std::make_unique<MdnsAdvertiser>(build_service_info(), logger_);
        advertiser_->start();
    }

    LOG_CPP_INFO(logger_, "[Service] '%s' ready on port %u%s (client id %s).",
                 device_name().c_str(), settings_->service.port, settings_->service.path.c_str(),
                 client_id().c_str());
    return true;
}

void SendspinService::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (!running_.exchange(false)) {
        return;
    }
    LOG_CPP_INFO(logger_, "[Service] Stopping.");

    if (listener_) {
        listener_->stop();
    }

    std::shared_ptr<ConnectionStateMachine> session;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        session = std::move(session_);
    }
    if (session) {
        session->close();
    }

    if (advertiser_) {
        advertiser_->stop();
        advertiser_.reset();
    }

    // Drain queued events before the engine is stopped for good.
    events_->stop();
    if (dispatch_thread_.joinable()) {
        dispatch_thread_.join();
    }
    engine_->stop();
    LOG_CPP_INFO(logger_, "[Service] Stopped.");
}

std::shared_ptr<ISessionHandler> SendspinService::accept_session(std::shared_ptr<ISessionTransport> transport) {
    if (!running_) {
        LOG_CPP_WARNING(logger_, "[Service] Refusing connection while stopped.");
        return nullptr;
    }

    std::lock_guard<std::mutex> lock(session_mutex_);
    if (session_) {
        LOG_CPP_INFO(logger_, "[Service] New controller %s replaces %s.",
                     transport ? transport->remote_address().c_str() : "?",
                     session_->remote_address().c_str());
        session_->close();
        session_.reset();
    }

    ConnectionStateMachine::Dependencies deps{buffer_, clock_, state_store_, events_};
    session_ = std::make_shared<ConnectionStateMachine>(std::move(transport), build_client_hello(),
                                                        std::move(deps), settings_, logger_);
    return session_;
}

std::shared_ptr<ConnectionStateMachine> SendspinService::current_session() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_;
}

void SendspinService::set_volume(int volume) {
    const int clamped = std::clamp(volume, 0, 100);
    if (auto session = current_session()) {
        session->set_volume(clamped);
    } else {
        state_store_->update([clamped](PlayerState& state) { state.volume = clamped; });
    }
    apply_output_volume();
}

void SendspinService::set_muted(bool muted) {
    if (auto session = current_session()) {
        session->set_muted(muted);
    } else {
        state_store_->update([muted](PlayerState& state) { state.muted = muted; });
    }
    apply_output_volume();
}

void SendspinService::set_device_name(const std::string& name) {
    if (name.empty()) {
        LOG_CPP_WARNING(logger_, "[Service] Ignoring empty device name.");
        return;
    }
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        if (device_name_ == name) {
            return;
        }
        device_name_ = name;
    }
    LOG_CPP_INFO(logger_, "[Service] Device name set to '%s'; applies to new sessions.", name.c_str());

    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (advertiser_) {
        advertiser_->set_instance_name(name);
    }
}

std::string SendspinService::device_name() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return device_name_;
}

std::string SendspinService::client_id() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return identity_ ? identity_->id() : std::string();
}

PlayerStateStore::SubscriptionId SendspinService::subscribe(PlayerStateStore::Subscriber subscriber) {
    return state_store_->subscribe(std::move(subscriber));
}

void SendspinService::unsubscribe(PlayerStateStore::SubscriptionId id) {
    state_store_->unsubscribe(id);
}

protocol::ClientHello SendspinService::build_client_hello() const {
    protocol::ClientHello hello;
    hello.client_id = client_id();
    hello.name = device_name();
    hello.supported_formats = protocol::default_supported_formats();
    hello.buffer_capacity = buffer_->capacity();

    struct utsname system_info {};
    if (uname(&system_info) == 0) {
        hello.device_info.product_name = std::string(system_info.sysname) + " " + system_info.machine;
    } else {
        hello.device_info.product_name = "Linux";
    }
    hello.device_info.manufacturer = "Sendspin";
    hello.device_info.software_version = SENDSPIN_PLAYER_VERSION;
    return hello;
}

MdnsServiceInfo SendspinService::build_service_info() const {
    MdnsServiceInfo info;
    info.instance_name = device_name();
    info.hostname = settings_->service.hostname;
    info.port = settings_->service.port;
    info.txt = {"path=" + settings_->service.path};
    return info;
}

void SendspinService::dispatch_loop() {
    LOG_CPP_DEBUG(logger_, "[Service] Dispatch thread started.");
    SessionEvent event;
    while (events_->pop(event)) {
        HostHooks hooks;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            hooks = hooks_;
        }
        try {
            handle_event(event, hooks);
        } catch (const std::exception& e) {
            LOG_CPP_ERROR(logger_, "[Service] Exception while dispatching session event: %s", e.what());
        }
    }
    LOG_CPP_DEBUG(logger_, "[Service] Dispatch thread finished.");
}

void SendspinService::handle_event(const SessionEvent& event, const HostHooks& hooks) {
    if (const auto* start = std::get_if<StreamStartEvent>(&event)) {
        if (!engine_->configure(start->config)) {
            LOG_CPP_WARNING(logger_, "[Service] Playback idle: could not configure output for the new stream.");
        }
        if (hooks.on_stream_start) {
            hooks.on_stream_start(start->config);
        }
    } else if (std::holds_alternative<StreamEndEvent>(event)) {
        engine_->stop();
        if (hooks.on_stream_end) {
            hooks.on_stream_end();
        }
    } else if (const auto* volume = std::get_if<VolumeChangedEvent>(&event)) {
        apply_output_volume();
        if (hooks.on_volume_change) {
            hooks.on_volume_change(volume->volume);
        }
    } else if (const auto* mute = std::get_if<MuteChangedEvent>(&event)) {
        apply_output_volume();
        if (hooks.on_mute_change) {
            hooks.on_mute_change(mute->muted);
        }
    } else if (const auto* changed = std::get_if<StateChangedEvent>(&event)) {
        LOG_CPP_DEBUG(logger_, "[Service] Session state %s.", connection_state_name(changed->state));
        if (hooks.on_state_change) {
            hooks.on_state_change(changed->state);
        }
    }
}

void SendspinService::apply_output_volume() {
    const auto snapshot = state_store_->get();
    const float gain = snapshot->muted ? 0.0f : static_cast<float>(snapshot->volume) / 100.0f;
    engine_->set_volume(gain);
}

} // namespace audio
} // namespace sendspin
