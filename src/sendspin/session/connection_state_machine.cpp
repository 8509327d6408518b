#include "connection_state_machine.h"

#include "../protocol/sendspin_protocol.h"

#include <algorithm>
#include <exception>

namespace sendspin {
namespace audio {

using namespace protocol;

ConnectionStateMachine::ConnectionStateMachine(std::shared_ptr<ISessionTransport> transport,
                                               protocol::ClientHello hello,
                                               Dependencies deps,
                                               SendspinSettingsPtr settings,
                                               logging::LoggerPtr logger)
    : transport_(std::move(transport)),
      hello_(std::move(hello)),
      deps_(std::move(deps)),
      settings_(resolve_settings(settings)),
      logger_(std::move(logger)),
      remote_address_(transport_ ? transport_->remote_address() : std::string()) {}

ConnectionStateMachine::~ConnectionStateMachine() {
    if (sync_scheduler_) {
        sync_scheduler_->stop();
    }
}

void ConnectionStateMachine::on_open() {
    if (closed_) {
        return;
    }

    Outbox outbox;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ConnectionState::DISCONNECTED) {
            LOG_CPP_WARNING(logger_, "[Session:%s] Ignoring duplicate open in state %s.",
                            remote_address_.c_str(), connection_state_name(state_));
            return;
        }

        transition_locked(ConnectionState::CONNECTING);
        deps_.clock->reset();
        deps_.buffer->clear();
        deps_.buffer->reset_stats();
        audio_frames_received_ = 0;
        audio_frames_dropped_ = 0;
        deps_.state_store->update([](PlayerState& state) {
            state.error_message.clear();
            state.server_id.clear();
            state.server_name.clear();
            state.clock_offset_us = 0;
            state.clock_synced = false;
            state.buffer_health_percent = 0;
        });

        LOG_CPP_INFO(logger_, "[Session:%s] Connection opened, sending client/hello as '%s'.",
                     remote_address_.c_str(), hello_.name.c_str());
        outbox.push_back(make_client_hello(hello_));
    }
    flush(outbox);

    // The transport may have failed while the hello was going out.
    std::lock_guard<std::mutex> lock(mutex_);
    if (!closed_ && state_ == ConnectionState::CONNECTING) {
        transition_locked(ConnectionState::HANDSHAKING);
    }
}

void ConnectionStateMachine::on_text(const std::string& message) {
    if (closed_) {
        return;
    }
    const int64_t received_us = deps_.clock->now_us();

    try {
        auto envelope = parse_envelope(message);
        if (!envelope) {
            LOG_CPP_WARNING(logger_, "[Session:%s] Dropping malformed text frame (%zu bytes).",
                            remote_address_.c_str(), message.size());
            return;
        }

        Outbox outbox;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            handle_message(*envelope, received_us, outbox);
        }
        flush(outbox);
    } catch (const std::exception& e) {
        LOG_CPP_ERROR(logger_, "[Session:%s] Exception while handling text frame: %s",
                      remote_address_.c_str(), e.what());
        on_transport_error(e.what());
    }
}

void ConnectionStateMachine::handle_message(const Envelope& envelope, int64_t received_us, Outbox& outbox) {
    const std::string& type = envelope.type;
    if (type == message_type::kServerHello) {
        handle_server_hello(envelope.payload);
    } else if (type == message_type::kServerTime) {
        handle_server_time(envelope.payload, received_us, outbox);
    } else if (type == message_type::kStreamStart) {
        handle_stream_start(envelope.payload, outbox);
    } else if (type == message_type::kStreamClear) {
        handle_stream_clear(envelope.payload);
    } else if (type == message_type::kStreamEnd) {
        handle_stream_end(envelope.payload);
    } else if (type == message_type::kServerCommand) {
        handle_server_command(envelope.payload, outbox);
    } else if (type == message_type::kServerState) {
        LOG_CPP_DEBUG(logger_, "[Session:%s] Ignoring server/state (player role only).",
                      remote_address_.c_str());
    } else {
        LOG_CPP_WARNING(logger_, "[Session:%s] Ignoring unknown message type '%s'.",
                        remote_address_.c_str(), type.c_str());
    }
}

void ConnectionStateMachine::handle_server_hello(const Json::Value& payload) {
    // CONNECTING is accepted: the reply can race the transition that follows our hello.
    if (state_ != ConnectionState::HANDSHAKING && state_ != ConnectionState::CONNECTING) {
        LOG_CPP_DEBUG(logger_, "[Session:%s] Ignoring server/hello in state %s.",
                      remote_address_.c_str(), connection_state_name(state_));
        return;
    }
    auto hello = parse_server_hello(payload);
    if (!hello) {
        LOG_CPP_WARNING(logger_, "[Session:%s] Dropping undecodable server/hello.", remote_address_.c_str());
        return;
    }

    LOG_CPP_INFO(logger_, "[Session:%s] Server hello: id=%s name='%s' version=%d reason=%s",
                 remote_address_.c_str(), hello->server_id.c_str(), hello->name.c_str(),
                 hello->version, hello->connection_reason.c_str());

    deps_.state_store->update([&](PlayerState& state) {
        state.server_id = hello->server_id;
        state.server_name = hello->name;
    });
    transition_locked(ConnectionState::SYNCING_CLOCK);

    sync_scheduler_ = std::make_unique<ClockSyncScheduler>(
        settings_->clock_sync, [this]() { return send_time_request(); }, logger_);
    sync_scheduler_->start();
}

void ConnectionStateMachine::handle_server_time(const Json::Value& payload, int64_t received_us, Outbox& outbox) {
    auto time = parse_server_time(payload);
    if (!time) {
        LOG_CPP_WARNING(logger_, "[Session:%s] Dropping undecodable server/time.", remote_address_.c_str());
        return;
    }
    if (state_ != ConnectionState::SYNCING_CLOCK && state_ != ConnectionState::CONNECTED &&
        state_ != ConnectionState::STREAMING) {
        LOG_CPP_DEBUG(logger_, "[Session:%s] Ignoring server/time in state %s.",
                      remote_address_.c_str(), connection_state_name(state_));
        return;
    }

    deps_.clock->process_time_response(time->client_transmitted, time->server_received,
                                       time->server_transmitted, received_us);
    const bool synced = deps_.clock->is_synced();
    const int64_t offset = deps_.clock->offset_us();
    deps_.state_store->update([&](PlayerState& state) {
        state.clock_offset_us = offset;
        state.clock_synced = synced;
    });

    if (state_ == ConnectionState::SYNCING_CLOCK && synced) {
        transition_locked(ConnectionState::CONNECTED);
        outbox.push_back(make_state_report_locked());

        if (pending_stream_) {
            StreamConfig pending = std::move(*pending_stream_);
            pending_stream_.reset();
            LOG_CPP_INFO(logger_, "[Session:%s] Applying stream/start received during clock sync (%zu chunks buffered).",
                         remote_address_.c_str(), deps_.buffer->chunk_count());
            apply_stream_start_locked(pending, outbox, true);
        }
    }
}

void ConnectionStateMachine::handle_stream_start(const Json::Value& payload, Outbox& outbox) {
    auto config = parse_stream_start(payload);
    if (!config) {
        LOG_CPP_WARNING(logger_, "[Session:%s] Dropping undecodable stream/start.", remote_address_.c_str());
        return;
    }

    switch (state_) {
        case ConnectionState::CONNECTED:
        case ConnectionState::STREAMING:
            apply_stream_start_locked(*config, outbox);
            break;
        case ConnectionState::SYNCING_CLOCK:
            LOG_CPP_INFO(logger_, "[Session:%s] Deferring stream/start until clock is synchronized.",
                         remote_address_.c_str());
            if (pending_stream_) {
                deps_.buffer->clear();
            }
            pending_stream_ = std::move(*config);
            break;
        default:
            LOG_CPP_WARNING(logger_, "[Session:%s] Ignoring stream/start in state %s.",
                            remote_address_.c_str(), connection_state_name(state_));
            break;
    }
}

void ConnectionStateMachine::apply_stream_start_locked(const StreamConfig& config, Outbox& outbox,
                                                       bool keep_buffered) {
    if (!is_supported_format(config, hello_.supported_formats)) {
        LOG_CPP_WARNING(logger_, "[Session:%s] Unsupported stream format %s %d Hz %d ch %d bit.",
                        remote_address_.c_str(), config.codec.c_str(), config.sample_rate,
                        config.channels, config.bit_depth);
        // The previous stream is replaced even when the new one cannot be played.
        if (stream_config_) {
            end_stream_locked();
        } else {
            deps_.buffer->clear();
        }
        if (!hello_.supported_formats.empty()) {
            outbox.push_back(make_stream_request_format(hello_.supported_formats.front()));
        }
        return;
    }

    stream_config_ = config;
    if (!keep_buffered) {
        deps_.buffer->clear();
        audio_frames_received_ = 0;
        audio_frames_dropped_ = 0;
    }
    transition_locked(ConnectionState::STREAMING);

    deps_.state_store->update([&](PlayerState& state) {
        state.stream_active = true;
        state.codec = config.codec;
        state.sample_rate = config.sample_rate;
        state.channels = config.channels;
    });

    LOG_CPP_INFO(logger_, "[Session:%s] Stream started: %s %d Hz %d ch %d bit (header %zu bytes).",
                 remote_address_.c_str(), config.codec.c_str(), config.sample_rate, config.channels,
                 config.bit_depth, config.codec_header.size());
    deps_.events->push(StreamStartEvent{config});
}

void ConnectionStateMachine::handle_stream_clear(const Json::Value& payload) {
    auto roles = parse_stream_roles(payload);
    if (!roles || !roles_include_player(*roles)) {
        LOG_CPP_DEBUG(logger_, "[Session:%s] stream/clear not addressed to player.", remote_address_.c_str());
        return;
    }
    deps_.buffer->clear();
    LOG_CPP_DEBUG(logger_, "[Session:%s] Buffer cleared by stream/clear.", remote_address_.c_str());
}

void ConnectionStateMachine::handle_stream_end(const Json::Value& payload) {
    auto roles = parse_stream_roles(payload);
    if (roles && !roles_include_player(*roles)) {
        LOG_CPP_DEBUG(logger_, "[Session:%s] stream/end not addressed to player.", remote_address_.c_str());
        return;
    }

    pending_stream_.reset();
    end_stream_locked();
}

void ConnectionStateMachine::end_stream_locked() {
    stream_config_.reset();
    deps_.buffer->clear();
    if (state_ == ConnectionState::STREAMING) {
        transition_locked(ConnectionState::CONNECTED);
    }
    deps_.state_store->update([](PlayerState& state) {
        state.stream_active = false;
        state.codec.clear();
        state.sample_rate = 0;
        state.channels = 0;
    });

    LOG_CPP_INFO(logger_, "[Session:%s] Stream ended after %llu frames (%llu dropped).",
                 remote_address_.c_str(),
                 static_cast<unsigned long long>(audio_frames_received_.load()),
                 static_cast<unsigned long long>(audio_frames_dropped_.load()));
    deps_.events->push(StreamEndEvent{});
}

void ConnectionStateMachine::handle_server_command(const Json::Value& payload, Outbox& outbox) {
    auto command = parse_server_command(payload);
    if (!command) {
        LOG_CPP_WARNING(logger_, "[Session:%s] Dropping undecodable server/command.", remote_address_.c_str());
        return;
    }

    if (command->command == "volume") {
        if (command->volume) {
            const int volume = std::clamp(*command->volume, 0, 100);
            deps_.state_store->update([volume](PlayerState& state) { state.volume = volume; });
            deps_.events->push(VolumeChangedEvent{volume});
            LOG_CPP_INFO(logger_, "[Session:%s] Volume set to %d by controller.", remote_address_.c_str(), volume);
        }
    } else if (command->command == "mute") {
        if (command->mute) {
            const bool muted = *command->mute;
            deps_.state_store->update([muted](PlayerState& state) { state.muted = muted; });
            deps_.events->push(MuteChangedEvent{muted});
            LOG_CPP_INFO(logger_, "[Session:%s] Mute %s by controller.", remote_address_.c_str(),
                         muted ? "enabled" : "disabled");
        }
    } else {
        LOG_CPP_WARNING(logger_, "[Session:%s] Ignoring unknown command '%s'.",
                        remote_address_.c_str(), command->command.c_str());
        return;
    }

    outbox.push_back(make_state_report_locked());
}

void ConnectionStateMachine::on_binary(const uint8_t* data, size_t size) {
    if (closed_) {
        return;
    }

    try {
        auto chunk = parse_binary_frame(data, size);
        if (!chunk) {
            if (size > 0 && data[0] != binary_type::kAudio) {
                LOG_CPP_DEBUG(logger_, "[Session:%s] Ignoring binary frame with type %u.",
                              remote_address_.c_str(), static_cast<unsigned>(data[0]));
            } else {
                LOG_CPP_WARNING(logger_, "[Session:%s] Dropping truncated audio frame (%zu bytes).",
                                remote_address_.c_str(), size);
            }
            return;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            // Frames that follow a deferred stream/start are kept for it.
            const bool accepting = state_ == ConnectionState::STREAMING ||
                                   (state_ == ConnectionState::SYNCING_CLOCK && pending_stream_);
            if (!accepting) {
                LOG_CPP_DEBUG(logger_, "[Session:%s] Dropping audio frame outside a stream.",
                              remote_address_.c_str());
                return;
            }
        }

        const uint64_t received = ++audio_frames_received_;
        if (!deps_.buffer->write(std::move(*chunk))) {
            const uint64_t dropped = ++audio_frames_dropped_;
            const auto interval = static_cast<uint64_t>(std::max(1, settings_->session.buffer_full_log_interval));
            if (dropped == 1 || dropped % interval == 0) {
                LOG_CPP_WARNING(logger_, "[Session:%s] Buffer full (%d%%), dropped %llu of %llu audio frames.",
                                remote_address_.c_str(), deps_.buffer->usage_percent(),
                                static_cast<unsigned long long>(dropped),
                                static_cast<unsigned long long>(received));
            }
        }
        maybe_refresh_buffer_health();
    } catch (const std::exception& e) {
        LOG_CPP_ERROR(logger_, "[Session:%s] Exception while handling binary frame: %s",
                      remote_address_.c_str(), e.what());
        on_transport_error(e.what());
    }
}

void ConnectionStateMachine::maybe_refresh_buffer_health() {
    const int64_t now = deps_.clock->now_us();
    const int64_t interval_us = static_cast<int64_t>(settings_->session.health_refresh_interval_ms) * 1000;
    int64_t last = last_health_refresh_us_.load();
    if (now - last < interval_us || !last_health_refresh_us_.compare_exchange_strong(last, now)) {
        return;
    }
    const int health = deps_.buffer->health_percent();
    deps_.state_store->update([health](PlayerState& state) { state.buffer_health_percent = health; });
}

void ConnectionStateMachine::on_transport_error(const std::string& error) {
    LOG_CPP_ERROR(logger_, "[Session:%s] Transport error: %s", remote_address_.c_str(), error.c_str());
    if (teardown(error) && transport_) {
        transport_->close();
    }
}

void ConnectionStateMachine::on_closed() {
    if (teardown(std::nullopt)) {
        LOG_CPP_INFO(logger_, "[Session:%s] Connection closed by peer.", remote_address_.c_str());
    }
}

void ConnectionStateMachine::close() {
    if (teardown(std::nullopt)) {
        LOG_CPP_INFO(logger_, "[Session:%s] Closing session.", remote_address_.c_str());
        if (transport_) {
            transport_->close();
        }
    }
}

bool ConnectionStateMachine::teardown(const std::optional<std::string>& error) {
    bool expected = false;
    if (!closed_.compare_exchange_strong(expected, true)) {
        return false;
    }

    std::unique_ptr<ClockSyncScheduler> scheduler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        scheduler = std::move(sync_scheduler_);
    }
    if (scheduler) {
        scheduler->stop();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const bool had_stream = stream_config_.has_value();
    if (error) {
        transition_locked(ConnectionState::ERROR);
        deps_.state_store->update([&](PlayerState& state) { state.error_message = *error; });
    }

    stream_config_.reset();
    pending_stream_.reset();
    deps_.buffer->clear();
    deps_.clock->reset();
    if (had_stream) {
        deps_.events->push(StreamEndEvent{});
    }

    deps_.state_store->update([](PlayerState& state) {
        state.stream_active = false;
        state.codec.clear();
        state.sample_rate = 0;
        state.channels = 0;
        state.clock_offset_us = 0;
        state.clock_synced = false;
        state.buffer_health_percent = 0;
    });
    transition_locked(ConnectionState::DISCONNECTED);
    return true;
}

void ConnectionStateMachine::set_volume(int volume) {
    const int clamped = std::clamp(volume, 0, 100);
    Outbox outbox;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        deps_.state_store->update([clamped](PlayerState& state) { state.volume = clamped; });
        if (!closed_ && (state_ == ConnectionState::CONNECTED || state_ == ConnectionState::STREAMING)) {
            outbox.push_back(make_state_report_locked());
        }
    }
    flush(outbox);
}

void ConnectionStateMachine::set_muted(bool muted) {
    Outbox outbox;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        deps_.state_store->update([muted](PlayerState& state) { state.muted = muted; });
        if (!closed_ && (state_ == ConnectionState::CONNECTED || state_ == ConnectionState::STREAMING)) {
            outbox.push_back(make_state_report_locked());
        }
    }
    flush(outbox);
}

ConnectionState ConnectionStateMachine::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<StreamConfig> ConnectionStateMachine::stream_config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stream_config_;
}

void ConnectionStateMachine::transition_locked(ConnectionState next) {
    if (state_ == next) {
        return;
    }
    LOG_CPP_INFO(logger_, "[Session:%s] %s -> %s", remote_address_.c_str(),
                 connection_state_name(state_), connection_state_name(next));
    state_ = next;
    deps_.state_store->update([next](PlayerState& state) { state.connection_state = next; });
    deps_.events->push(StateChangedEvent{next});
}

std::string ConnectionStateMachine::make_state_report_locked() const {
    const auto snapshot = deps_.state_store->get();
    const ReportedPlayerState reported =
        (state_ == ConnectionState::ERROR) ? ReportedPlayerState::ERROR : ReportedPlayerState::SYNCHRONIZED;
    return make_client_state(reported, snapshot->volume, snapshot->muted);
}

void ConnectionStateMachine::flush(Outbox& outbox) {
    if (!transport_) {
        return;
    }
    for (const auto& message : outbox) {
        if (closed_) {
            return;
        }
        if (!transport_->send_text(message)) {
            LOG_CPP_WARNING(logger_, "[Session:%s] Failed to send %zu-byte message.",
                            remote_address_.c_str(), message.size());
        }
    }
    outbox.clear();
}

bool ConnectionStateMachine::send_time_request() {
    if (closed_ || !transport_) {
        return false;
    }
    return transport_->send_text(make_client_time(deps_.clock->now_us()));
}

} // namespace audio
} // namespace sendspin
