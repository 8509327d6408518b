/**
 * @file connection_state_machine.h
 * @brief Protocol state machine for one controller session.
 */
#ifndef SENDSPIN_CONNECTION_STATE_MACHINE_H
#define SENDSPIN_CONNECTION_STATE_MACHINE_H

#include "session_transport.h"
#include "player_state_store.h"
#include "../buffering/audio_chunk_buffer.h"
#include "../configuration/sendspin_settings.h"
#include "../protocol/protocol_types.h"
#include "../sendspin_types.h"
#include "../timing/clock_sync_scheduler.h"
#include "../timing/clock_synchronizer.h"
#include "../utils/cpp_logger.h"
#include "../utils/thread_safe_queue.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sendspin {
namespace audio {

using SessionEventQueue = utils::ThreadSafeQueue<SessionEvent>;

/**
 * @class ConnectionStateMachine
 * @brief Applies protocol messages for a single session.
 * @details Transitions:
 *          DISCONNECTED -> CONNECTING -> HANDSHAKING (client/hello sent)
 *          -> SYNCING_CLOCK (server/hello) -> CONNECTED (clock synced)
 *          <-> STREAMING (stream/start, stream/end).
 *          Transport failures pass through ERROR to DISCONNECTED; a normal
 *          close goes straight to DISCONNECTED. A closed session never reopens.
 *
 *          Stream and command notifications are pushed to the event queue;
 *          audio frames go straight into the shared chunk buffer.
 */
class ConnectionStateMachine : public ISessionHandler {
public:
    struct Dependencies {
        std::shared_ptr<AudioChunkBuffer> buffer;
        std::shared_ptr<ClockSynchronizer> clock;
        std::shared_ptr<PlayerStateStore> state_store;
        std::shared_ptr<SessionEventQueue> events;
    };

    ConnectionStateMachine(std::shared_ptr<ISessionTransport> transport,
                           protocol::ClientHello hello,
                           Dependencies deps,
                           SendspinSettingsPtr settings,
                           logging::LoggerPtr logger);
    ~ConnectionStateMachine() override;

    // ISessionHandler
    void on_open() override;
    void on_text(const std::string& message) override;
    void on_binary(const uint8_t* data, size_t size) override;
    void on_transport_error(const std::string& error) override;
    void on_closed() override;

    /** @brief Closes the session from our side (e.g. replaced by a new one). */
    void close();

    /** @brief Host-issued volume change (clamped to 0-100), reported to the controller. */
    void set_volume(int volume);
    /** @brief Host-issued mute change, reported to the controller. */
    void set_muted(bool muted);

    ConnectionState state() const;
    std::optional<StreamConfig> stream_config() const;
    bool is_closed() const { return closed_.load(); }
    const std::string& remote_address() const { return remote_address_; }

    uint64_t audio_frames_received() const { return audio_frames_received_.load(); }
    uint64_t audio_frames_dropped() const { return audio_frames_dropped_.load(); }

private:
    using Outbox = std::vector<std::string>;

    void handle_message(const protocol::Envelope& envelope, int64_t received_us, Outbox& outbox);
    void handle_server_hello(const Json::Value& payload);
    void handle_server_time(const Json::Value& payload, int64_t received_us, Outbox& outbox);
    void handle_stream_start(const Json::Value& payload, Outbox& outbox);
    void handle_stream_clear(const Json::Value& payload);
    void handle_stream_end(const Json::Value& payload);
    void handle_server_command(const Json::Value& payload, Outbox& outbox);

    void apply_stream_start_locked(const StreamConfig& config, Outbox& outbox, bool keep_buffered = false);
    /// Drops the active stream, returns to CONNECTED and notifies the service.
    void end_stream_locked();
    void transition_locked(ConnectionState next);
    std::string make_state_report_locked() const;
    void flush(Outbox& outbox);
    bool send_time_request();
    void maybe_refresh_buffer_health();

    /// Stops the scheduler and releases session resources; returns false if already torn down.
    bool teardown(const std::optional<std::string>& error);

    std::shared_ptr<ISessionTransport> transport_;
    protocol::ClientHello hello_;
    Dependencies deps_;
    SendspinSettingsPtr settings_;
    logging::LoggerPtr logger_;
    std::string remote_address_;

    mutable std::mutex mutex_;
    ConnectionState state_ = ConnectionState::DISCONNECTED;
    std::optional<StreamConfig> stream_config_;
    std::optional<StreamConfig> pending_stream_;

    std::unique_ptr<ClockSyncScheduler> sync_scheduler_;
    std::atomic<bool> closed_{false};

    std::atomic<uint64_t> audio_frames_received_{0};
    std::atomic<uint64_t> audio_frames_dropped_{0};
    std::atomic<int64_t> last_health_refresh_us_{0};
};

} // namespace audio
} // namespace sendspin

#endif // SENDSPIN_CONNECTION_STATE_MACHINE_H
