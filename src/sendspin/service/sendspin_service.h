/**
 * @file sendspin_service.h
 * @brief Defines the SendspinService class, the top-level orchestrator of the player.
 * @details SendspinService owns the shared chunk buffer, the clock synchronizer,
 *          the playback engine, the mDNS advertiser and the session listener.
 *          It admits one controller session at a time and turns the session's
 *          events into playback engine calls and host notifications.
 */
#ifndef SENDSPIN_SERVICE_H
#define SENDSPIN_SERVICE_H

#include "client_identity.h"
#include "../buffering/audio_chunk_buffer.h"
#include "../configuration/sendspin_settings.h"
#include "../discovery/mdns_advertiser.h"
#include "../playback/audio_output.h"
#include "../playback/playback_engine.h"
#include "../protocol/protocol_types.h"
#include "../session/connection_state_machine.h"
#include "../session/player_state_store.h"
#include "../session/session_transport.h"
#include "../timing/clock_synchronizer.h"
#include "../utils/cpp_logger.h"
#include "../utils/monotonic_clock.h"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace sendspin {
namespace audio {

/**
 * @struct HostHooks
 * @brief Notifications delivered to the host on the service dispatch thread.
 * @details Any hook may be left empty. Hooks must not call back into
 *          `SendspinService::stop()`.
 */
struct HostHooks {
    std::function<void(const StreamConfig&)> on_stream_start;
    std::function<void()> on_stream_end;
    std::function<void(int)> on_volume_change;
    std::function<void(bool)> on_mute_change;
    std::function<void(ConnectionState)> on_state_change;
};

/**
 * @class SendspinService
 * @brief Binds discovery, the session listener and the playback pipeline.
 */
class SendspinService {
public:
    /**
     * @param settings Shared settings; null uses defaults.
     * @param logger Logger shared with every component; may be null.
     * @param output Output device used by the playback engine.
     * @param listener Accepts controller connections. Owned by the service.
     * @param time_source Local monotonic microsecond clock.
     */
    SendspinService(SendspinSettingsPtr settings,
                    logging::LoggerPtr logger,
                    std::shared_ptr<IAudioOutput> output,
                    std::unique_ptr<ISessionListener> listener,
                    utils::TimeSource time_source = utils::default_time_source());
    ~SendspinService();

    SendspinService(const SendspinService&) = delete;
    SendspinService& operator=(const SendspinService&) = delete;

    /** @brief Installs host hooks. Takes effect for the next dispatched event. */
    void set_hooks(HostHooks hooks);

    /**
     * @brief Loads the client id, starts the dispatch thread, the listener and
     *        the mDNS advertisement.
     * @return false if the listener could not be started.
     */
    bool start();

    /** @brief Closes the active session and stops every component. */
    void stop();

    bool is_running() const { return running_.load(); }

    /**
     * @brief Admits a new controller connection, closing any previous session first.
     * @details Called by the listener for every inbound connection.
     * @return The handler the listener must route the connection's events to,
     *         or null when the service is not running.
     */
    std::shared_ptr<ISessionHandler> accept_session(std::shared_ptr<ISessionTransport> transport);

    /** @brief Host-side volume change (0-100). Reported to the controller if connected. */
    void set_volume(int volume);
    /** @brief Host-side mute change. Reported to the controller if connected. */
    void set_muted(bool muted);

    /** @brief Renames the player for new sessions and re-advertises it. */
    void set_device_name(const std::string& name);
    std::string device_name() const;

    PlayerStateStore::Snapshot get_state() const { return state_store_->get(); }
    PlayerStateStore::SubscriptionId subscribe(PlayerStateStore::Subscriber subscriber);
    void unsubscribe(PlayerStateStore::SubscriptionId id);

    /** @brief The persistent client id; empty until `start()` has run once. */
    std::string client_id() const;

    PlaybackEngine::Stats playback_stats() const { return engine_->stats(); }
    std::shared_ptr<ClockSynchronizer> clock() const { return clock_; }
    std::shared_ptr<AudioChunkBuffer> buffer() const { return buffer_; }

private:
    protocol::ClientHello build_client_hello() const;
    MdnsServiceInfo build_service_info() const;
    void dispatch_loop();
    void handle_event(const SessionEvent& event, const HostHooks& hooks);
    void apply_output_volume();
    std::shared_ptr<ConnectionStateMachine> current_session() const;

    SendspinSettingsPtr settings_;
    logging::LoggerPtr logger_;
    std::shared_ptr<IAudioOutput> output_;
    std::unique_ptr<ISessionListener> listener_;

    std::shared_ptr<AudioChunkBuffer> buffer_;
    std::shared_ptr<ClockSynchronizer> clock_;
    std::shared_ptr<PlayerStateStore> state_store_;
    std::shared_ptr<SessionEventQueue> events_;
    std::unique_ptr<PlaybackEngine> engine_;
    std::unique_ptr<MdnsAdvertiser> advertiser_;

    mutable std::mutex config_mutex_;
    std::string device_name_;
    std::optional<ClientIdentity> identity_;
    HostHooks hooks_;

    mutable std::mutex session_mutex_;
    std::shared_ptr<ConnectionStateMachine> session_;

    std::mutex lifecycle_mutex_;
    std::atomic<bool> running_{false};
    std::thread dispatch_thread_;
};

} // namespace audio
} // namespace sendspin

#endif // SENDSPIN_SERVICE_H
