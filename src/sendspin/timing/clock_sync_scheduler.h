#pragma once

#include "../configuration/sendspin_settings.h"
#include "../utils/audio_component.h"
#include "../utils/cpp_logger.h"

#include <condition_variable>
#include <functional>
#include <mutex>

namespace sendspin {
namespace audio {

/**
 * @class ClockSyncScheduler
 * @brief Issues client/time requests: a burst right after the handshake, then
 *        one request per resync interval until stopped.
 */
class ClockSyncScheduler : public AudioComponent {
public:
    /// Sends one client/time request; returns false when the transport refused it.
    using SendRequest = std::function<bool()>;

    ClockSyncScheduler(const ClockSyncTuning& tuning, SendRequest send_request,
                       logging::LoggerPtr logger);
    ~ClockSyncScheduler() override;

    void start() override;
    void stop() override;

protected:
    void run() override;

private:
    /// Waits `ms` milliseconds; returns false if stop was requested meanwhile.
    bool wait_ms(long ms);

    ClockSyncTuning tuning_;
    SendRequest send_request_;
    logging::LoggerPtr logger_;

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

} // namespace audio
} // namespace sendspin
