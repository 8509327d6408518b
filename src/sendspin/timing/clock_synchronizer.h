/**
 * @file clock_synchronizer.h
 * @brief Estimates the offset between the local monotonic clock and the
 *        controller clock from NTP-style round trips.
 */
#ifndef SENDSPIN_CLOCK_SYNCHRONIZER_H
#define SENDSPIN_CLOCK_SYNCHRONIZER_H

#include "../configuration/sendspin_settings.h"
#include "../utils/cpp_logger.h"
#include "../utils/monotonic_clock.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

namespace sendspin {
namespace audio {

/**
 * @class ClockSynchronizer
 * @brief Maintains `server_time = local_time + offset`.
 * @details Each round trip contributes one offset sample. The published offset
 *          is the median of the most recent `max_samples` samples, so a single
 *          outlier never moves it on its own. Once `min_samples_for_sync`
 *          samples have been collected the synchronizer reports itself synced
 *          and stays synced until `reset()`.
 *
 *          The offset is stored in an atomic so the playback thread can read it
 *          while the network thread records new samples.
 */
class ClockSynchronizer {
public:
    ClockSynchronizer(const ClockSyncTuning& tuning,
                      utils::TimeSource time_source,
                      logging::LoggerPtr logger);

    /** @brief Current local monotonic time in microseconds. */
    int64_t now_us() const { return time_source_(); }

    /**
     * @brief Processes a server/time reply.
     * @param client_transmitted t0, the local send time echoed by the server.
     * @param server_received t1, server receive time.
     * @param server_transmitted t2, server send time.
     * @param client_received t3, local receive time.
     * @return The offset sample computed from this round trip.
     */
    int64_t process_time_response(int64_t client_transmitted,
                                  int64_t server_received,
                                  int64_t server_transmitted,
                                  int64_t client_received);

    /** @brief Inserts a raw offset sample into the history. */
    void add_offset_sample(int64_t offset_us);

    int64_t offset_us() const { return offset_us_.load(std::memory_order_acquire); }
    bool is_synced() const { return synced_.load(std::memory_order_acquire); }
    size_t sample_count() const;

    int64_t server_to_local(int64_t server_time_us) const { return server_time_us - offset_us(); }
    int64_t local_to_server(int64_t local_time_us) const { return local_time_us + offset_us(); }

    /** @brief Microseconds until `server_time_us` on the local clock; negative when past. */
    int64_t delay_until(int64_t server_time_us) const {
        return server_to_local(server_time_us) - now_us();
    }

    /** @brief Clears the sample history, the offset and the synced flag. */
    void reset();

private:
    ClockSyncTuning tuning_;
    utils::TimeSource time_source_;
    logging::LoggerPtr logger_;

    mutable std::mutex samples_mutex_;
    std::deque<int64_t> samples_;
    std::atomic<int64_t> offset_us_{0};
    std::atomic<bool> synced_{false};
};

} // namespace audio
} // namespace sendspin

#endif // SENDSPIN_CLOCK_SYNCHRONIZER_H
