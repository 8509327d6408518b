#include "clock_synchronizer.h"

#include <algorithm>
#include <vector>

namespace sendspin {
namespace audio {

ClockSynchronizer::ClockSynchronizer(const ClockSyncTuning& tuning,
                                     utils::TimeSource time_source,
                                     logging::LoggerPtr logger)
    : tuning_(tuning),
      time_source_(time_source ? std::move(time_source) : utils::default_time_source()),
      logger_(std::move(logger)) {
    if (tuning_.max_samples == 0) {
        tuning_.max_samples = 1;
    }
    tuning_.min_samples_for_sync = std::min(std::max<size_t>(tuning_.min_samples_for_sync, 1),
                                            tuning_.max_samples);
}

int64_t ClockSynchronizer::process_time_response(int64_t client_transmitted,
                                                 int64_t server_received,
                                                 int64_t server_transmitted,
                                                 int64_t client_received) {
    const int64_t round_trip = (client_received - client_transmitted) -
                               (server_transmitted - server_received);
    const int64_t one_way_delay = round_trip / 2;
    const int64_t estimated_server_now = server_transmitted + one_way_delay;
    const int64_t offset_sample = estimated_server_now - client_received;

    LOG_CPP_DEBUG(logger_, "[ClockSync] rtt=%lld us sample_offset=%lld us",
                  static_cast<long long>(round_trip), static_cast<long long>(offset_sample));

    add_offset_sample(offset_sample);
    return offset_sample;
}

void ClockSynchronizer::add_offset_sample(int64_t offset_us) {
    std::lock_guard<std::mutex> lock(samples_mutex_);
    samples_.push_back(offset_us);
    while (samples_.size() > tuning_.max_samples) {
        samples_.pop_front();
    }

    std::vector<int64_t> sorted(samples_.begin(), samples_.end());
    std::sort(sorted.begin(), sorted.end());
    const int64_t median = sorted[sorted.size() / 2];
    offset_us_.store(median, std::memory_order_release);

    if (!synced_.load(std::memory_order_acquire) && samples_.size() >= tuning_.min_samples_for_sync) {
        synced_.store(true, std::memory_order_release);
        LOG_CPP_INFO(logger_, "[ClockSync] Synchronized after %zu samples, offset=%lld us",
                     samples_.size(), static_cast<long long>(median));
    }
}

size_t ClockSynchronizer::sample_count() const {
    std::lock_guard<std::mutex> lock(samples_mutex_);
    return samples_.size();
}

void ClockSynchronizer::reset() {
    std::lock_guard<std::mutex> lock(samples_mutex_);
    samples_.clear();
    offset_us_.store(0, std::memory_order_release);
    synced_.store(false, std::memory_order_release);
}

} // namespace audio
} // namespace sendspin
