#include "clock_sync_scheduler.h"

#include <chrono>

namespace sendspin {
namespace audio {

ClockSyncScheduler::ClockSyncScheduler(const ClockSyncTuning& tuning, SendRequest send_request,
                                       logging::LoggerPtr logger)
    : tuning_(tuning), send_request_(std::move(send_request)), logger_(std::move(logger)) {}

ClockSyncScheduler::~ClockSyncScheduler() {
    stop();
}

void ClockSyncScheduler::start() {
    if (component_thread_.joinable()) {
        return;
    }
    stop_flag_ = false;
    component_thread_ = std::thread(&ClockSyncScheduler::run, this);
}

void ClockSyncScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stop_flag_ = true;
    }
    wait_cv_.notify_all();
    if (component_thread_.joinable()) {
        if (component_thread_.get_id() == std::this_thread::get_id()) {
            component_thread_.detach();
        } else {
            component_thread_.join();
        }
    }
}

bool ClockSyncScheduler::wait_ms(long ms) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, std::chrono::milliseconds(ms), [this] { return stop_flag_.load(); });
    return !stop_flag_;
}

void ClockSyncScheduler::run() {
    LOG_CPP_DEBUG(logger_, "[ClockSync] Scheduler started: burst=%d every %ld ms, resync every %ld ms",
                  tuning_.burst_count, tuning_.burst_interval_ms, tuning_.resync_interval_ms);

    for (int i = 0; i < tuning_.burst_count && !stop_flag_; ++i) {
        if (!send_request_()) {
            LOG_CPP_WARNING(logger_, "[ClockSync] Failed to send burst request %d.", i + 1);
        }
        if (i + 1 < tuning_.burst_count && !wait_ms(tuning_.burst_interval_ms)) {
            return;
        }
    }

    while (wait_ms(tuning_.resync_interval_ms)) {
        if (!send_request_()) {
            LOG_CPP_WARNING(logger_, "[ClockSync] Failed to send periodic sync request.");
        }
    }
    LOG_CPP_DEBUG(logger_, "[ClockSync] Scheduler stopped.");
}

} // namespace audio
} // namespace sendspin
