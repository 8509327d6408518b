/**
 * @file audio_component.h
 * @brief Base class for engine parts that own a worker thread.
 * @details The playback engine, the clock sync scheduler and the mDNS responder
 *          derive from this class so their lifecycle reads the same way:
 *          `start()` launches `run()` on `component_thread_`, `stop()` raises
 *          `stop_flag_`, wakes the loop and joins.
 */
#ifndef SENDSPIN_AUDIO_COMPONENT_H
#define SENDSPIN_AUDIO_COMPONENT_H

#include <atomic>
#include <thread>

namespace sendspin {
namespace audio {

class AudioComponent {
public:
    virtual ~AudioComponent() = default;

    AudioComponent(const AudioComponent&) = delete;
    AudioComponent& operator=(const AudioComponent&) = delete;
    AudioComponent(AudioComponent&&) = delete;
    AudioComponent& operator=(AudioComponent&&) = delete;

    /**
     * @brief Starts the component's processing thread.
     */
    virtual void start() = 0;

    /**
     * @brief Signals the processing thread to stop and joins it.
     * @details Must be safe to call more than once and before `start()`.
     */
    virtual void stop() = 0;

    /**
     * @brief Checks if the component's thread is currently running.
     */
    bool is_running() const {
        return component_thread_.joinable() && !stop_flag_;
    }

protected:
    AudioComponent() : stop_flag_(false) {}

    /**
     * @brief The loop executed by `component_thread_`; must poll `stop_flag_`.
     */
    virtual void run() = 0;

    std::thread component_thread_;
    std::atomic<bool> stop_flag_;
};

} // namespace audio
} // namespace sendspin

#endif // SENDSPIN_AUDIO_COMPONENT_H
