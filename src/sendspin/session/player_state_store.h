#pragma once

#include "../sendspin_types.h"

#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace sendspin {
namespace audio {

/**
 * @class PlayerStateStore
 * @brief Publishes `PlayerState` as immutable snapshots.
 * @details Writers copy the current snapshot, mutate the copy and swap it in.
 *          Readers always see a complete snapshot. Subscribers are called after
 *          every update, in update order, on the writer's thread; they must not
 *          call `update()` themselves.
 */
class PlayerStateStore {
public:
    using Snapshot = std::shared_ptr<const PlayerState>;
    using Subscriber = std::function<void(const Snapshot&)>;
    using SubscriptionId = int;

    PlayerStateStore();

    Snapshot get() const;

    /** @brief Applies `mutator` to a copy of the current state and publishes it. */
    Snapshot update(const std::function<void(PlayerState&)>& mutator);

    SubscriptionId subscribe(Subscriber subscriber);
    void unsubscribe(SubscriptionId id);

private:
    std::mutex update_mutex_;
    mutable std::mutex snapshot_mutex_;
    Snapshot current_;

    std::mutex subscribers_mutex_;
    std::map<SubscriptionId, Subscriber> subscribers_;
    SubscriptionId next_id_ = 1;
};

} // namespace audio
} // namespace sendspin
