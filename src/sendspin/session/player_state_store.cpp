#include "player_state_store.h"

#include <vector>

namespace sendspin {
namespace audio {

PlayerStateStore::PlayerStateStore()
    : current_(std::make_shared<const PlayerState>()) {}

PlayerStateStore::Snapshot PlayerStateStore::get() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return current_;
}

PlayerStateStore::Snapshot PlayerStateStore::update(const std::function<void(PlayerState&)>& mutator) {
    std::lock_guard<std::mutex> update_lock(update_mutex_);

    auto next = std::make_shared<PlayerState>(*get());
    mutator(*next);
    Snapshot published = next;
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        current_ = published;
    }

    std::vector<Subscriber> subscribers;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        subscribers.reserve(subscribers_.size());
        for (const auto& entry : subscribers_) {
            subscribers.push_back(entry.second);
        }
    }
    for (const auto& subscriber : subscribers) {
        subscriber(published);
    }
    return published;
}

PlayerStateStore::SubscriptionId PlayerStateStore::subscribe(Subscriber subscriber) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    const SubscriptionId id = next_id_++;
    subscribers_.emplace(id, std::move(subscriber));
    return id;
}

void PlayerStateStore::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    subscribers_.erase(id);
}

} // namespace audio
} // namespace sendspin
