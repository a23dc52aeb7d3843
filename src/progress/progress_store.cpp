/**
 * @file progress_store.cpp
 */

#include "progress/progress_store.h"

#include <vector>

namespace uploadwatch::progress {

ProgressStore::SubscriptionId ProgressStore::subscribe(Listener listener) {
    const auto id = next_id_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void ProgressStore::unsubscribe(SubscriptionId id) {
    listeners_.erase(id);
}

bool ProgressStore::apply(const protocol::ProtocolMessage& msg) {
    ProgressState next = reduce(state_, msg);
    if (next == state_) return false;
    state_ = std::move(next);
    notify();
    return true;
}

void ProgressStore::reset() {
    if (state_ == ProgressState{}) return;
    state_ = ProgressState{};
    notify();
}

void ProgressStore::notify() {
    // Listeners may unsubscribe while being notified.
    std::vector<Listener> snapshot;
    snapshot.reserve(listeners_.size());
    for (const auto& [id, fn] : listeners_) snapshot.push_back(fn);
    for (const auto& fn : snapshot) {
        if (fn) fn(state_);
    }
}

} // namespace uploadwatch::progress
