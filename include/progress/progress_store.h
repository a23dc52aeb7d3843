/**
 * @file progress_store.h
 * @brief Observable holder of the current ProgressState.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <map>

#include "progress/progress_state.h"

namespace uploadwatch::progress {

class ProgressStore {
public:
    using Listener = std::function<void(const ProgressState&)>;
    using SubscriptionId = std::uint64_t;

    SubscriptionId subscribe(Listener listener);
    void unsubscribe(SubscriptionId id);

    // Runs the reducer; listeners are notified only when the state changed.
    bool apply(const protocol::ProtocolMessage& msg);

    // Back to the initial state (used on cancellation).
    void reset();

    const ProgressState& state() const { return state_; }

private:
    void notify();

    ProgressState state_;
    std::map<SubscriptionId, Listener> listeners_;
    SubscriptionId next_id_{1};
};

} // namespace uploadwatch::progress
