/**
 * @file keepalive_monitor.cpp
 */

#include "stream/keepalive_monitor.h"
#include "protocol/message_codec.h"

#include <spdlog/spdlog.h>

namespace uploadwatch::stream {

KeepaliveMonitor::KeepaliveMonitor(net::io_context& ioc, std::chrono::milliseconds interval)
    : timer_(ioc), interval_(interval) {}

KeepaliveMonitor::~KeepaliveMonitor() {
    stop();
}

void KeepaliveMonitor::start(SendFn send) {
    stop();
    send_ = std::move(send);
    running_ = true;
    schedule();
    spdlog::debug("[Keepalive] started interval_ms={}", interval_.count());
}

void KeepaliveMonitor::stop() {
    if (!running_) return;
    running_ = false;
    ++generation_;
    timer_.cancel();
    spdlog::debug("[Keepalive] stopped after {} heartbeats", beats_sent_);
}

void KeepaliveMonitor::schedule() {
    timer_.expires_after(interval_);
    const auto gen = generation_;
    std::weak_ptr<bool> alive = lifetime_;
    timer_.async_wait([this, gen, alive](const boost::system::error_code& ec) {
        if (ec || alive.expired()) return;
        if (gen != generation_ || !running_) return;
        on_tick();
    });
}

void KeepaliveMonitor::on_tick() {
    const bool ok = send_ && send_(protocol::encode_heartbeat(protocol::now_epoch_ms()));
    if (!ok) {
        spdlog::warn("[Keepalive] heartbeat send failed; stopping monitor");
        stop();
        return;
    }
    ++beats_sent_;
    spdlog::debug("[Keepalive] heartbeat sent (#{})", beats_sent_);
    schedule();
}

} // namespace uploadwatch::stream
