/**
 * @file keepalive_monitor.h
 * @brief Periodic application-level heartbeat on the progress stream.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace uploadwatch::stream {

namespace net = boost::asio;

/**
 * Sends {"type":"heartbeat","timestamp":<ms>} every interval while running.
 * The first beat goes out one interval after start(). A failed send stops
 * the monitor for good; recovering the connection is not its job.
 */
class KeepaliveMonitor {
public:
    // Returns false when the frame could not be written.
    using SendFn = std::function<bool(const std::string&)>;

    KeepaliveMonitor(net::io_context& ioc, std::chrono::milliseconds interval);
    ~KeepaliveMonitor();

    KeepaliveMonitor(const KeepaliveMonitor&) = delete;
    KeepaliveMonitor& operator=(const KeepaliveMonitor&) = delete;

    void start(SendFn send);
    void stop();

    bool running() const { return running_; }
    std::uint64_t beats_sent() const { return beats_sent_; }

private:
    void schedule();
    void on_tick();

    net::steady_timer timer_;
    std::chrono::milliseconds interval_;
    SendFn send_;
    bool running_{false};
    std::uint64_t generation_{0};
    std::uint64_t beats_sent_{0};
    std::shared_ptr<bool> lifetime_{std::make_shared<bool>(true)};
};

} // namespace uploadwatch::stream
