/**
 * @file connection_manager.h
 * @brief Owns the progress stream for one upload: connect, reconnect with
 *        backoff, connect timeout and explicit disconnect.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "core/config/progress_config.h"
#include "core/errors/session_error.h"
#include "core/net/ws_client.h"
#include "stream/keepalive_monitor.h"

namespace uploadwatch::stream {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting,
    Closed
};

inline std::string to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "DISCONNECTED";
        case ConnectionState::Connecting: return "CONNECTING";
        case ConnectionState::Connected: return "CONNECTED";
        case ConnectionState::Reconnecting: return "RECONNECTING";
        case ConnectionState::Closed: return "CLOSED";
        default: return "UNKNOWN";
    }
}

// One fresh transport per connection attempt.
using TransportFactory = std::function<std::unique_ptr<ws::WsClient>()>;

/**
 * @class ConnectionManager
 * @brief Single logical stream keyed by a correlation id.
 *
 * Every attempt gets a new transport and a new sub-session id; events from a
 * superseded transport are ignored. Abnormal closes are retried after
 * min(backoff_base * 2^attempts, backoff_cap) until max_reconnect_attempts is
 * reached, after which the state is Closed and a ReconnectExhausted error is
 * reported. Normal (1000) and policy (1008) closes are never retried.
 *
 * All methods and callbacks run on the io_context thread.
 */
class ConnectionManager {
public:
    using MessageCallback = std::function<void(const std::string&)>;
    using StateCallback = std::function<void(ConnectionState)>;
    using ErrorCallback = std::function<void(const SessionError&)>;

    ConnectionManager(net::io_context& ioc,
                      const config::ProgressClientConfig& config,
                      TransportFactory factory);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    void set_message_callback(MessageCallback cb) { message_cb_ = std::move(cb); }
    void set_state_callback(StateCallback cb) { state_cb_ = std::move(cb); }
    void set_error_callback(ErrorCallback cb) { error_cb_ = std::move(cb); }

    // An empty or absent token connects anonymously.
    void connect(const std::string& correlation_id, const std::optional<std::string>& bearer_token);

    // Close 1000 "Client disconnect", cancel all timers, state Closed. Idempotent.
    void disconnect();

    // Writes through the current transport; false when not connected.
    bool send(const std::string& text);

    // Ask the server for a status snapshot ({"type":"get_status"}).
    bool request_status();

    // A pong or connection_established arrived on the current connection.
    void mark_acknowledged();

    // Connected and acknowledged by the server.
    bool is_confirmed() const { return state_ == ConnectionState::Connected && acknowledged_; }

    ConnectionState state() const { return state_; }
    int reconnect_attempts() const { return reconnect_attempts_; }
    const std::string& correlation_id() const { return correlation_id_; }
    const std::string& sub_session_id() const { return sub_session_id_; }
    const KeepaliveMonitor& keepalive() const { return keepalive_; }

    static std::chrono::milliseconds backoff_delay(int attempts,
                                                   std::chrono::milliseconds base,
                                                   std::chrono::milliseconds cap);

private:
    void open_transport(ConnectionState attempt_state);
    std::string build_url() const;

    void handle_open(std::uint64_t gen);
    void handle_message(std::uint64_t gen, const std::string& text);
    void handle_transport_error(std::uint64_t gen, const std::string& what);
    void handle_close(std::uint64_t gen, const ws::CloseInfo& info);
    void handle_connect_timeout(std::uint64_t gen);
    void handle_connection_lost(ErrorKind cause, const std::string& detail);

    void set_state(ConnectionState next);
    void cancel_timers();

    config::ProgressClientConfig config_;
    TransportFactory factory_;

    std::unique_ptr<ws::WsClient> transport_;
    net::steady_timer connect_timer_;
    net::steady_timer backoff_timer_;
    KeepaliveMonitor keepalive_;

    std::string correlation_id_;
    std::optional<std::string> bearer_token_;
    std::string sub_session_id_;

    ConnectionState state_{ConnectionState::Disconnected};
    int reconnect_attempts_{0};
    bool acknowledged_{false};
    std::uint64_t generation_{0};

    MessageCallback message_cb_;
    StateCallback state_cb_;
    ErrorCallback error_cb_;

    std::shared_ptr<bool> lifetime_{std::make_shared<bool>(true)};
};

} // namespace uploadwatch::stream
