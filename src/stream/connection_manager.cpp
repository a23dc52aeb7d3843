/**
 * @file connection_manager.cpp
 */

#include "stream/connection_manager.h"
#include "protocol/message_codec.h"
#include "session/session_id.h"
#include "utils/string_utils.h"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace uploadwatch::stream {

ConnectionManager::ConnectionManager(net::io_context& ioc,
                                     const config::ProgressClientConfig& config,
                                     TransportFactory factory)
    : config_(config),
      factory_(std::move(factory)),
      connect_timer_(ioc),
      backoff_timer_(ioc),
      keepalive_(ioc, config.heartbeat_interval) {}

ConnectionManager::~ConnectionManager() {
    ++generation_;
    cancel_timers();
    keepalive_.stop();
    if (transport_) {
        transport_->close(ws::close_code::kNormal, "Client disconnect");
    }
}

std::chrono::milliseconds ConnectionManager::backoff_delay(int attempts,
                                                           std::chrono::milliseconds base,
                                                           std::chrono::milliseconds cap) {
    // 2^30 * base already dwarfs any sane cap; stop shifting there.
    const int shift = std::clamp(attempts, 0, 30);
    const auto scaled = base.count() * (std::int64_t{1} << shift);
    if (scaled <= 0 || scaled > cap.count()) return cap;
    return std::chrono::milliseconds(scaled);
}

void ConnectionManager::connect(const std::string& correlation_id,
                                const std::optional<std::string>& bearer_token) {
    if (state_ == ConnectionState::Connecting ||
        state_ == ConnectionState::Connected ||
        state_ == ConnectionState::Reconnecting) {
        spdlog::warn("[Conn] connect({}) while {}; dropping previous stream",
                     correlation_id, to_string(state_));
        disconnect();
    }

    correlation_id_ = correlation_id;
    bearer_token_ = bearer_token;
    if (bearer_token_ && bearer_token_->empty()) bearer_token_.reset();
    reconnect_attempts_ = 0;

    if (config::effective_ws_base_url(config_).empty()) {
        spdlog::error("[Conn] no usable websocket base url (api_url={})", config_.api_url);
        set_state(ConnectionState::Closed);
        if (error_cb_) error_cb_(SessionError{ErrorKind::TransportError, "no usable websocket base url"});
        return;
    }

    if (!bearer_token_) {
        spdlog::warn("[Conn] no bearer token for upload {}; tracking progress anonymously", correlation_id_);
    }
    open_transport(ConnectionState::Connecting);
}

void ConnectionManager::disconnect() {
    ++generation_;
    cancel_timers();
    keepalive_.stop();
    if (state_ == ConnectionState::Closed) return;

    if (transport_) {
        transport_->close(ws::close_code::kNormal, "Client disconnect");
    }
    acknowledged_ = false;
    spdlog::info("[Conn] disconnected upload={}", correlation_id_);
    set_state(ConnectionState::Closed);
}

bool ConnectionManager::send(const std::string& text) {
    if (state_ != ConnectionState::Connected || !transport_) return false;
    return transport_->send(text);
}

bool ConnectionManager::request_status() {
    const bool ok = send(protocol::encode_get_status(protocol::now_epoch_ms()));
    if (!ok) spdlog::debug("[Conn] get_status not sent (state={})", to_string(state_));
    return ok;
}

void ConnectionManager::mark_acknowledged() {
    if (state_ == ConnectionState::Connected) acknowledged_ = true;
}

std::string ConnectionManager::build_url() const {
    std::string url = config::effective_ws_base_url(config_);
    url += config_.progress_path;
    url += utils::url_encode(correlation_id_);
    url += "?session_id=" + utils::url_encode(sub_session_id_);
    if (bearer_token_) {
        url += "&token=" + utils::url_encode(*bearer_token_);
    }
    return url;
}

void ConnectionManager::open_transport(ConnectionState attempt_state) {
    const auto gen = ++generation_;
    sub_session_id_ = session::generate_sub_session_id();
    acknowledged_ = false;
    set_state(attempt_state);

    const std::string url = build_url();
    spdlog::info("[Conn] opening {} (attempt {}/{})",
                 utils::mask_token_in_url(url), reconnect_attempts_, config_.max_reconnect_attempts);

    // Replacing the previous transport detaches its handlers.
    transport_ = factory_();
    if (!transport_) {
        spdlog::error("[Conn] transport factory returned null");
        handle_connection_lost(ErrorKind::TransportError, "transport unavailable");
        return;
    }

    std::weak_ptr<bool> alive = lifetime_;
    ws::WsHandlers handlers;
    handlers.on_open = [this, gen, alive]() {
        if (!alive.expired()) handle_open(gen);
    };
    handlers.on_message = [this, gen, alive](const std::string& text) {
        if (!alive.expired()) handle_message(gen, text);
    };
    handlers.on_error = [this, gen, alive](const std::string& what) {
        if (!alive.expired()) handle_transport_error(gen, what);
    };
    handlers.on_close = [this, gen, alive](const ws::CloseInfo& info) {
        if (!alive.expired()) handle_close(gen, info);
    };

    connect_timer_.expires_after(config_.connect_timeout);
    connect_timer_.async_wait([this, gen, alive](const boost::system::error_code& ec) {
        if (ec || alive.expired()) return;
        handle_connect_timeout(gen);
    });

    transport_->open(url, std::move(handlers));
}

void ConnectionManager::handle_open(std::uint64_t gen) {
    if (gen != generation_) return;
    connect_timer_.cancel();
    reconnect_attempts_ = 0;
    set_state(ConnectionState::Connected);
    spdlog::info("[Conn] connected upload={} session_id={}", correlation_id_, sub_session_id_);

    if (!send(protocol::encode_ping(protocol::now_epoch_ms()))) {
        spdlog::warn("[Conn] initial ping could not be sent");
    }
    keepalive_.start([this](const std::string& frame) { return send(frame); });
}

void ConnectionManager::handle_message(std::uint64_t gen, const std::string& text) {
    if (gen != generation_) return;
    if (message_cb_) message_cb_(text);
}

void ConnectionManager::handle_transport_error(std::uint64_t gen, const std::string& what) {
    if (gen != generation_) return;
    // Absorbed; the close that follows drives reconnection.
    spdlog::warn("[Conn] transport error upload={}: {}", correlation_id_, what);
}

void ConnectionManager::handle_close(std::uint64_t gen, const ws::CloseInfo& info) {
    if (gen != generation_) return;
    connect_timer_.cancel();
    keepalive_.stop();
    acknowledged_ = false;

    if (info.code == ws::close_code::kNormal) {
        spdlog::info("[Conn] server closed stream normally upload={}", correlation_id_);
        set_state(ConnectionState::Disconnected);
        return;
    }
    if (info.code == ws::close_code::kPolicyViolation) {
        spdlog::warn("[Conn] server rejected stream upload={} code=1008 reason='{}'; not reconnecting",
                     correlation_id_, info.reason);
        set_state(ConnectionState::Closed);
        if (error_cb_) {
            error_cb_(SessionError{ErrorKind::ProtocolError,
                                   "server rejected connection (1008): " + info.reason});
        }
        return;
    }
    handle_connection_lost(ErrorKind::TransportError,
                           "closed with code " + std::to_string(info.code) +
                           (info.reason.empty() ? std::string{} : ": " + info.reason));
}

void ConnectionManager::handle_connect_timeout(std::uint64_t gen) {
    if (gen != generation_) return;
    if (state_ != ConnectionState::Connecting && state_ != ConnectionState::Reconnecting) return;

    spdlog::error("[Conn] connect timeout after {} ms upload={}", config_.connect_timeout.count(), correlation_id_);
    // Supersede the attempt first so its late close is ignored.
    ++generation_;
    if (transport_) transport_->close(ws::close_code::kNormal, "connect timeout");
    handle_connection_lost(ErrorKind::ConnectTimeout, "connect timeout");
}

void ConnectionManager::handle_connection_lost(ErrorKind cause, const std::string& detail) {
    if (reconnect_attempts_ < config_.max_reconnect_attempts) {
        const auto delay = backoff_delay(reconnect_attempts_, config_.backoff_base, config_.backoff_cap);
        ++reconnect_attempts_;
        set_state(ConnectionState::Reconnecting);
        spdlog::warn("[Conn] stream lost upload={} ({}: {}); reconnect {}/{} in {} ms",
                     correlation_id_, to_string(cause), detail,
                     reconnect_attempts_, config_.max_reconnect_attempts, delay.count());

        const auto gen = generation_;
        std::weak_ptr<bool> alive = lifetime_;
        backoff_timer_.expires_after(delay);
        backoff_timer_.async_wait([this, gen, alive](const boost::system::error_code& ec) {
            if (ec || alive.expired()) return;
            if (gen != generation_ || state_ != ConnectionState::Reconnecting) return;
            open_transport(ConnectionState::Reconnecting);
        });
        return;
    }

    spdlog::error("[Conn] giving up on upload={} after {} reconnect attempts (last: {}: {})",
                  correlation_id_, reconnect_attempts_, to_string(cause), detail);
    set_state(ConnectionState::Closed);
    if (error_cb_) {
        error_cb_(SessionError{ErrorKind::ReconnectExhausted,
                               "reconnect attempts exhausted after " + std::to_string(reconnect_attempts_) +
                               " retries; last error: " + to_string(cause) + ": " + detail,
                               cause});
    }
}

void ConnectionManager::set_state(ConnectionState next) {
    if (next == state_) return;
    const auto prev = state_;
    state_ = next;
    spdlog::debug("[Conn] state {} -> {} upload={}", to_string(prev), to_string(next), correlation_id_);
    if (state_cb_) state_cb_(next);
}

void ConnectionManager::cancel_timers() {
    connect_timer_.cancel();
    backoff_timer_.cancel();
}

} // namespace uploadwatch::stream
