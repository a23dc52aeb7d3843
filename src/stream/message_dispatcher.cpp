/**
 * @file message_dispatcher.cpp
 */

#include "stream/message_dispatcher.h"
#include "protocol/message_codec.h"

#include <spdlog/spdlog.h>

namespace uploadwatch::stream {

using protocol::MessageType;

namespace {
constexpr std::size_t kLoggedFrameBytes = 256;
} // namespace

MessageDispatcher::MessageDispatcher(net::io_context& ioc,
                                     ConnectionManager& connection,
                                     progress::ProgressStore& store,
                                     std::chrono::milliseconds close_grace)
    : connection_(connection), store_(store), close_grace_(close_grace), grace_timer_(ioc) {}

MessageDispatcher::~MessageDispatcher() {
    grace_timer_.cancel();
}

void MessageDispatcher::handle_frame(const std::string& text) {
    std::string why;
    auto parsed = protocol::parse_frame(text, &why);
    if (!parsed) {
        ++malformed_frames_;
        last_malformed_ = SessionError{ErrorKind::MalformedFrame, why, std::nullopt};
        spdlog::warn("[Dispatcher] {} dropped ({}): {}", to_string(ErrorKind::MalformedFrame), why,
                     text.substr(0, kLoggedFrameBytes));
        return;
    }
    const auto& msg = *parsed;

    switch (msg.type) {
        case MessageType::Ping:
            if (!connection_.send(protocol::encode_pong(protocol::now_epoch_ms()))) {
                spdlog::warn("[Dispatcher] could not answer server ping");
            } else {
                spdlog::debug("[Dispatcher] answered server ping");
            }
            return;
        case MessageType::Pong:
            spdlog::debug("[Dispatcher] pong received");
            connection_.mark_acknowledged();
            return;
        case MessageType::ConnectionEstablished:
            spdlog::info("[Dispatcher] connection confirmed by server upload={}", msg.upload_id);
            connection_.mark_acknowledged();
            return;
        case MessageType::Heartbeat:
            spdlog::debug("[Dispatcher] server heartbeat");
            return;
        case MessageType::Status:
            spdlog::info("[Dispatcher] status: {}", msg.raw.dump());
            return;
        default:
            break;
    }

    const bool was_terminal = store_.state().is_terminal();
    if (was_terminal) {
        spdlog::debug("[Dispatcher] ignoring {} after terminal outcome", protocol::to_string(msg.type));
        return;
    }

    store_.apply(msg);
    spdlog::debug("[Dispatcher] {} -> stage={} pct={:.1f}", protocol::to_string(msg.type),
                  store_.state().stage, store_.state().percentage);

    if (msg.type == MessageType::StepProgress && msg.stage_details &&
        msg.current_stage && *msg.current_stage == "metadata_extraction") {
        if (metadata_cb_) metadata_cb_(*msg.stage_details);
    }

    if (store_.state().is_terminal()) {
        on_terminal(store_.state());
    } else if (msg.type == MessageType::ExtractionComplete) {
        spdlog::warn("[Dispatcher] extraction complete without results; closing stream in {} ms",
                     close_grace_.count());
        schedule_close();
    }
}

void MessageDispatcher::on_terminal(const progress::ProgressState& state) {
    switch (state.terminal.kind) {
        case progress::OutcomeKind::Success:
            spdlog::info("[Dispatcher] extraction complete; closing stream in {} ms", close_grace_.count());
            schedule_close();
            break;
        case progress::OutcomeKind::Cancelled:
            spdlog::info("[Dispatcher] extraction cancelled by server; closing stream");
            connection_.disconnect();
            break;
        case progress::OutcomeKind::Failure:
            // Left open; the server decides when to close.
            spdlog::error("[Dispatcher] extraction failed: {}", state.terminal.error);
            break;
        default:
            break;
    }
}

void MessageDispatcher::schedule_close() {
    std::weak_ptr<bool> alive = lifetime_;
    grace_timer_.expires_after(close_grace_);
    grace_timer_.async_wait([this, alive](const boost::system::error_code& ec) {
        if (ec || alive.expired()) return;
        connection_.disconnect();
    });
}

void MessageDispatcher::cancel_pending_close() {
    grace_timer_.cancel();
}

} // namespace uploadwatch::stream
