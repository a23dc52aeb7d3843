/**
 * @file upload_session.cpp
 */

#include "session/upload_session.h"
#include "session/session_id.h"

#include <spdlog/spdlog.h>

namespace uploadwatch::session {

UploadSession::UploadSession(net::io_context& ioc,
                             const config::ProgressClientConfig& config,
                             std::shared_ptr<upload::IUploadApi> api,
                             stream::TransportFactory transport_factory,
                             std::string bearer_token)
    : api_(std::move(api)),
      bearer_token_(std::move(bearer_token)),
      correlation_id_(generate_correlation_id()),
      connection_(ioc, config, std::move(transport_factory)),
      dispatcher_(ioc, connection_, store_, config.completion_close_grace),
      reconciler_(ioc, config.completion_fallback, [this]() { return connection_.is_confirmed(); }) {
    connection_.set_message_callback([this](const std::string& text) { dispatcher_.handle_frame(text); });
    connection_.set_state_callback([this](stream::ConnectionState state) { on_connection_state(state); });
    connection_.set_error_callback([this](const SessionError& error) {
        spdlog::error("[Session] {} connection error {}: {}", correlation_id_, to_string(error.kind), error.message);
        if (callbacks_.on_connection_error) callbacks_.on_connection_error(error);
    });
    dispatcher_.set_metadata_callback([this](const nlohmann::json& details) {
        if (callbacks_.on_metadata) callbacks_.on_metadata(details);
    });
    store_.subscribe([this](const progress::ProgressState& state) {
        if (callbacks_.on_progress) callbacks_.on_progress(state);
        reconciler_.on_stream_state(state);
    });
    reconciler_.set_outcome_callback([this](const upload::UploadOutcome& outcome) {
        if (callbacks_.on_outcome) callbacks_.on_outcome(outcome);
    });
    reconciler_.set_teardown_callback([this]() { connection_.disconnect(); });
}

UploadSession::~UploadSession() {
    // No outcome delivery from inside the destructor.
    callbacks_ = SessionCallbacks{};
    connection_.set_state_callback(nullptr);
    connection_.disconnect();
}

void UploadSession::set_callbacks(SessionCallbacks callbacks) {
    callbacks_ = std::move(callbacks);
}

void UploadSession::start(upload::UploadRequest request) {
    if (started_) {
        spdlog::warn("[Session] {} already started", correlation_id_);
        return;
    }
    started_ = true;

    request.upload_id = correlation_id_;
    request.bearer_token = bearer_token_;
    spdlog::info("[Session] starting upload {} file={}", correlation_id_, request.file_path);

    connection_.connect(correlation_id_,
                        bearer_token_.empty() ? std::nullopt : std::optional<std::string>(bearer_token_));

    std::weak_ptr<UploadSession> weak = weak_from_this();
    api_->submit(request, [weak](upload::SyncUploadResponse response) {
        auto self = weak.lock();
        if (!self) return;
        if (self->cancelled_) {
            spdlog::debug("[Session] {} synchronous response after cancel; ignored", self->correlation_id_);
            return;
        }
        self->reconciler_.on_sync_response(response);
    });
}

void UploadSession::cancel() {
    if (cancelled_) return;
    cancelled_ = true;
    spdlog::info("[Session] cancelling upload {}", correlation_id_);

    // Local outcome first so the disconnect below is not read as a lost stream.
    reconciler_.on_cancelled();
    dispatcher_.cancel_pending_close();
    connection_.disconnect();
    store_.reset();

    const std::string id = correlation_id_;
    api_->cancel(correlation_id_, bearer_token_, [id](bool accepted, const std::string& detail) {
        if (accepted) {
            spdlog::info("[Session] server acknowledged cancel for {}", id);
        } else {
            spdlog::warn("[Session] server cancel for {} failed ({}); local state already reset", id, detail);
        }
    });
}

void UploadSession::on_connection_state(stream::ConnectionState state) {
    if (state == stream::ConnectionState::Closed || state == stream::ConnectionState::Disconnected) {
        reconciler_.on_stream_lost();
    }
}

} // namespace uploadwatch::session
