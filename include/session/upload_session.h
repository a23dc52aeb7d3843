/**
 * @file upload_session.h
 * @brief One upload end to end: correlation id, progress stream, synchronous
 *        request and completion arbitration.
 */

#pragma once

#include <functional>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

#include "core/config/progress_config.h"
#include "core/errors/session_error.h"
#include "progress/progress_store.h"
#include "stream/connection_manager.h"
#include "stream/message_dispatcher.h"
#include "upload/completion_reconciler.h"
#include "upload/upload_api.h"

namespace uploadwatch::session {

namespace net = boost::asio;

struct SessionCallbacks {
    std::function<void(const progress::ProgressState&)> on_progress;
    std::function<void(const upload::UploadOutcome&)> on_outcome;
    std::function<void(const SessionError&)> on_connection_error;
    std::function<void(const nlohmann::json&)> on_metadata;
};

/**
 * @class UploadSession
 * @brief Wires ConnectionManager -> MessageDispatcher -> ProgressStore ->
 *        CompletionReconciler for a single upload.
 *
 * Must be owned by a std::shared_ptr; asynchronous API callbacks hold only a
 * weak reference. Runs entirely on the given io_context.
 */
class UploadSession : public std::enable_shared_from_this<UploadSession> {
public:
    UploadSession(net::io_context& ioc,
                  const config::ProgressClientConfig& config,
                  std::shared_ptr<upload::IUploadApi> api,
                  stream::TransportFactory transport_factory,
                  std::string bearer_token);
    ~UploadSession();

    UploadSession(const UploadSession&) = delete;
    UploadSession& operator=(const UploadSession&) = delete;

    void set_callbacks(SessionCallbacks callbacks);

    // Opens the stream, then issues the synchronous upload. upload_id and
    // bearer_token on the request are filled in by the session.
    void start(upload::UploadRequest request);

    // Best-effort server cancel; local teardown and progress reset happen
    // immediately. Delivers Cancelled if no outcome was delivered yet.
    void cancel();

    bool request_status() { return connection_.request_status(); }

    const std::string& correlation_id() const { return correlation_id_; }
    bool finished() const { return reconciler_.delivered(); }
    const progress::ProgressState& progress() const { return store_.state(); }
    const stream::ConnectionManager& connection() const { return connection_; }

private:
    void on_connection_state(stream::ConnectionState state);

    std::shared_ptr<upload::IUploadApi> api_;
    std::string bearer_token_;
    std::string correlation_id_;

    progress::ProgressStore store_;
    stream::ConnectionManager connection_;
    stream::MessageDispatcher dispatcher_;
    upload::CompletionReconciler reconciler_;

    SessionCallbacks callbacks_;
    bool started_{false};
    bool cancelled_{false};
};

} // namespace uploadwatch::session
