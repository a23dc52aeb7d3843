/**
 * @file completion_reconciler.h
 * @brief Arbitrates between the synchronous upload response and the stream's
 *        terminal state so the caller sees exactly one outcome.
 */

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <nlohmann/json.hpp>

#include "core/errors/session_error.h"
#include "progress/progress_state.h"
#include "upload/upload_api.h"

namespace uploadwatch::upload {

namespace net = boost::asio;

enum class UploadOutcomeKind {
    Success,
    Failure,
    Cancelled,
    Conflict
};

inline std::string to_string(UploadOutcomeKind kind) {
    switch (kind) {
        case UploadOutcomeKind::Success: return "SUCCESS";
        case UploadOutcomeKind::Failure: return "FAILURE";
        case UploadOutcomeKind::Cancelled: return "CANCELLED";
        case UploadOutcomeKind::Conflict: return "CONFLICT";
        default: return "UNKNOWN";
    }
}

// Which path produced the outcome.
enum class OutcomeSource {
    Stream,
    Synchronous,
    Fallback,
    Local
};

inline std::string to_string(OutcomeSource source) {
    switch (source) {
        case OutcomeSource::Stream: return "STREAM";
        case OutcomeSource::Synchronous: return "SYNCHRONOUS";
        case OutcomeSource::Fallback: return "FALLBACK";
        case OutcomeSource::Local: return "LOCAL";
        default: return "UNKNOWN";
    }
}

struct UploadOutcome {
    UploadOutcomeKind kind{UploadOutcomeKind::Failure};
    OutcomeSource source{OutcomeSource::Synchronous};
    nlohmann::json payload;
    std::string error;
    std::optional<DuplicateInfo> duplicate;
    std::optional<ErrorKind> error_kind;          // ConflictError for duplicates
};

/**
 * @class CompletionReconciler
 *
 * Precedence:
 *  - a duplicate conflict from the synchronous response is delivered at once;
 *  - if the stream is confirmed when the synchronous response arrives, the
 *    stream decides and a fallback timer bounds the wait, after which the
 *    synchronous payload is delivered;
 *  - otherwise the synchronous payload is delivered directly;
 *  - losing the stream while waiting delivers the held payload immediately.
 *
 * The first outcome wins; everything after it is dropped.
 */
class CompletionReconciler {
public:
    using OutcomeCallback = std::function<void(const UploadOutcome&)>;
    using ConfirmedFn = std::function<bool()>;
    using TeardownFn = std::function<void()>;

    CompletionReconciler(net::io_context& ioc,
                         std::chrono::milliseconds fallback,
                         ConfirmedFn stream_confirmed);
    ~CompletionReconciler();

    CompletionReconciler(const CompletionReconciler&) = delete;
    CompletionReconciler& operator=(const CompletionReconciler&) = delete;

    void set_outcome_callback(OutcomeCallback cb) { outcome_cb_ = std::move(cb); }

    // Called after a synchronous-path delivery; the stream is no longer needed.
    void set_teardown_callback(TeardownFn cb) { teardown_cb_ = std::move(cb); }

    void on_sync_response(const SyncUploadResponse& response);
    void on_stream_state(const progress::ProgressState& state);
    void on_stream_lost();
    void on_cancelled();

    bool delivered() const { return delivered_; }
    bool waiting_on_stream() const { return pending_sync_.has_value() && !delivered_; }

private:
    void deliver(UploadOutcome outcome);
    void deliver_sync(const SyncUploadResponse& response, OutcomeSource source);

    net::steady_timer fallback_timer_;
    std::chrono::milliseconds fallback_;
    ConfirmedFn stream_confirmed_;
    OutcomeCallback outcome_cb_;
    TeardownFn teardown_cb_;

    std::optional<SyncUploadResponse> pending_sync_;
    bool delivered_{false};
    std::shared_ptr<bool> lifetime_{std::make_shared<bool>(true)};
};

} // namespace uploadwatch::upload
