/**
 * @file completion_reconciler.cpp
 */

#include "upload/completion_reconciler.h"

#include <spdlog/spdlog.h>

namespace uploadwatch::upload {

CompletionReconciler::CompletionReconciler(net::io_context& ioc,
                                           std::chrono::milliseconds fallback,
                                           ConfirmedFn stream_confirmed)
    : fallback_timer_(ioc), fallback_(fallback), stream_confirmed_(std::move(stream_confirmed)) {}

CompletionReconciler::~CompletionReconciler() {
    fallback_timer_.cancel();
}

void CompletionReconciler::on_sync_response(const SyncUploadResponse& response) {
    if (delivered_) {
        spdlog::debug("[Reconciler] synchronous response after delivery; ignored");
        return;
    }

    if (response.is_conflict()) {
        spdlog::warn("[Reconciler] duplicate upload detected (existing={})",
                     response.duplicate->existing_upload_id);
        UploadOutcome outcome;
        outcome.kind = UploadOutcomeKind::Conflict;
        outcome.source = OutcomeSource::Synchronous;
        outcome.payload = response.payload;
        outcome.error = response.error;
        outcome.duplicate = response.duplicate;
        outcome.error_kind = ErrorKind::ConflictError;
        deliver(std::move(outcome));
        if (teardown_cb_) teardown_cb_();
        return;
    }

    if (stream_confirmed_ && stream_confirmed_()) {
        spdlog::info("[Reconciler] stream confirmed; deferring to it for up to {} ms", fallback_.count());
        pending_sync_ = response;
        std::weak_ptr<bool> alive = lifetime_;
        fallback_timer_.expires_after(fallback_);
        fallback_timer_.async_wait([this, alive](const boost::system::error_code& ec) {
            if (ec || alive.expired()) return;
            if (delivered_ || !pending_sync_) return;
            spdlog::warn("[Reconciler] no terminal frame within {} ms; using synchronous result",
                         fallback_.count());
            const SyncUploadResponse held = *pending_sync_;
            deliver_sync(held, OutcomeSource::Fallback);
        });
        return;
    }

    spdlog::info("[Reconciler] stream not confirmed; using synchronous result");
    deliver_sync(response, OutcomeSource::Synchronous);
}

void CompletionReconciler::on_stream_state(const progress::ProgressState& state) {
    if (delivered_ || !state.is_terminal()) return;

    UploadOutcome outcome;
    outcome.source = OutcomeSource::Stream;
    switch (state.terminal.kind) {
        case progress::OutcomeKind::Success:
            outcome.kind = UploadOutcomeKind::Success;
            outcome.payload = state.terminal.payload;
            break;
        case progress::OutcomeKind::Cancelled:
            outcome.kind = UploadOutcomeKind::Cancelled;
            outcome.error = state.terminal.error;
            break;
        default:
            outcome.kind = UploadOutcomeKind::Failure;
            outcome.error = state.terminal.error;
            break;
    }
    fallback_timer_.cancel();
    deliver(std::move(outcome));
}

void CompletionReconciler::on_stream_lost() {
    if (!waiting_on_stream()) return;
    spdlog::warn("[Reconciler] stream gone while waiting; using synchronous result");
    fallback_timer_.cancel();
    const SyncUploadResponse held = *pending_sync_;
    deliver_sync(held, OutcomeSource::Synchronous);
}

void CompletionReconciler::on_cancelled() {
    if (delivered_) return;
    fallback_timer_.cancel();
    UploadOutcome outcome;
    outcome.kind = UploadOutcomeKind::Cancelled;
    outcome.source = OutcomeSource::Local;
    outcome.error = "cancelled by user";
    deliver(std::move(outcome));
}

void CompletionReconciler::deliver_sync(const SyncUploadResponse& response, OutcomeSource source) {
    UploadOutcome outcome;
    outcome.source = source;
    outcome.payload = response.payload;
    if (response.success) {
        outcome.kind = UploadOutcomeKind::Success;
    } else {
        outcome.kind = UploadOutcomeKind::Failure;
        outcome.error = response.error.empty() ? std::string("upload failed") : response.error;
    }
    deliver(std::move(outcome));
    if (teardown_cb_) teardown_cb_();
}

void CompletionReconciler::deliver(UploadOutcome outcome) {
    if (delivered_) return;
    delivered_ = true;
    pending_sync_.reset();
    spdlog::info("[Reconciler] outcome {} via {}", to_string(outcome.kind), to_string(outcome.source));
    if (outcome_cb_) outcome_cb_(outcome);
}

} // namespace uploadwatch::upload
