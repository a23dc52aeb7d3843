/**
 * @file test_completion_reconciler.cpp
 * @brief Unit tests for CompletionReconciler precedence and exactly-once delivery
 */

#include <gtest/gtest.h>
#include "upload/completion_reconciler.h"
#include "support/io_helpers.h"
#include "support/mock_upload_api.h"

#include <vector>

using namespace uploadwatch;
using namespace uploadwatch::upload;
using namespace std::chrono_literals;
using uploadwatch::test::run_for;
using uploadwatch::test::run_until;
using uploadwatch::test::sync_failure;
using uploadwatch::test::sync_success;

namespace {

struct Harness {
    Harness() : reconciler(ioc, 40ms, [this]() { return confirmed; }) {
        reconciler.set_outcome_callback([this](const UploadOutcome& o) { outcomes.push_back(o); });
        reconciler.set_teardown_callback([this]() { ++teardowns; });
    }

    boost::asio::io_context ioc;
    bool confirmed{false};
    CompletionReconciler reconciler;
    std::vector<UploadOutcome> outcomes;
    int teardowns{0};
};

progress::ProgressState terminal_success(nlohmann::json payload) {
    progress::ProgressState s;
    s.percentage = 100.0;
    s.terminal = progress::TerminalOutcome{progress::OutcomeKind::Success, std::move(payload), {}};
    return s;
}

progress::ProgressState terminal_failure(const std::string& error) {
    progress::ProgressState s;
    s.terminal = progress::TerminalOutcome{progress::OutcomeKind::Failure, nlohmann::json{}, error};
    return s;
}

SyncUploadResponse conflict_response() {
    return decode_upload_response(409, R"({"success":false,"status":"duplicate_detected",
        "error":"File already uploaded","duplicate_info":{"type":"file_hash","existing_upload_id":"upload_1_old",
        "existing_file_name":"jan.pdf","existing_upload_date":"2025-01-02T10:00:00","table_count":3}})");
}

} // namespace

// ============================================================================
// TESTS: SYNCHRONOUS PATH
// ============================================================================

TEST(CompletionReconciler, SyncResultUsedWhenStreamNotConfirmed) {
    Harness h;
    h.reconciler.on_sync_response(sync_success({{"success", true}, {"tables", {1, 2}}}));

    ASSERT_EQ(h.outcomes.size(), 1u);
    EXPECT_EQ(h.outcomes[0].kind, UploadOutcomeKind::Success);
    EXPECT_EQ(h.outcomes[0].source, OutcomeSource::Synchronous);
    EXPECT_EQ(h.outcomes[0].payload["tables"].size(), 2u);
    EXPECT_EQ(h.teardowns, 1);
    EXPECT_TRUE(h.reconciler.delivered());
}

TEST(CompletionReconciler, UnsuccessfulSyncPayloadIsFailure) {
    Harness h;
    h.reconciler.on_sync_response(sync_failure("Unsupported file type"));

    ASSERT_EQ(h.outcomes.size(), 1u);
    EXPECT_EQ(h.outcomes[0].kind, UploadOutcomeKind::Failure);
    EXPECT_EQ(h.outcomes[0].error, "Unsupported file type");
    EXPECT_FALSE(h.outcomes[0].error_kind.has_value());
}

TEST(CompletionReconciler, ConflictShortCircuitsEvenWhenConfirmed) {
    Harness h;
    h.confirmed = true;
    h.reconciler.on_sync_response(conflict_response());

    ASSERT_EQ(h.outcomes.size(), 1u);
    EXPECT_EQ(h.outcomes[0].kind, UploadOutcomeKind::Conflict);
    ASSERT_TRUE(h.outcomes[0].error_kind.has_value());
    EXPECT_EQ(*h.outcomes[0].error_kind, ErrorKind::ConflictError);
    ASSERT_TRUE(h.outcomes[0].duplicate.has_value());
    EXPECT_EQ(h.outcomes[0].duplicate->existing_upload_id, "upload_1_old");
    EXPECT_EQ(h.outcomes[0].duplicate->table_count, 3);
    EXPECT_EQ(h.teardowns, 1);

    h.reconciler.on_stream_state(terminal_success({{"tables", nlohmann::json::array()}}));
    run_for(h.ioc, 60ms);
    EXPECT_EQ(h.outcomes.size(), 1u);
}

// ============================================================================
// TESTS: STREAM PATH AND FALLBACK
// ============================================================================

TEST(CompletionReconciler, ConfirmedStreamWinsAndFallbackIsDiscarded) {
    Harness h;
    h.confirmed = true;
    h.reconciler.on_sync_response(sync_success());
    EXPECT_TRUE(h.outcomes.empty());
    EXPECT_TRUE(h.reconciler.waiting_on_stream());

    h.reconciler.on_stream_state(terminal_success({{"tables", {"a"}}}));
    ASSERT_EQ(h.outcomes.size(), 1u);
    EXPECT_EQ(h.outcomes[0].source, OutcomeSource::Stream);
    EXPECT_EQ(h.outcomes[0].payload["tables"][0], "a");

    run_for(h.ioc, 80ms);
    EXPECT_EQ(h.outcomes.size(), 1u);
    EXPECT_EQ(h.teardowns, 0);
}

TEST(CompletionReconciler, FallbackDeliversSyncPayloadAfterTimeout) {
    Harness h;
    h.confirmed = true;
    h.reconciler.on_sync_response(sync_success({{"success", true}, {"upload_id", "u1"}}));

    ASSERT_TRUE(run_until(h.ioc, [&] { return !h.outcomes.empty(); }));
    EXPECT_EQ(h.outcomes[0].kind, UploadOutcomeKind::Success);
    EXPECT_EQ(h.outcomes[0].source, OutcomeSource::Fallback);
    EXPECT_EQ(h.outcomes[0].payload["upload_id"], "u1");
    EXPECT_EQ(h.teardowns, 1);

    h.reconciler.on_stream_state(terminal_success({}));
    EXPECT_EQ(h.outcomes.size(), 1u);
}

TEST(CompletionReconciler, StreamLossWhileWaitingDeliversHeldPayload) {
    Harness h;
    h.confirmed = true;
    h.reconciler.on_sync_response(sync_failure("OCR failed"));
    h.reconciler.on_stream_lost();

    ASSERT_EQ(h.outcomes.size(), 1u);
    EXPECT_EQ(h.outcomes[0].kind, UploadOutcomeKind::Failure);
    EXPECT_EQ(h.outcomes[0].source, OutcomeSource::Synchronous);
    run_for(h.ioc, 60ms);
    EXPECT_EQ(h.outcomes.size(), 1u);
}

TEST(CompletionReconciler, StreamLossWithoutPayloadDoesNothing) {
    Harness h;
    h.reconciler.on_stream_lost();
    EXPECT_TRUE(h.outcomes.empty());
}

TEST(CompletionReconciler, StreamTerminalBeforeSyncResponse) {
    Harness h;
    h.reconciler.on_stream_state(terminal_failure("Table extraction failed"));
    ASSERT_EQ(h.outcomes.size(), 1u);
    EXPECT_EQ(h.outcomes[0].kind, UploadOutcomeKind::Failure);
    EXPECT_EQ(h.outcomes[0].error, "Table extraction failed");

    h.reconciler.on_sync_response(sync_success());
    EXPECT_EQ(h.outcomes.size(), 1u);
}

TEST(CompletionReconciler, NonTerminalStatesAreIgnored) {
    Harness h;
    progress::ProgressState s;
    s.percentage = 50.0;
    h.reconciler.on_stream_state(s);
    EXPECT_TRUE(h.outcomes.empty());
}

// ============================================================================
// TESTS: CANCELLATION
// ============================================================================

TEST(CompletionReconciler, LocalCancelWinsOnce) {
    Harness h;
    h.confirmed = true;
    h.reconciler.on_sync_response(sync_success());
    h.reconciler.on_cancelled();
    h.reconciler.on_cancelled();

    ASSERT_EQ(h.outcomes.size(), 1u);
    EXPECT_EQ(h.outcomes[0].kind, UploadOutcomeKind::Cancelled);
    EXPECT_EQ(h.outcomes[0].source, OutcomeSource::Local);

    run_for(h.ioc, 60ms);
    EXPECT_EQ(h.outcomes.size(), 1u);
}
