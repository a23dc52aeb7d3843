/**
 * @file progress_state.cpp
 */

#include "progress/progress_state.h"

#include <algorithm>

namespace uploadwatch::progress {

using protocol::MessageType;

namespace {

double advance_percentage(double current, double reported) {
    const double clamped = std::clamp(reported, 0.0, 100.0);
    return std::max(current, clamped);
}

void apply_optional_fields(ProgressState& next, const protocol::ProtocolMessage& msg) {
    if (msg.percentage) next.percentage = advance_percentage(next.percentage, *msg.percentage);
    if (msg.estimated_time) next.estimated_remaining = msg.estimated_time;
    if (msg.summary) next.summary = msg.summary;
}

} // namespace

bool operator==(const TerminalOutcome& a, const TerminalOutcome& b) {
    return a.kind == b.kind && a.payload == b.payload && a.error == b.error;
}

bool operator==(const ProgressState& a, const ProgressState& b) {
    return a.stage == b.stage &&
           a.stage_name == b.stage_name &&
           a.percentage == b.percentage &&
           a.message == b.message &&
           a.estimated_remaining == b.estimated_remaining &&
           a.summary == b.summary &&
           a.terminal == b.terminal;
}

ProgressState reduce(const ProgressState& state, const protocol::ProtocolMessage& msg) {
    if (state.is_terminal() || protocol::is_housekeeping(msg.type)) {
        return state;
    }

    ProgressState next = state;
    switch (msg.type) {
        case MessageType::StepStarted:
            if (msg.stage) next.stage = *msg.stage;
            if (msg.stage_name) next.stage_name = *msg.stage_name;
            next.message = msg.message.value_or(std::string{});
            apply_optional_fields(next, msg);
            break;

        case MessageType::StepProgress:
            if (msg.stage) next.stage = *msg.stage;
            if (msg.stage_name) next.stage_name = *msg.stage_name;
            if (msg.message) next.message = *msg.message;
            apply_optional_fields(next, msg);
            break;

        case MessageType::StepCompleted:
            if (msg.message) {
                next.message = *msg.message;
            } else {
                next.message = "Step " + std::to_string(next.stage + 1) + " completed";
            }
            apply_optional_fields(next, msg);
            break;

        case MessageType::ExtractionComplete:
            next.stage = protocol::kFinalStage;
            next.percentage = 100.0;
            if (msg.summary) next.summary = msg.summary;
            // Without results there is nothing to deliver; the synchronous
            // response stays authoritative.
            if (!msg.results.is_null()) {
                next.terminal = TerminalOutcome{OutcomeKind::Success, msg.results, {}};
            }
            break;

        case MessageType::Error:
            next.message = msg.error;
            next.terminal = TerminalOutcome{
                msg.cancelled ? OutcomeKind::Cancelled : OutcomeKind::Failure,
                nlohmann::json{},
                msg.error};
            break;

        default:
            break;
    }
    return next;
}

} // namespace uploadwatch::progress
