/**
 * @file progress_state.h
 * @brief Progress value type and the reducer that advances it.
 */

#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "protocol/protocol_message.h"

namespace uploadwatch::progress {

enum class OutcomeKind {
    None,
    Success,
    Failure,
    Cancelled
};

inline std::string to_string(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::None: return "NONE";
        case OutcomeKind::Success: return "SUCCESS";
        case OutcomeKind::Failure: return "FAILURE";
        case OutcomeKind::Cancelled: return "CANCELLED";
        default: return "UNKNOWN";
    }
}

struct TerminalOutcome {
    OutcomeKind kind{OutcomeKind::None};
    nlohmann::json payload;      // Success: extraction results
    std::string error;           // Failure / Cancelled: server message
};

/**
 * @brief Snapshot of one upload's extraction progress.
 *
 * Only reduce() produces new values. Once `terminal` is set the state is
 * frozen until an explicit reset.
 */
struct ProgressState {
    int stage{0};
    std::string stage_name;
    double percentage{0.0};                        // [0, 100], non-decreasing
    std::string message;
    std::optional<std::string> estimated_remaining;
    std::optional<std::string> summary;
    TerminalOutcome terminal;

    bool is_terminal() const { return terminal.kind != OutcomeKind::None; }
};

bool operator==(const TerminalOutcome& a, const TerminalOutcome& b);
bool operator==(const ProgressState& a, const ProgressState& b);
inline bool operator!=(const ProgressState& a, const ProgressState& b) { return !(a == b); }

/**
 * @brief Pure transition function.
 *
 * Absent fields never erase previously set ones, so re-applying the same
 * frame is a no-op. Housekeeping frames and any frame arriving after a
 * terminal outcome return the input unchanged.
 */
ProgressState reduce(const ProgressState& state, const protocol::ProtocolMessage& msg);

} // namespace uploadwatch::progress
