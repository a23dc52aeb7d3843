/**
 * @file message_codec.h
 * @brief Frame parsing and outbound frame encoding for the progress stream.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "protocol/protocol_message.h"

namespace uploadwatch::protocol {

/**
 * @brief Parse one text frame.
 *
 * Accepts both the step vocabulary (STEP_STARTED, STEP_PROGRESS, ...) and the
 * legacy one (progress_update, completion, error). Type names are matched
 * case-insensitively.
 *
 * @param text  Raw frame text
 * @param error Optional out-parameter describing why the frame was rejected
 * @return nullopt for unparsable JSON, a missing type or an unknown type
 */
std::optional<ProtocolMessage> parse_frame(std::string_view text, std::string* error = nullptr);

std::string encode_ping(std::int64_t timestamp_ms);
std::string encode_pong(std::int64_t timestamp_ms);
std::string encode_heartbeat(std::int64_t timestamp_ms);
std::string encode_get_status(std::int64_t timestamp_ms);

// Wall-clock epoch milliseconds, as used in outbound timestamps.
std::int64_t now_epoch_ms();

} // namespace uploadwatch::protocol
