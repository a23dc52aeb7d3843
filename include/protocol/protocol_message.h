/**
 * @file protocol_message.h
 * @brief Typed view of one progress-stream frame.
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace uploadwatch::protocol {

enum class MessageType {
    Ping,
    Pong,
    ConnectionEstablished,
    Heartbeat,
    Status,
    StepStarted,
    StepProgress,
    StepCompleted,
    ExtractionComplete,
    Error
};

inline std::string to_string(MessageType type) {
    switch (type) {
        case MessageType::Ping: return "PING";
        case MessageType::Pong: return "PONG";
        case MessageType::ConnectionEstablished: return "CONNECTION_ESTABLISHED";
        case MessageType::Heartbeat: return "HEARTBEAT";
        case MessageType::Status: return "STATUS";
        case MessageType::StepStarted: return "STEP_STARTED";
        case MessageType::StepProgress: return "STEP_PROGRESS";
        case MessageType::StepCompleted: return "STEP_COMPLETED";
        case MessageType::ExtractionComplete: return "EXTRACTION_COMPLETE";
        case MessageType::Error: return "ERROR";
        default: return "UNKNOWN";
    }
}

// Housekeeping frames never touch progress state.
inline bool is_housekeeping(MessageType type) {
    return type == MessageType::Ping || type == MessageType::Pong ||
           type == MessageType::ConnectionEstablished ||
           type == MessageType::Heartbeat || type == MessageType::Status;
}

/**
 * Server pipeline stages, in order. Stage names are advisory; the ordinal is
 * what progress tracking keys on.
 */
enum class Stage : int {
    DocumentProcessing = 0,
    MetadataExtraction = 1,
    TableDetection = 2,
    DataExtraction = 3,
    FinancialProcessing = 4,
    QualityAssurance = 5
};

constexpr int kFinalStage = static_cast<int>(Stage::QualityAssurance);

// "metadata_extraction" -> 1. nullopt for names outside the pipeline.
std::optional<int> stage_from_name(std::string_view name);

/**
 * One inbound frame. Only the fields the frame actually carried are set, so
 * the reducer can tell "absent" from "empty".
 */
struct ProtocolMessage {
    MessageType type{MessageType::Ping};
    std::string upload_id;

    std::optional<int> stage;
    std::optional<std::string> stage_name;       // stepId / current_stage / progress.stage
    std::optional<double> percentage;
    std::optional<std::string> message;
    std::optional<std::string> estimated_time;
    std::optional<std::string> summary;          // conversational_summary
    std::optional<nlohmann::json> stage_details;
    std::optional<std::string> current_stage;    // as sent; keys metadata forwarding

    // ExtractionComplete; null when the frame carried no results
    nlohmann::json results;

    // Error
    std::string error;
    std::optional<std::string> error_code;
    bool cancelled{false};

    // Status replies are logged verbatim.
    nlohmann::json raw;
};

} // namespace uploadwatch::protocol
