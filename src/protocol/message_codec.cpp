/**
 * @file message_codec.cpp
 */

#include "protocol/message_codec.h"
#include "utils/string_utils.h"

#include <chrono>

namespace uploadwatch::protocol {

using nlohmann::json;

namespace {

constexpr const char* kDefaultErrorMessage = "An error occurred during processing";

std::optional<std::string> get_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    auto s = it->get<std::string>();
    if (s.empty()) return std::nullopt;
    return s;
}

std::optional<double> get_number(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return std::nullopt;
    return it->get<double>();
}

std::optional<json> get_object(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_object()) return std::nullopt;
    return *it;
}

bool truthy(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return false;
    if (it->is_boolean()) return it->get<bool>();
    if (it->is_number()) return it->get<double>() != 0.0;
    if (it->is_string()) return !it->get<std::string>().empty();
    return false;
}

// stepIndex wins; a numeric "stage" is accepted too, a string "stage" names it.
void read_stage(const json& j, ProtocolMessage& msg) {
    if (auto it = j.find("stepIndex"); it != j.end() && it->is_number_integer()) {
        msg.stage = it->get<int>();
    } else if (auto st = j.find("stage"); st != j.end() && st->is_number_integer()) {
        msg.stage = st->get<int>();
    }
    msg.current_stage = get_string(j, "current_stage");
    if (auto id = get_string(j, "stepId")) {
        msg.stage_name = id;
    } else if (auto cur = msg.current_stage) {
        msg.stage_name = cur;
    } else if (auto named = get_string(j, "stage")) {
        msg.stage_name = named;
        if (!msg.stage) msg.stage = stage_from_name(*named);
    }
}

void read_common_progress(const json& j, ProtocolMessage& msg) {
    msg.percentage = get_number(j, "percentage");
    if (!msg.percentage) msg.percentage = get_number(j, "progress_percentage");
    msg.message = get_string(j, "message");
    msg.estimated_time = get_string(j, "estimatedTime");
    if (!msg.estimated_time) msg.estimated_time = get_string(j, "estimated_time");
    msg.summary = get_string(j, "conversational_summary");
    msg.stage_details = get_object(j, "stage_details");
}

void read_error(const json& j, ProtocolMessage& msg) {
    auto it = j.find("error");
    if (it != j.end() && it->is_string()) {
        msg.error = it->get<std::string>();
    } else if (it != j.end() && it->is_object()) {
        // Legacy shape: {"error": {"message": ..., "code": ...}}
        if (auto m = get_string(*it, "message")) msg.error = *m;
        msg.error_code = get_string(*it, "code");
    }
    if (msg.error.empty()) {
        msg.error = get_string(j, "message").value_or(kDefaultErrorMessage);
    }
    msg.stage_details = get_object(j, "stage_details");
    msg.cancelled = truthy(j, "cancelled") ||
                    (msg.stage_details && truthy(*msg.stage_details, "cancelled")) ||
                    utils::contains_ci(msg.error, "cancelled");
}

std::optional<MessageType> type_from_name(const std::string& lowered) {
    if (lowered == "ping") return MessageType::Ping;
    if (lowered == "pong") return MessageType::Pong;
    if (lowered == "connection_established") return MessageType::ConnectionEstablished;
    if (lowered == "heartbeat") return MessageType::Heartbeat;
    if (lowered == "status") return MessageType::Status;
    if (lowered == "step_started") return MessageType::StepStarted;
    if (lowered == "step_progress" || lowered == "progress_update") return MessageType::StepProgress;
    if (lowered == "step_completed") return MessageType::StepCompleted;
    if (lowered == "extraction_complete" || lowered == "completion") return MessageType::ExtractionComplete;
    if (lowered == "error") return MessageType::Error;
    return std::nullopt;
}

std::string encode_typed(const char* type, std::int64_t timestamp_ms) {
    json j;
    j["type"] = type;
    j["timestamp"] = timestamp_ms;
    return j.dump();
}

} // namespace

std::optional<int> stage_from_name(std::string_view name) {
    const std::string lowered = utils::to_lower_ascii(name);
    if (lowered == "document_processing") return static_cast<int>(Stage::DocumentProcessing);
    if (lowered == "metadata_extraction") return static_cast<int>(Stage::MetadataExtraction);
    if (lowered == "table_detection") return static_cast<int>(Stage::TableDetection);
    if (lowered == "data_extraction") return static_cast<int>(Stage::DataExtraction);
    if (lowered == "financial_processing") return static_cast<int>(Stage::FinancialProcessing);
    if (lowered == "quality_assurance") return static_cast<int>(Stage::QualityAssurance);
    return std::nullopt;
}

std::optional<ProtocolMessage> parse_frame(std::string_view text, std::string* error) {
    auto reject = [error](std::string why) -> std::optional<ProtocolMessage> {
        if (error) *error = std::move(why);
        return std::nullopt;
    };

    json j = json::parse(text.begin(), text.end(), nullptr, false);
    if (j.is_discarded()) return reject("invalid json");
    if (!j.is_object()) return reject("frame is not an object");

    auto type_name = get_string(j, "type");
    if (!type_name) return reject("missing type");
    const std::string lowered = utils::to_lower_ascii(*type_name);
    auto type = type_from_name(lowered);
    if (!type) return reject("unknown type '" + *type_name + "'");

    ProtocolMessage msg;
    msg.type = *type;
    msg.upload_id = get_string(j, "upload_id").value_or(std::string{});

    switch (msg.type) {
        case MessageType::StepStarted:
        case MessageType::StepCompleted:
            read_stage(j, msg);
            read_common_progress(j, msg);
            break;
        case MessageType::StepProgress:
            if (lowered == "progress_update") {
                // Legacy: fields nested under "progress".
                auto p = get_object(j, "progress");
                if (!p) return reject("progress_update without progress object");
                read_stage(*p, msg);
                read_common_progress(*p, msg);
                if (!msg.summary) msg.summary = get_string(j, "conversational_summary");
            } else {
                read_stage(j, msg);
                read_common_progress(j, msg);
            }
            break;
        case MessageType::ExtractionComplete: {
            auto it = j.find("results");
            if (it == j.end() || it->is_null()) it = j.find("result");
            if (it != j.end()) msg.results = *it;
            if (msg.results.is_object()) {
                msg.summary = get_string(msg.results, "conversational_summary");
            }
            if (!msg.summary) msg.summary = get_string(j, "conversational_summary");
            break;
        }
        case MessageType::Error:
            read_error(j, msg);
            break;
        case MessageType::Status:
            msg.raw = j;
            break;
        default:
            break;
    }
    return msg;
}

std::string encode_ping(std::int64_t timestamp_ms) {
    return encode_typed("ping", timestamp_ms);
}

std::string encode_pong(std::int64_t timestamp_ms) {
    return encode_typed("pong", timestamp_ms);
}

std::string encode_heartbeat(std::int64_t timestamp_ms) {
    return encode_typed("heartbeat", timestamp_ms);
}

std::string encode_get_status(std::int64_t timestamp_ms) {
    return encode_typed("get_status", timestamp_ms);
}

std::int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace uploadwatch::protocol
