/**
 * @file test_message_codec.cpp
 * @brief Unit tests for frame parsing and outbound encoding
 */

#include <gtest/gtest.h>
#include "protocol/message_codec.h"

using namespace uploadwatch::protocol;
using nlohmann::json;

// ============================================================================
// TESTS: STEP VOCABULARY
// ============================================================================

TEST(MessageCodec, ParsesStepStarted) {
    auto msg = parse_frame(R"({"type":"STEP_STARTED","upload_id":"upload_1_abc","stepIndex":2,
        "stepId":"table_extraction","percentage":40,"message":"Extracting commission data...",
        "estimatedTime":"10s"})");
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->type, MessageType::StepStarted);
    EXPECT_EQ(msg->upload_id, "upload_1_abc");
    EXPECT_EQ(msg->stage, 2);
    EXPECT_EQ(msg->stage_name, "table_extraction");
    EXPECT_DOUBLE_EQ(*msg->percentage, 40.0);
    EXPECT_EQ(msg->message, "Extracting commission data...");
    EXPECT_EQ(msg->estimated_time, "10s");
}

TEST(MessageCodec, StepProgressKeepsAbsentFieldsUnset) {
    auto msg = parse_frame(R"({"type":"STEP_PROGRESS","percentage":55,"estimatedTime":null})");
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->type, MessageType::StepProgress);
    EXPECT_DOUBLE_EQ(*msg->percentage, 55.0);
    EXPECT_FALSE(msg->message.has_value());
    EXPECT_FALSE(msg->estimated_time.has_value());
    EXPECT_FALSE(msg->stage.has_value());
    EXPECT_FALSE(msg->stage_details.has_value());
}

TEST(MessageCodec, StepProgressCarriesMetadataDetailsAndSummary) {
    auto msg = parse_frame(R"({"type":"STEP_PROGRESS","current_stage":"metadata_extraction",
        "stage_details":{"carrier_name":"Acme Life","statement_date":"2025-01-31"},
        "conversational_summary":"Found 3 tables."})");
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->stage_name, "metadata_extraction");
    ASSERT_TRUE(msg->stage_details.has_value());
    EXPECT_EQ((*msg->stage_details)["carrier_name"], "Acme Life");
    EXPECT_EQ(msg->summary, "Found 3 tables.");
}

TEST(MessageCodec, ExtractionCompleteTakesResultsAndSummary) {
    auto msg = parse_frame(R"({"type":"EXTRACTION_COMPLETE","results":{"tables":[1,2],
        "conversational_summary":"Two tables."}})");
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->type, MessageType::ExtractionComplete);
    EXPECT_EQ(msg->results["tables"].size(), 2u);
    EXPECT_EQ(msg->summary, "Two tables.");
}

TEST(MessageCodec, ErrorFrameCancellationDetection) {
    auto plain = parse_frame(R"({"type":"ERROR","error":"OCR backend unavailable"})");
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(plain->error, "OCR backend unavailable");
    EXPECT_FALSE(plain->cancelled);

    auto flagged = parse_frame(R"({"type":"ERROR","error":"stopped","stage_details":{"cancelled":true}})");
    ASSERT_TRUE(flagged.has_value());
    EXPECT_TRUE(flagged->cancelled);

    auto by_text = parse_frame(R"({"type":"ERROR","error":"Extraction was cancelled by user"})");
    ASSERT_TRUE(by_text.has_value());
    EXPECT_TRUE(by_text->cancelled);

    auto missing = parse_frame(R"({"type":"ERROR"})");
    ASSERT_TRUE(missing.has_value());
    EXPECT_EQ(missing->error, "An error occurred during processing");
}

// ============================================================================
// TESTS: LEGACY VOCABULARY
// ============================================================================

TEST(MessageCodec, LegacyProgressUpdateMapsToStepProgress) {
    auto msg = parse_frame(R"({"type":"progress_update","upload_id":"u","progress":{
        "stage":"table_detection","progress_percentage":30,"message":"Processing Table Detection...",
        "stage_details":{"name":"Table Detection"}}})");
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->type, MessageType::StepProgress);
    EXPECT_EQ(msg->stage, static_cast<int>(Stage::TableDetection));
    EXPECT_EQ(msg->stage_name, "table_detection");
    EXPECT_DOUBLE_EQ(*msg->percentage, 30.0);
    EXPECT_EQ(msg->message, "Processing Table Detection...");
}

TEST(MessageCodec, CurrentStageKeptApartFromStepId) {
    auto both = parse_frame(R"({"type":"STEP_PROGRESS","stepId":"extraction",
        "current_stage":"metadata_extraction","stage_details":{"carrier_name":"Acme"}})");
    ASSERT_TRUE(both.has_value());
    EXPECT_EQ(both->stage_name, "extraction");
    EXPECT_EQ(both->current_stage, "metadata_extraction");

    auto step_only = parse_frame(R"({"type":"STEP_PROGRESS","stepId":"metadata_extraction"})");
    ASSERT_TRUE(step_only.has_value());
    EXPECT_FALSE(step_only->current_stage.has_value());
}

TEST(MessageCodec, CompletionWithoutResultsLeavesResultsNull) {
    auto done = parse_frame(R"({"type":"completion"})");
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done->type, MessageType::ExtractionComplete);
    EXPECT_TRUE(done->results.is_null());
}

TEST(MessageCodec, LegacyCompletionAndError) {
    auto done = parse_frame(R"({"type":"completion","result":{"success":true}})");
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done->type, MessageType::ExtractionComplete);
    EXPECT_EQ(done->results["success"], true);

    auto err = parse_frame(R"({"type":"error","error":{"message":"bad pdf","code":"E_PDF"}})");
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->type, MessageType::Error);
    EXPECT_EQ(err->error, "bad pdf");
    EXPECT_EQ(err->error_code, "E_PDF");
}

TEST(MessageCodec, HousekeepingTypes) {
    EXPECT_EQ(parse_frame(R"({"type":"ping"})")->type, MessageType::Ping);
    EXPECT_EQ(parse_frame(R"({"type":"pong"})")->type, MessageType::Pong);
    EXPECT_EQ(parse_frame(R"({"type":"connection_established","session_id":"s"})")->type,
              MessageType::ConnectionEstablished);
    EXPECT_EQ(parse_frame(R"({"type":"heartbeat"})")->type, MessageType::Heartbeat);

    auto status = parse_frame(R"({"type":"status","state":"running"})");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->raw["state"], "running");
    EXPECT_TRUE(is_housekeeping(status->type));
    EXPECT_FALSE(is_housekeeping(MessageType::StepProgress));
}

// ============================================================================
// TESTS: MALFORMED FRAMES
// ============================================================================

TEST(MessageCodec, RejectsMalformedFrames) {
    std::string why;
    EXPECT_FALSE(parse_frame("not json", &why).has_value());
    EXPECT_EQ(why, "invalid json");

    EXPECT_FALSE(parse_frame("[1,2,3]", &why).has_value());
    EXPECT_FALSE(parse_frame(R"({"percentage":10})", &why).has_value());
    EXPECT_EQ(why, "missing type");

    EXPECT_FALSE(parse_frame(R"({"type":"SOMETHING_NEW"})", &why).has_value());
    EXPECT_NE(why.find("SOMETHING_NEW"), std::string::npos);

    EXPECT_FALSE(parse_frame(R"({"type":"progress_update"})").has_value());
}

// ============================================================================
// TESTS: ENCODING
// ============================================================================

TEST(MessageCodec, EncodesOutboundFrames) {
    auto ping = json::parse(encode_ping(1700000000000));
    EXPECT_EQ(ping["type"], "ping");
    EXPECT_EQ(ping["timestamp"], 1700000000000);

    EXPECT_EQ(json::parse(encode_pong(1))["type"], "pong");
    EXPECT_EQ(json::parse(encode_heartbeat(1))["type"], "heartbeat");
    EXPECT_EQ(json::parse(encode_get_status(1))["type"], "get_status");
}

TEST(MessageCodec, StageNames) {
    EXPECT_EQ(stage_from_name("document_processing"), 0);
    EXPECT_EQ(stage_from_name("quality_assurance"), kFinalStage);
    EXPECT_FALSE(stage_from_name("summary_complete").has_value());
}
