/**
 * @file test_upload_response.cpp
 * @brief Unit tests for decoding synchronous upload responses
 */

#include <gtest/gtest.h>
#include "upload/upload_api.h"

using namespace uploadwatch::upload;

TEST(UploadResponse, SuccessBody) {
    auto r = decode_upload_response(200, R"({"success":true,"upload_id":"u1","extraction_id":"e1",
        "tables":[{"header":["a"],"rows":[["1"]]}],"conversational_summary":"One table."})");
    EXPECT_TRUE(r.success);
    EXPECT_FALSE(r.is_conflict());
    EXPECT_TRUE(r.error.empty());
    EXPECT_EQ(r.payload["tables"].size(), 1u);
}

TEST(UploadResponse, ExplicitFailureFlag) {
    auto r = decode_upload_response(200, R"({"success":false,"error":"No tables found"})");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "No tables found");
}

TEST(UploadResponse, ServerErrorStatus) {
    auto r = decode_upload_response(500, R"({"detail":"Internal Server Error"})");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "Internal Server Error");
    EXPECT_EQ(r.http_status, 500);
}

TEST(UploadResponse, NonJsonBody) {
    auto r = decode_upload_response(502, "<html>Bad Gateway</html>");
    EXPECT_FALSE(r.success);
    EXPECT_TRUE(r.payload.is_null());
    EXPECT_NE(r.error.find("502"), std::string::npos);
}

TEST(UploadResponse, DuplicateConflict) {
    auto r = decode_upload_response(409, R"({"success":false,"status":"duplicate_detected",
        "error":"Duplicate file","message":"This file was already uploaded",
        "duplicate_info":{"type":"file_hash","existing_upload_id":"upload_9_old",
        "existing_file_name":"feb.pdf","existing_upload_date":"2025-02-01T12:00:00",
        "existing_upload_date_formatted":"Feb 1, 2025","gcs_url":"https://storage/x","gcs_key":"k/x",
        "table_count":4}})");
    ASSERT_TRUE(r.is_conflict());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "Duplicate file");
    EXPECT_EQ(r.duplicate->type, "file_hash");
    EXPECT_EQ(r.duplicate->existing_file_name, "feb.pdf");
    EXPECT_EQ(r.duplicate->existing_upload_date_formatted, "Feb 1, 2025");
    EXPECT_EQ(r.duplicate->gcs_key, "k/x");
    EXPECT_EQ(r.duplicate->table_count, 4);
}

TEST(UploadResponse, ConflictWithoutDuplicateInfoIsPlainFailure) {
    auto r = decode_upload_response(409, R"({"success":false,"error":"Conflict"})");
    EXPECT_FALSE(r.is_conflict());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "Conflict");
}
