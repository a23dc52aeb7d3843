/**
 * @file upload_api.cpp
 */

#include "upload/upload_api.h"

namespace uploadwatch::upload {

using nlohmann::json;

namespace {

std::string string_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

DuplicateInfo decode_duplicate(const json& d) {
    DuplicateInfo info;
    info.type = string_field(d, "type");
    info.existing_upload_id = string_field(d, "existing_upload_id");
    info.existing_file_name = string_field(d, "existing_file_name");
    info.existing_upload_date = string_field(d, "existing_upload_date");
    info.existing_upload_date_formatted = string_field(d, "existing_upload_date_formatted");
    info.gcs_url = string_field(d, "gcs_url");
    info.gcs_key = string_field(d, "gcs_key");
    if (auto it = d.find("table_count"); it != d.end() && it->is_number_integer()) {
        info.table_count = it->get<int>();
    }
    return info;
}

} // namespace

SyncUploadResponse decode_upload_response(long http_status, const std::string& body) {
    SyncUploadResponse out;
    out.http_status = http_status;

    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        out.success = false;
        out.error = "HTTP " + std::to_string(http_status) + ": response is not a JSON object";
        return out;
    }
    out.payload = j;

    const bool duplicate_status = http_status == 409 || string_field(j, "status") == "duplicate_detected";
    if (duplicate_status) {
        if (auto it = j.find("duplicate_info"); it != j.end() && it->is_object()) {
            out.duplicate = decode_duplicate(*it);
        }
    }

    const bool ok_status = http_status >= 200 && http_status < 300;
    bool flag = false;
    if (auto it = j.find("success"); it != j.end() && it->is_boolean()) flag = it->get<bool>();
    out.success = ok_status && flag && !out.duplicate;

    if (!out.success) {
        out.error = string_field(j, "error");
        if (out.error.empty()) out.error = string_field(j, "message");
        if (out.error.empty()) out.error = string_field(j, "detail");
        if (out.error.empty()) out.error = "HTTP " + std::to_string(http_status);
    }
    return out;
}

} // namespace uploadwatch::upload
