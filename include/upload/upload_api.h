/**
 * @file upload_api.h
 * @brief Synchronous upload endpoint abstraction and its response types.
 */

#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace uploadwatch::upload {

struct UploadRequest {
    std::string file_path;
    std::string upload_id;                        // correlation id
    std::string extraction_method{"smart"};
    bool use_enhanced{true};
    std::optional<std::string> statement_date;
    std::map<std::string, std::string> extra_fields;
    std::string bearer_token;                     // empty: no Authorization header
};

// Existing upload that a 409 response points at.
struct DuplicateInfo {
    std::string type;
    std::string existing_upload_id;
    std::string existing_file_name;
    std::string existing_upload_date;
    std::string existing_upload_date_formatted;
    std::string gcs_url;
    std::string gcs_key;
    int table_count{0};
};

struct SyncUploadResponse {
    long http_status{0};                          // 0 when the request never completed
    bool success{false};
    nlohmann::json payload;                       // full response body (object) or null
    std::string error;
    std::optional<DuplicateInfo> duplicate;

    bool is_conflict() const { return duplicate.has_value(); }
};

/**
 * Decode an upload response body. Non-JSON bodies and non-2xx statuses are
 * unsuccessful; a 409 (or status "duplicate_detected") with duplicate_info
 * yields a conflict.
 */
SyncUploadResponse decode_upload_response(long http_status, const std::string& body);

/**
 * @class IUploadApi
 * @brief Issues the synchronous upload and best-effort cancellation.
 *
 * Implementations must invoke callbacks on the caller's event loop, never
 * from a worker thread.
 */
class IUploadApi {
public:
    using SubmitCallback = std::function<void(SyncUploadResponse)>;
    using CancelCallback = std::function<void(bool accepted, const std::string& detail)>;

    virtual ~IUploadApi() = default;

    virtual void submit(const UploadRequest& request, SubmitCallback done) = 0;
    virtual void cancel(const std::string& upload_id, const std::string& bearer_token, CancelCallback done) = 0;
};

} // namespace uploadwatch::upload
