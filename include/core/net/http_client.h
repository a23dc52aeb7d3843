/**
 * @file http_client.h
 * @brief Blocking libcurl wrapper for the upload and cancel REST calls.
 */

#pragma once

#include <functional>
#include <string>
#include <vector>

namespace uploadwatch::nethttp {

struct Header { std::string name; std::string value; };

struct HttpResponse {
    long status{0};
    std::string body;
};

// One multipart/form-data field. When file_path is set the part is streamed
// from disk and `value` is ignored.
struct FormPart {
    std::string name;
    std::string value;
    std::string file_path;
    std::string file_name;   // defaults to basename(file_path)
};

// Per-call overrides. should_abort is polled from curl's progress callback,
// at least once a second even while the transfer is idle; returning true
// aborts the call with a runtime_error.
struct CallOptions {
    std::function<bool()> should_abort;
    long timeout_ms{0};      // 0: UPLOADWATCH_HTTP_TIMEOUT_MS
};

class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    // Non-2xx statuses are returned, not thrown; callers decide what a 409
    // or 500 means. Throws std::runtime_error on transport failure.
    HttpResponse request(const std::string& method,
                         const std::string& url,
                         const std::vector<Header>& headers,
                         const std::string& body,
                         const CallOptions& options = {}) const;

    HttpResponse post_multipart(const std::string& url,
                                const std::vector<Header>& headers,
                                const std::vector<FormPart>& parts,
                                const CallOptions& options = {}) const;
};

} // namespace uploadwatch::nethttp
