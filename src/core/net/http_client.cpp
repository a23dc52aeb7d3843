/**
 * @file http_client.cpp
 */

#include "core/net/http_client.h"
#include <curl/curl.h>
#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <sstream>

namespace uploadwatch::nethttp {

static size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

static int xferinfo_cb(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* should_abort = static_cast<const std::function<bool()>*>(clientp);
    return (*should_abort)() ? 1 : 0;
}

static long env_timeout_ms(const char* name, long fallback, long floor) {
    if (const char* v = std::getenv(name)) {
        char* endp = nullptr; long t = std::strtol(v, &endp, 10);
        if (endp && *endp == '\0' && t >= floor) return t;
    }
    return fallback;
}

static void apply_common_options(CURL* curl, const std::string& url, curl_slist* hdrs, std::string* response,
                                 const CallOptions& options) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, hdrs);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, response);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "uploadwatch/1.0");
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    // Extraction runs inside the upload request, so the total budget is long.
    long connect_timeout_ms = env_timeout_ms("UPLOADWATCH_HTTP_CONNECT_TIMEOUT_MS", 10000, 100);
    long total_timeout_ms   = options.timeout_ms > 0
                                  ? options.timeout_ms
                                  : env_timeout_ms("UPLOADWATCH_HTTP_TIMEOUT_MS", 600000, 200);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, std::min(connect_timeout_ms, total_timeout_ms));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, total_timeout_ms);
    if (options.should_abort) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<std::function<bool()>*>(&options.should_abort));
    }
}

static curl_slist* build_headers(const std::vector<Header>& headers) {
    curl_slist* hdrs = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name + ": " + h.value;
        hdrs = curl_slist_append(hdrs, line.c_str());
    }
    return hdrs;
}

static HttpResponse finish(CURL* curl, CURLcode rc, curl_slist* hdrs, std::string response) {
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    if (hdrs) curl_slist_free_all(hdrs);
    curl_easy_cleanup(curl);

    if (rc != CURLE_OK) {
        std::ostringstream oss;
        oss << (rc == CURLE_ABORTED_BY_CALLBACK ? "request aborted: " : "curl error: ") << curl_easy_strerror(rc);
        throw std::runtime_error(oss.str());
    }
    return HttpResponse{status, std::move(response)};
}

HttpClient::HttpClient() {}
HttpClient::~HttpClient() {}

HttpResponse HttpClient::request(const std::string& method,
                                 const std::string& url,
                                 const std::vector<Header>& headers,
                                 const std::string& body,
                                 const CallOptions& options) const {
    CURL* curl = curl_easy_init();
    if (!curl) throw std::runtime_error("curl_easy_init failed");

    std::string response;
    curl_slist* hdrs = build_headers(headers);
    apply_common_options(curl, url, hdrs, &response, options);

    if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    } else {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    }

    CURLcode rc = curl_easy_perform(curl);
    return finish(curl, rc, hdrs, std::move(response));
}

HttpResponse HttpClient::post_multipart(const std::string& url,
                                        const std::vector<Header>& headers,
                                        const std::vector<FormPart>& parts,
                                        const CallOptions& options) const {
    CURL* curl = curl_easy_init();
    if (!curl) throw std::runtime_error("curl_easy_init failed");

    std::string response;
    curl_slist* hdrs = build_headers(headers);
    apply_common_options(curl, url, hdrs, &response, options);

    curl_mime* mime = curl_mime_init(curl);
    for (const auto& p : parts) {
        curl_mimepart* part = curl_mime_addpart(mime);
        curl_mime_name(part, p.name.c_str());
        if (!p.file_path.empty()) {
            if (curl_mime_filedata(part, p.file_path.c_str()) != CURLE_OK) {
                curl_mime_free(mime);
                if (hdrs) curl_slist_free_all(hdrs);
                curl_easy_cleanup(curl);
                throw std::runtime_error("cannot read upload file: " + p.file_path);
            }
            if (!p.file_name.empty()) curl_mime_filename(part, p.file_name.c_str());
        } else {
            curl_mime_data(part, p.value.c_str(), CURL_ZERO_TERMINATED);
        }
    }
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);

    CURLcode rc = curl_easy_perform(curl);
    curl_mime_free(mime);
    return finish(curl, rc, hdrs, std::move(response));
}

} // namespace uploadwatch::nethttp
