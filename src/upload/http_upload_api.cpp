/**
 * @file http_upload_api.cpp
 */

#include "upload/http_upload_api.h"
#include "utils/string_utils.h"

#include <stdexcept>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

namespace uploadwatch::upload {

namespace {

std::vector<nethttp::Header> auth_headers(const std::string& bearer_token) {
    std::vector<nethttp::Header> headers{{"Accept", "application/json"}};
    if (!bearer_token.empty()) {
        headers.push_back({"Authorization", "Bearer " + bearer_token});
    }
    return headers;
}

} // namespace

HttpUploadApi::HttpUploadApi(net::io_context& ioc, const config::ProgressClientConfig& config)
    : ioc_(ioc), config_(config), http_(std::make_shared<nethttp::HttpClient>()) {}

HttpUploadApi::~HttpUploadApi() {
    shutting_down_.store(true);
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lk(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& w : workers) {
        if (w.thread.joinable()) w.thread.join();
    }
}

template <typename Fn>
void HttpUploadApi::run_in_worker(Fn&& fn) {
    auto finished = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard<std::mutex> lk(workers_mutex_);
    reap_finished_locked();
    std::thread thread([fn = std::forward<Fn>(fn), finished]() mutable {
        fn();
        finished->store(true);
    });
    workers_.push_back(Worker{std::move(thread), std::move(finished)});
}

void HttpUploadApi::reap_finished_locked() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->finished->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

std::size_t HttpUploadApi::active_workers() {
    std::lock_guard<std::mutex> lk(workers_mutex_);
    reap_finished_locked();
    return workers_.size();
}

void HttpUploadApi::submit(const UploadRequest& request, SubmitCallback done) {
    const std::string url = utils::trim_trailing_slash(config_.api_url) + config_.upload_path;

    std::vector<nethttp::FormPart> parts;
    parts.push_back({"file", {}, request.file_path, utils::base_name(request.file_path)});
    parts.push_back({"extraction_method", request.extraction_method, {}, {}});
    parts.push_back({"upload_id", request.upload_id, {}, {}});
    parts.push_back({"use_enhanced", request.use_enhanced ? "true" : "false", {}, {}});
    if (request.statement_date && !request.statement_date->empty()) {
        parts.push_back({"statement_date", *request.statement_date, {}, {}});
    }
    for (const auto& [name, value] : request.extra_fields) {
        parts.push_back({name, value, {}, {}});
    }

    spdlog::info("[UploadApi] POST {} upload_id={} file={}", url, request.upload_id,
                 utils::base_name(request.file_path));

    auto abort = std::make_shared<std::atomic<bool>>(false);
    {
        std::lock_guard<std::mutex> lk(workers_mutex_);
        upload_aborts_[request.upload_id] = abort;
    }

    // Keeps ioc.run() alive until the response is posted back.
    auto guard = net::make_work_guard(ioc_);
    run_in_worker([this, url, upload_id = request.upload_id, abort, parts = std::move(parts),
                   headers = auth_headers(request.bearer_token),
                   done = std::move(done), guard = std::move(guard)]() mutable {
        nethttp::CallOptions options;
        options.should_abort = [this, abort]() { return shutting_down_.load() || abort->load(); };

        SyncUploadResponse response;
        try {
            auto http_response = http_->post_multipart(url, headers, parts, options);
            response = decode_upload_response(http_response.status, http_response.body);
        } catch (const std::exception& e) {
            spdlog::error("[UploadApi] upload request failed: {}", e.what());
            response.http_status = 0;
            response.success = false;
            response.error = e.what();
        }
        spdlog::info("[UploadApi] upload response status={} success={}{}", response.http_status,
                     response.success, response.is_conflict() ? " (duplicate)" : "");
        {
            std::lock_guard<std::mutex> lk(workers_mutex_);
            auto it = upload_aborts_.find(upload_id);
            if (it != upload_aborts_.end() && it->second == abort) upload_aborts_.erase(it);
        }
        net::post(ioc_, [done = std::move(done), response = std::move(response)]() mutable {
            done(std::move(response));
        });
        guard.reset();
    });
}

void HttpUploadApi::cancel(const std::string& upload_id, const std::string& bearer_token, CancelCallback done) {
    const std::string url = utils::trim_trailing_slash(config_.api_url) + config_.cancel_path +
                            utils::url_encode(upload_id);
    spdlog::info("[UploadApi] POST {}", url);

    {
        std::lock_guard<std::mutex> lk(workers_mutex_);
        if (auto it = upload_aborts_.find(upload_id); it != upload_aborts_.end()) {
            spdlog::info("[UploadApi] aborting in-flight upload {}", upload_id);
            it->second->store(true);
            upload_aborts_.erase(it);
        }
    }

    auto guard = net::make_work_guard(ioc_);
    run_in_worker([this, url, headers = auth_headers(bearer_token),
                   done = std::move(done), guard = std::move(guard)]() mutable {
        nethttp::CallOptions options;
        options.timeout_ms = static_cast<long>(config_.cancel_timeout.count());

        bool accepted = false;
        std::string detail;
        try {
            auto response = http_->request("POST", url, headers, "", options);
            accepted = response.status >= 200 && response.status < 300;
            detail = "HTTP " + std::to_string(response.status);
        } catch (const std::exception& e) {
            detail = e.what();
        }
        if (!accepted) {
            spdlog::warn("[UploadApi] cancel request not accepted: {}", detail);
        }
        net::post(ioc_, [done = std::move(done), accepted, detail = std::move(detail)]() {
            if (done) done(accepted, detail);
        });
        guard.reset();
    });
}

} // namespace uploadwatch::upload
