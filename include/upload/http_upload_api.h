/**
 * @file http_upload_api.h
 * @brief IUploadApi over libcurl, one worker thread per blocking call.
 */

#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "core/config/progress_config.h"
#include "core/net/http_client.h"
#include "upload/upload_api.h"

namespace uploadwatch::upload {

namespace net = boost::asio;

/**
 * @class HttpUploadApi
 *
 * cancel() aborts the matching in-flight upload besides sending the server
 * cancel; the destructor aborts every in-flight upload and waits only for
 * cancel requests, which are bounded by cancel_timeout.
 */
class HttpUploadApi final : public IUploadApi {
public:
    HttpUploadApi(net::io_context& ioc, const config::ProgressClientConfig& config);
    ~HttpUploadApi() override;

    HttpUploadApi(const HttpUploadApi&) = delete;
    HttpUploadApi& operator=(const HttpUploadApi&) = delete;

    void submit(const UploadRequest& request, SubmitCallback done) override;
    void cancel(const std::string& upload_id, const std::string& bearer_token, CancelCallback done) override;

    // Worker threads still running; finished ones are joined first.
    std::size_t active_workers();

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    template <typename Fn>
    void run_in_worker(Fn&& fn);
    void reap_finished_locked();

    net::io_context& ioc_;
    config::ProgressClientConfig config_;
    std::shared_ptr<nethttp::HttpClient> http_;
    std::atomic<bool> shutting_down_{false};

    std::mutex workers_mutex_;
    std::vector<Worker> workers_;
    std::map<std::string, std::shared_ptr<std::atomic<bool>>> upload_aborts_;
};

} // namespace uploadwatch::upload
