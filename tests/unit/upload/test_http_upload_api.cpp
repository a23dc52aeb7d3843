/**
 * @file test_http_upload_api.cpp
 * @brief HttpUploadApi abort and worker lifetime against a server that never answers
 */

#include <gtest/gtest.h>
#include "upload/http_upload_api.h"
#include "support/io_helpers.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>

#include <boost/asio/ip/tcp.hpp>

using namespace uploadwatch;
using namespace uploadwatch::upload;
using namespace std::chrono_literals;
using uploadwatch::test::run_until;

namespace {

namespace net = boost::asio;
using tcp = net::ip::tcp;

// Listens on loopback; the kernel completes connections but nothing is ever
// read or written, so every request hangs until the client gives up.
struct SilentServer {
    SilentServer() : acceptor(ioc, tcp::endpoint(net::ip::address_v4::loopback(), 0)) {}

    std::string url() const {
        return "http://127.0.0.1:" + std::to_string(acceptor.local_endpoint().port());
    }

    net::io_context ioc;
    tcp::acceptor acceptor;
};

std::string write_statement() {
    auto path = std::filesystem::temp_directory_path() / "uploadwatch_test_statement.pdf";
    std::ofstream out(path, std::ios::binary);
    out << "%PDF-1.4\n% test statement\n";
    return path.string();
}

struct Harness {
    Harness() {
        cfg = test::fast_config();
        cfg.api_url = server.url();
        api = std::make_unique<HttpUploadApi>(ioc, cfg);
    }

    void submit(const std::string& upload_id) {
        UploadRequest req;
        req.file_path = write_statement();
        req.upload_id = upload_id;
        api->submit(req, [this](SyncUploadResponse r) {
            response = std::move(r);
            responded = true;
        });
    }

    SilentServer server;
    boost::asio::io_context ioc;
    config::ProgressClientConfig cfg;
    std::unique_ptr<HttpUploadApi> api;
    SyncUploadResponse response;
    bool responded{false};
};

} // namespace

TEST(HttpUploadApi, DestructorAbortsInFlightUpload) {
    Harness h;
    h.submit("upload_1_abort");
    test::run_for(h.ioc, 200ms);
    ASSERT_FALSE(h.responded);

    const auto started = std::chrono::steady_clock::now();
    h.api.reset();
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);

    ASSERT_TRUE(run_until(h.ioc, [&] { return h.responded; }));
    EXPECT_FALSE(h.response.success);
    EXPECT_EQ(h.response.http_status, 0);
}

TEST(HttpUploadApi, CancelAbortsMatchingUploadAndBoundsCancelRequest) {
    Harness h;
    h.submit("upload_2_cancel");
    test::run_for(h.ioc, 200ms);
    ASSERT_FALSE(h.responded);

    bool cancel_done = false;
    bool cancel_accepted = true;
    h.api->cancel("upload_2_cancel", "tok", [&](bool accepted, const std::string&) {
        cancel_accepted = accepted;
        cancel_done = true;
    });

    ASSERT_TRUE(run_until(h.ioc, [&] { return h.responded && cancel_done; }, 5000ms));
    EXPECT_FALSE(h.response.success);
    EXPECT_FALSE(cancel_accepted);

    ASSERT_TRUE(run_until(h.ioc, [&] { return h.api->active_workers() == 0; }));
}

TEST(HttpUploadApi, CancelForOtherUploadLeavesTransferRunning) {
    Harness h;
    h.submit("upload_3_keep");
    test::run_for(h.ioc, 100ms);

    bool cancel_done = false;
    h.api->cancel("upload_3_other", "", [&](bool, const std::string&) { cancel_done = true; });
    ASSERT_TRUE(run_until(h.ioc, [&] { return cancel_done; }, 3000ms));
    test::run_for(h.ioc, 1500ms);
    EXPECT_FALSE(h.responded);
    EXPECT_EQ(h.api->active_workers(), 1u);
}
