/**
 * @file message_dispatcher.h
 * @brief Routes inbound stream frames: housekeeping replies, progress
 *        updates into the store, and teardown after terminal frames.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <nlohmann/json.hpp>

#include "progress/progress_store.h"
#include "stream/connection_manager.h"

namespace uploadwatch::stream {

class MessageDispatcher {
public:
    // Receives stage_details of a metadata_extraction progress frame.
    using MetadataCallback = std::function<void(const nlohmann::json&)>;

    MessageDispatcher(net::io_context& ioc,
                      ConnectionManager& connection,
                      progress::ProgressStore& store,
                      std::chrono::milliseconds close_grace);
    ~MessageDispatcher();

    MessageDispatcher(const MessageDispatcher&) = delete;
    MessageDispatcher& operator=(const MessageDispatcher&) = delete;

    void set_metadata_callback(MetadataCallback cb) { metadata_cb_ = std::move(cb); }

    // Frames must be fed in arrival order.
    void handle_frame(const std::string& text);

    // Drop a scheduled post-completion close.
    void cancel_pending_close();

    std::uint64_t malformed_frames() const { return malformed_frames_; }
    const std::optional<SessionError>& last_malformed() const { return last_malformed_; }

private:
    void on_terminal(const progress::ProgressState& state);
    void schedule_close();

    ConnectionManager& connection_;
    progress::ProgressStore& store_;
    std::chrono::milliseconds close_grace_;
    net::steady_timer grace_timer_;
    MetadataCallback metadata_cb_;
    std::uint64_t malformed_frames_{0};
    std::optional<SessionError> last_malformed_;
    std::shared_ptr<bool> lifetime_{std::make_shared<bool>(true)};
};

} // namespace uploadwatch::stream
