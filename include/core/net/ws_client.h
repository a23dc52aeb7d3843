/**
 * @file ws_client.h
 * @brief WebSocket client abstraction used by the progress stream.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace uploadwatch::ws {

// RFC 6455 close codes the progress client cares about.
namespace close_code {
constexpr std::uint16_t kNormal = 1000;
constexpr std::uint16_t kGoingAway = 1001;
constexpr std::uint16_t kAbnormal = 1006;
constexpr std::uint16_t kPolicyViolation = 1008;
constexpr std::uint16_t kInternalError = 1011;
} // namespace close_code

struct CloseInfo {
    std::uint16_t code{close_code::kAbnormal};
    std::string reason;
};

struct WsHandlers {
    std::function<void()> on_open;
    std::function<void(const std::string&)> on_message;
    std::function<void(const std::string&)> on_error;
    std::function<void(const CloseInfo&)> on_close;
};

/**
 * One transport instance per connection attempt. open() is asynchronous:
 * exactly one of on_open or on_close follows, and on_close is reported at
 * most once per instance. All handlers run on the owning event loop.
 */
class WsClient {
public:
    virtual ~WsClient() = default;

    virtual void open(const std::string& url, WsHandlers handlers) = 0;

    // Queue a text frame. Returns false if the transport is not open.
    virtual bool send(const std::string& text) = 0;

    // Initiate a close handshake, or abort a pending open.
    virtual void close(std::uint16_t code, const std::string& reason) = 0;

    virtual bool is_open() const = 0;
};

} // namespace uploadwatch::ws
