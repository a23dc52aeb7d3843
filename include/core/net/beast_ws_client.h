/**
 * @file beast_ws_client.h
 * @brief Asynchronous Boost.Beast WebSocket transport (ws:// and wss://).
 */

#pragma once

#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>

#include "core/net/ws_client.h"

namespace uploadwatch::netws {

namespace net = boost::asio;

struct ParsedWsUrl {
    std::string host;
    std::string port;
    std::string target;   // path + query
    bool tls{false};
};

// Accepts ws:// and wss:// URLs only.
bool parse_ws_url(const std::string& url, ParsedWsUrl& out);

/**
 * @class BeastWsClient
 * @brief WsClient over Boost.Beast, driven entirely by the caller's io_context.
 *
 * Resolve, TCP connect, TLS handshake (wss) and WebSocket handshake are all
 * asynchronous. Keepalive is handled at application level, so Beast's own
 * idle pings are disabled. Outbound frames are queued and written one at a
 * time.
 */
class BeastWsClient final : public ws::WsClient {
public:
    explicit BeastWsClient(net::io_context& ioc);
    ~BeastWsClient() override;

    BeastWsClient(const BeastWsClient&) = delete;
    BeastWsClient& operator=(const BeastWsClient&) = delete;

    void open(const std::string& url, ws::WsHandlers handlers) override;
    bool send(const std::string& text) override;
    void close(std::uint16_t code, const std::string& reason) override;
    bool is_open() const override;

    class Session;

private:
    net::io_context& ioc_;
    std::shared_ptr<Session> session_;
};

} // namespace uploadwatch::netws
