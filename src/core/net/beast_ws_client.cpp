/**
 * @file beast_ws_client.cpp
 */

#include "core/net/beast_ws_client.h"

#include <deque>
#include <optional>
#include <type_traits>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

namespace uploadwatch::netws {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

bool parse_ws_url(const std::string& url, ParsedWsUrl& out) {
    auto pos = url.find("://");
    if (pos == std::string::npos) return false;
    const std::string scheme = url.substr(0, pos);
    if (scheme == "wss") out.tls = true;
    else if (scheme == "ws") out.tls = false;
    else return false;

    const std::string rest = url.substr(pos + 3);
    auto slash = rest.find('/');
    std::string hostport = (slash == std::string::npos) ? rest : rest.substr(0, slash);
    out.target = (slash == std::string::npos) ? "/" : rest.substr(slash);
    auto colon = hostport.find(':');
    if (colon == std::string::npos) {
        out.host = hostport;
        out.port = out.tls ? "443" : "80";
    } else {
        out.host = hostport.substr(0, colon);
        out.port = hostport.substr(colon + 1);
    }
    return !out.host.empty() && !out.port.empty();
}

// Type-erased per-attempt connection state. Handlers are held here so a
// destroyed BeastWsClient can detach them while async operations drain.
class BeastWsClient::Session {
public:
    virtual ~Session() = default;

    virtual void start() = 0;
    virtual bool send(const std::string& text) = 0;
    virtual void close(std::uint16_t code, const std::string& reason) = 0;
    virtual bool is_open() const = 0;

    void detach() { handlers_ = {}; }

protected:
    void report_open() {
        auto cb = handlers_.on_open;
        if (cb) cb();
    }

    void report_message(const std::string& text) {
        auto cb = handlers_.on_message;
        if (cb) cb(text);
    }

    void report_error(const std::string& what) {
        auto cb = handlers_.on_error;
        if (cb) cb(what);
    }

    void report_close(const ws::CloseInfo& info) {
        if (close_reported_) return;
        close_reported_ = true;
        auto cb = handlers_.on_close;
        if (cb) cb(info);
    }

    ws::WsHandlers handlers_;

private:
    bool close_reported_{false};
};

namespace {

using plain_ws = websocket::stream<tcp::socket>;
using tls_ws = websocket::stream<ssl::stream<tcp::socket>>;

template <bool kTls>
class StreamSession final
    : public BeastWsClient::Session
    , public std::enable_shared_from_this<StreamSession<kTls>> {
    using stream_type = std::conditional_t<kTls, tls_ws, plain_ws>;

public:
    StreamSession(net::io_context& ioc, ParsedWsUrl url, ws::WsHandlers handlers)
        : resolver_(ioc), url_(std::move(url)) {
        handlers_ = std::move(handlers);
        if constexpr (kTls) {
            ssl_ctx_ = std::make_unique<ssl::context>(ssl::context::tls_client);
            ssl_ctx_->set_default_verify_paths();
            ssl_ctx_->set_verify_mode(ssl::verify_peer);
            ws_ = std::make_unique<stream_type>(ioc, *ssl_ctx_);
        } else {
            ws_ = std::make_unique<stream_type>(ioc);
        }
    }

    void start() override {
        spdlog::debug("[WS] connecting host={} port={} tls={}", url_.host, url_.port, kTls ? "yes" : "no");
        resolver_.async_resolve(url_.host, url_.port,
            [self = this->shared_from_this()](beast::error_code ec, tcp::resolver::results_type results) {
                self->on_resolve(ec, std::move(results));
            });
    }

    bool send(const std::string& text) override {
        if (!open_ || close_requested_) return false;
        outbox_.push_back(text);
        if (outbox_.size() == 1) do_write();
        return true;
    }

    void close(std::uint16_t code, const std::string& reason) override {
        if (close_requested_) return;
        close_requested_ = true;
        if (!open_) {
            // Still resolving or handshaking: tear the socket down.
            aborted_ = true;
            beast::error_code ec;
            resolver_.cancel();
            beast::get_lowest_layer(*ws_).cancel(ec);
            beast::get_lowest_layer(*ws_).close(ec);
            return;
        }
        websocket::close_reason cr(code);
        cr.reason = reason;
        pending_close_ = cr;
        // Beast allows one outstanding write/close at a time.
        if (outbox_.empty()) do_close();
    }

    bool is_open() const override { return open_ && !close_requested_; }

private:
    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return fail(ec, "resolve");
        boost::asio::async_connect(beast::get_lowest_layer(*ws_), results,
            [self = this->shared_from_this()](beast::error_code ec, const tcp::endpoint&) {
                self->on_connect(ec);
            });
    }

    void on_connect(beast::error_code ec) {
        if (ec) return fail(ec, "connect");
        beast::error_code opt_ec;
        auto& socket = beast::get_lowest_layer(*ws_);
        socket.set_option(boost::asio::socket_base::keep_alive(true), opt_ec);
        socket.set_option(tcp::no_delay(true), opt_ec);

        if constexpr (kTls) {
            // SNI
            if (!::SSL_set_tlsext_host_name(ws_->next_layer().native_handle(), url_.host.c_str())) {
                beast::error_code sni_ec{static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()};
                return fail(sni_ec, "sni");
            }
            ws_->next_layer().async_handshake(ssl::stream_base::client,
                [self = this->shared_from_this()](beast::error_code ec) {
                    if (ec) return self->fail(ec, "tls handshake");
                    self->do_ws_handshake();
                });
        } else {
            do_ws_handshake();
        }
    }

    void do_ws_handshake() {
        // Keepalive is application-level; no Beast idle pings. The caller
        // enforces the overall connect deadline.
        ws_->set_option(websocket::stream_base::timeout{
            std::chrono::seconds(300),
            websocket::stream_base::none(),
            false});
        ws_->set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
            req.set(beast::http::field::user_agent, std::string("uploadwatch/1.0"));
        }));
        ws_->text(true);
        const std::string host_header = url_.host + ":" + url_.port;
        ws_->async_handshake(host_header, url_.target,
            [self = this->shared_from_this()](beast::error_code ec) {
                self->on_handshake(ec);
            });
    }

    void on_handshake(beast::error_code ec) {
        if (ec) return fail(ec, "ws handshake");
        if (aborted_) return fail(boost::asio::error::operation_aborted, "ws handshake");
        open_ = true;
        spdlog::debug("[WS] connected host={} tls={}", url_.host, kTls ? "yes" : "no");
        report_open();
        do_read();
    }

    void do_read() {
        ws_->async_read(buffer_,
            [self = this->shared_from_this()](beast::error_code ec, std::size_t) {
                self->on_read(ec);
            });
    }

    void on_read(beast::error_code ec) {
        if (ec) {
            open_ = false;
            if (ec == websocket::error::closed) {
                const auto& cr = ws_->reason();
                report_close(ws::CloseInfo{static_cast<std::uint16_t>(cr.code), std::string(cr.reason.c_str())});
                return;
            }
            if (ec != boost::asio::error::operation_aborted) {
                report_error(ec.message());
            }
            report_close(ws::CloseInfo{ws::close_code::kAbnormal, ec.message()});
            return;
        }
        std::string text = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        report_message(text);
        do_read();
    }

    void do_write() {
        ws_->async_write(boost::asio::buffer(outbox_.front()),
            [self = this->shared_from_this()](beast::error_code ec, std::size_t) {
                self->on_write(ec);
            });
    }

    void on_write(beast::error_code ec) {
        if (ec) {
            spdlog::warn("[WS] write failed: {}", ec.message());
            outbox_.clear();
            if (ec != boost::asio::error::operation_aborted) report_error(ec.message());
            // The pending read observes the broken stream and reports close.
            return;
        }
        outbox_.pop_front();
        if (!outbox_.empty()) {
            do_write();
        } else if (pending_close_) {
            do_close();
        }
    }

    void do_close() {
        auto reason = *pending_close_;
        pending_close_.reset();
        ws_->async_close(reason,
            [self = this->shared_from_this()](beast::error_code ec) {
                if (ec) {
                    spdlog::debug("[WS] close handshake ended with: {}", ec.message());
                    beast::error_code ignored;
                    beast::get_lowest_layer(*self->ws_).close(ignored);
                }
            });
    }

    void fail(beast::error_code ec, const char* stage) {
        open_ = false;
        if (ec != boost::asio::error::operation_aborted) {
            spdlog::warn("[WS] {} failed host={}: {}", stage, url_.host, ec.message());
            report_error(std::string(stage) + ": " + ec.message());
        }
        report_close(ws::CloseInfo{ws::close_code::kAbnormal, std::string(stage) + ": " + ec.message()});
    }

    tcp::resolver resolver_;
    ParsedWsUrl url_;
    std::unique_ptr<ssl::context> ssl_ctx_;
    std::unique_ptr<stream_type> ws_;
    beast::flat_buffer buffer_;
    std::deque<std::string> outbox_;
    std::optional<websocket::close_reason> pending_close_;
    bool open_{false};
    bool close_requested_{false};
    bool aborted_{false};
};

} // namespace

BeastWsClient::BeastWsClient(net::io_context& ioc) : ioc_(ioc) {}

BeastWsClient::~BeastWsClient() {
    if (session_) {
        session_->detach();
        session_->close(ws::close_code::kGoingAway, "client shutdown");
    }
}

void BeastWsClient::open(const std::string& url, ws::WsHandlers handlers) {
    ParsedWsUrl parsed;
    if (!parse_ws_url(url, parsed)) {
        spdlog::error("[WS] rejecting malformed url");
        auto on_error = handlers.on_error;
        auto on_close = handlers.on_close;
        net::post(ioc_, [on_error, on_close]() {
            if (on_error) on_error("invalid websocket url");
            if (on_close) on_close(ws::CloseInfo{ws::close_code::kAbnormal, "invalid websocket url"});
        });
        return;
    }
    if (parsed.tls) {
        session_ = std::make_shared<StreamSession<true>>(ioc_, std::move(parsed), std::move(handlers));
    } else {
        session_ = std::make_shared<StreamSession<false>>(ioc_, std::move(parsed), std::move(handlers));
    }
    session_->start();
}

bool BeastWsClient::send(const std::string& text) {
    return session_ && session_->send(text);
}

void BeastWsClient::close(std::uint16_t code, const std::string& reason) {
    if (session_) session_->close(code, reason);
}

bool BeastWsClient::is_open() const {
    return session_ && session_->is_open();
}

} // namespace uploadwatch::netws
