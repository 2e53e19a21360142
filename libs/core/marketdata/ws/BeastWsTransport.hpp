#pragma once
#include "WsTransport.hpp"
#include <boost/beast/websocket.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/tcp_stream.hpp>  // ensure tcp_stream is declared
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <openssl/err.h>
#include <openssl/ssl.h>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

struct BeastTransportOptions {
    std::chrono::milliseconds pingInterval{std::chrono::seconds(20)};
    std::chrono::milliseconds readTimeout{std::chrono::seconds(30)};
    std::chrono::milliseconds handshakeTimeout{std::chrono::seconds(30)};
};

// TLS WebSocket client. Every connect() builds a fresh stream tagged with an epoch; completion
// handlers from an older epoch are discarded, so a late callback can never touch the new socket.
class BeastWsTransport : public WsTransport {
public:
    BeastWsTransport(net::io_context& ioc, ssl::context& sslCtx, BeastTransportOptions options = {});
    ~BeastWsTransport() override;

    void connect(WsEndpoint endpoint, HttpHeaders headers) override;
    void close() override;
    void send(std::string msg) override;

    void onMessage(MessageCb cb) override { onMessage_ = std::move(cb); }
    void onSecured(EventCb cb) override   { onSecured_ = std::move(cb); }
    void onOpen(EventCb cb) override      { onOpen_ = std::move(cb); }
    void onFault(FaultCb cb) override     { onFault_ = std::move(cb); }

private:
    using Stream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

    struct Connection {
        Connection(net::strand<net::io_context::executor_type> ex, ssl::context& ctx, uint64_t ep)
            : ws(ex, ctx), epoch(ep) {}

        Stream                   ws;
        beast::flat_buffer       buf;
        websocket::response_type upgradeResponse;
        uint64_t                 epoch;
        bool                     open{false};
    };
    using ConnPtr = std::shared_ptr<Connection>;

    // Callbacks
    MessageCb onMessage_;
    EventCb   onSecured_;
    EventCb   onOpen_;
    FaultCb   onFault_;

    // Beast state (strand-confined)
    ssl::context&                                sslCtx_;
    net::strand<net::io_context::executor_type>  strand_;
    tcp::resolver                                resolver_;
    net::steady_timer                            pingTimer_;
    std::deque<std::string>                      writeQueue_;
    ConnPtr                                      conn_;
    uint64_t                                     epoch_{0};
    bool                                         closeAfterWrites_{false};
    BeastTransportOptions                        options_;

    WsEndpoint  endpoint_;
    HttpHeaders headers_;

    [[nodiscard]] bool current(const ConnPtr& c) const { return c && conn_ == c && c->epoch == epoch_; }
    void fail(const ConnPtr& c, TransportFault fault);
    void abandonCurrent();

    // Handlers
    void onResolve(ConnPtr c, beast::error_code ec, tcp::resolver::results_type results);
    void onConnect(ConnPtr c, beast::error_code ec);
    void onSslHandshake(ConnPtr c, beast::error_code ec);
    void onWsHandshake(ConnPtr c, beast::error_code ec);
    void doRead(ConnPtr c);
    void onRead(ConnPtr c, beast::error_code ec, std::size_t bytes);
    void doWrite(ConnPtr c);
    void schedulePing(ConnPtr c);
};
