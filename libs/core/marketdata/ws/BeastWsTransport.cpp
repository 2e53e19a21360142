#include "BeastWsTransport.hpp"
#include "TaplineLogging.hpp"
#include <boost/beast/core.hpp>  // covers buffers, flat_buffer, etc.
#include <boost/beast/http.hpp>
#include <boost/asio/post.hpp>
#include <string_view>

namespace http = beast::http;

BeastWsTransport::BeastWsTransport(net::io_context& ioc, ssl::context& sslCtx, BeastTransportOptions options)
    : sslCtx_(sslCtx)
    , strand_(net::make_strand(ioc))
    , resolver_(strand_)
    , pingTimer_(strand_)
    , options_(options)
{}

BeastWsTransport::~BeastWsTransport() = default;

void BeastWsTransport::connect(WsEndpoint endpoint, HttpHeaders headers) {
    net::post(strand_, [this, ep = std::move(endpoint), h = std::move(headers)]() mutable {
        abandonCurrent();
        endpoint_ = std::move(ep);
        headers_ = std::move(h);

        conn_ = std::make_shared<Connection>(strand_, sslCtx_, ++epoch_);
        auto c = conn_;

        if (!endpoint_.tls) {
            fail(c, {TransportFault::Kind::Transient, "plain ws:// endpoints are not supported", 0});
            return;
        }

        tLog_Data(QString("🔌 Connecting to %1:%2%3 (epoch %4)")
                      .arg(QString::fromStdString(endpoint_.host), QString::fromStdString(endpoint_.port),
                           QString::fromStdString(endpoint_.target))
                      .arg(c->epoch));

        resolver_.async_resolve(endpoint_.host, endpoint_.port,
            [this, c](beast::error_code ec, tcp::resolver::results_type results) {
                onResolve(c, ec, std::move(results));
            });
    });
}

void BeastWsTransport::close() {
    net::post(strand_, [this]() {
        // Let queued frames (best-effort unsubscribes) go out first.
        if (conn_ && conn_->open && !writeQueue_.empty()) {
            closeAfterWrites_ = true;
            return;
        }
        abandonCurrent();
    });
}

void BeastWsTransport::send(std::string msg) {
    net::post(strand_, [this, m = std::move(msg)]() mutable {
        auto c = conn_;
        if (!c || !c->open || closeAfterWrites_) {
            tLog_DataN(10, "⚠️ Dropping outbound message: no open connection");
            return;
        }
        writeQueue_.emplace_back(std::move(m));
        if (writeQueue_.size() == 1) {
            doWrite(c);
        }
    });
}

void BeastWsTransport::abandonCurrent() {
    ++epoch_;
    closeAfterWrites_ = false;
    resolver_.cancel();
    pingTimer_.cancel();
    writeQueue_.clear();

    auto c = std::move(conn_);
    conn_.reset();
    if (!c) return;

    if (c->open) {
        c->open = false;
        // c is kept alive by the handler until the close completes
        c->ws.async_close(websocket::close_code::normal, [c](beast::error_code) {});
    } else {
        beast::error_code ignored;
        beast::get_lowest_layer(c->ws).socket().close(ignored);
    }
}

void BeastWsTransport::fail(const ConnPtr& c, TransportFault fault) {
    if (!current(c)) return;
    tLog_Warning(QString("❌ Transport fault (epoch %1): %2")
                     .arg(c->epoch).arg(QString::fromStdString(fault.message)));
    abandonCurrent();
    if (onFault_) onFault_(std::move(fault));
}

void BeastWsTransport::onResolve(ConnPtr c, beast::error_code ec, tcp::resolver::results_type results) {
    if (!current(c)) return;
    if (ec) { fail(c, {TransportFault::Kind::Transient, "resolve: " + ec.message(), 0}); return; }

    beast::get_lowest_layer(c->ws).expires_after(options_.handshakeTimeout);
    beast::get_lowest_layer(c->ws).async_connect(results,
        [this, c](beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
            onConnect(c, ec);
        });
}

void BeastWsTransport::onConnect(ConnPtr c, beast::error_code ec) {
    if (!current(c)) return;
    if (ec) { fail(c, {TransportFault::Kind::Transient, "connect: " + ec.message(), 0}); return; }

    if (!SSL_set_tlsext_host_name(c->ws.next_layer().native_handle(), endpoint_.host.c_str())) {
        beast::error_code ssl_ec(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        fail(c, {TransportFault::Kind::Transient, "SNI: " + ssl_ec.message(), 0});
        return;
    }
    if (!SSL_set1_host(c->ws.next_layer().native_handle(), endpoint_.host.c_str())) {
        beast::error_code ssl_ec(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        fail(c, {TransportFault::Kind::Transient, "host verification: " + ssl_ec.message(), 0});
        return;
    }
    c->ws.next_layer().set_verify_mode(ssl::verify_peer);
    c->ws.next_layer().async_handshake(ssl::stream_base::client,
        [this, c](beast::error_code ec) { onSslHandshake(c, ec); });
}

void BeastWsTransport::onSslHandshake(ConnPtr c, beast::error_code ec) {
    if (!current(c)) return;
    if (ec) { fail(c, {TransportFault::Kind::Transient, "tls: " + ec.message(), 0}); return; }

    if (onSecured_) onSecured_();
    if (!current(c)) return;   // callback may have closed us

    beast::get_lowest_layer(c->ws).expires_never();

    websocket::stream_base::timeout opt{};
    opt.handshake_timeout = options_.handshakeTimeout;
    opt.idle_timeout = options_.readTimeout;
    opt.keep_alive_pings = false;   // we send our own pings on pingInterval
    c->ws.set_option(opt);

    c->ws.set_option(websocket::stream_base::decorator(
        [headers = headers_](websocket::request_type& req) {
            req.set(http::field::user_agent, "tapline-stream");
            for (const auto& [name, value] : headers) {
                req.set(name, value);
            }
        }));

    c->ws.async_handshake(c->upgradeResponse, endpoint_.host, endpoint_.target,
        [this, c](beast::error_code ec) { onWsHandshake(c, ec); });
}

void BeastWsTransport::onWsHandshake(ConnPtr c, beast::error_code ec) {
    if (!current(c)) return;
    if (ec) {
        const int status = static_cast<int>(c->upgradeResponse.result_int());
        if (status == 401 || status == 403) {
            fail(c, {TransportFault::Kind::HandshakeRejected,
                     "upgrade rejected with HTTP " + std::to_string(status), status});
        } else {
            fail(c, {TransportFault::Kind::Transient, "ws handshake: " + ec.message(), status});
        }
        return;
    }

    c->open = true;
    tLog_Data(QString("✅ WebSocket open (epoch %1)").arg(c->epoch));
    if (onOpen_) onOpen_();
    if (!current(c)) return;

    doRead(c);
    schedulePing(c);
}

void BeastWsTransport::doRead(ConnPtr c) {
    c->ws.async_read(c->buf, [this, c](beast::error_code ec, std::size_t bytes) { onRead(c, ec, bytes); });
}

void BeastWsTransport::onRead(ConnPtr c, beast::error_code ec, std::size_t) {
    if (!current(c)) return;
    if (ec) {
        const std::string why = (ec == beast::error::timeout) ? "read timeout" : ec.message();
        fail(c, {TransportFault::Kind::Transient, "read: " + why, 0});
        return;
    }

    auto b = c->buf.data();
    std::string payload(static_cast<const char*>(b.data()), b.size());
    c->buf.consume(c->buf.size());
    // Once close() is pending the connection only drains its write queue.
    if (onMessage_ && !closeAfterWrites_) onMessage_(std::move(payload));

    if (current(c)) doRead(c);
}

void BeastWsTransport::doWrite(ConnPtr c) {
    if (writeQueue_.empty() || !current(c)) return;
    const auto& front = writeQueue_.front();
    c->ws.text(true);
    c->ws.async_write(net::buffer(front), [this, c](beast::error_code ec, std::size_t) {
        if (!current(c)) return;
        if (ec) {
            fail(c, {TransportFault::Kind::Transient, "write: " + ec.message(), 0});
            return;
        }
        writeQueue_.pop_front();
        if (!writeQueue_.empty()) {
            doWrite(c);
        } else if (closeAfterWrites_) {
            abandonCurrent();
        }
    });
}

void BeastWsTransport::schedulePing(ConnPtr c) {
    pingTimer_.expires_after(options_.pingInterval);
    pingTimer_.async_wait([this, c](beast::error_code ec) {
        if (ec || !current(c)) return;
        c->ws.async_ping({}, [this, c](beast::error_code ec2) {
            if (!current(c)) return;
            if (ec2) { fail(c, {TransportFault::Kind::Transient, "ping: " + ec2.message(), 0}); return; }
            schedulePing(c);
        });
    });
}
