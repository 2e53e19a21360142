#pragma once
#include "marketdata/ws/WsTransport.hpp"
#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

/// Scripted transport: records what the session asks for, and lets the test
/// play the network side (secured / open / fault / inbound frames).
class FakeTransport : public WsTransport {
public:
    struct ConnectCall {
        WsEndpoint  endpoint;
        HttpHeaders headers;
    };

    void connect(WsEndpoint endpoint, HttpHeaders headers) override {
        std::lock_guard<std::mutex> lock(mx_);
        connects_.push_back(ConnectCall{std::move(endpoint), std::move(headers)});
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mx_);
        ++closes_;
    }

    void send(std::string msg) override {
        std::lock_guard<std::mutex> lock(mx_);
        sent_.push_back(std::move(msg));
    }

    void onMessage(MessageCb cb) override { onMessage_ = std::move(cb); }
    void onSecured(EventCb cb) override   { onSecured_ = std::move(cb); }
    void onOpen(EventCb cb) override      { onOpen_ = std::move(cb); }
    void onFault(FaultCb cb) override     { onFault_ = std::move(cb); }

    // Network side
    void fireSecured() { if (onSecured_) onSecured_(); }
    void fireOpen()    { if (onOpen_) onOpen_(); }
    void fireMessage(std::string raw) { if (onMessage_) onMessage_(std::move(raw)); }
    void fireFault(TransportFault::Kind kind, std::string message = "connection reset", int status = 0) {
        if (onFault_) onFault_(TransportFault{kind, std::move(message), status});
    }

    // Inspection
    std::size_t connectCount() const {
        std::lock_guard<std::mutex> lock(mx_);
        return connects_.size();
    }

    ConnectCall lastConnect() const {
        std::lock_guard<std::mutex> lock(mx_);
        return connects_.empty() ? ConnectCall{} : connects_.back();
    }

    int closeCount() const {
        std::lock_guard<std::mutex> lock(mx_);
        return closes_;
    }

    std::vector<std::string> sent() const {
        std::lock_guard<std::mutex> lock(mx_);
        return sent_;
    }

    /// Sent commands parsed back to JSON, filtered by "cmd".
    std::vector<nlohmann::json> sentCommands(const std::string& cmd) const {
        std::vector<nlohmann::json> out;
        for (const auto& s : sent()) {
            auto j = nlohmann::json::parse(s);
            if (j.value("cmd", "") == cmd) out.push_back(std::move(j));
        }
        return out;
    }

    void clearSent() {
        std::lock_guard<std::mutex> lock(mx_);
        sent_.clear();
    }

private:
    mutable std::mutex       mx_;
    std::vector<ConnectCall> connects_;
    std::vector<std::string> sent_;
    int                      closes_{0};

    MessageCb onMessage_;
    EventCb   onSecured_;
    EventCb   onOpen_;
    FaultCb   onFault_;
};

/// Pumps the io_context until pred() holds or the timeout passes.
inline bool runUntil(boost::asio::io_context& ioc,
                     const std::function<bool()>& pred,
                     std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        ioc.restart();
        ioc.poll();
        if (pred()) return true;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        ioc.restart();
        ioc.run_for(std::chrono::milliseconds(2));
    }
}

/// Pumps the io_context for a fixed duration (to show that something does NOT happen).
inline void runFor(boost::asio::io_context& ioc, std::chrono::milliseconds duration) {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (std::chrono::steady_clock::now() < deadline) {
        ioc.restart();
        ioc.run_for(std::chrono::milliseconds(2));
    }
}
