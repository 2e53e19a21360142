#pragma once
#include <functional>
#include <string>
#include <utility>
#include <vector>
#include "../config/StreamConfig.hpp"

struct TransportFault {
    enum class Kind {
        Transient,          // socket closed, timeout, resolver/TLS failure
        HandshakeRejected   // upgrade refused with 401/403
    };

    Kind        kind{Kind::Transient};
    std::string message;
    int         httpStatus{0};
};

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

// Pure transport interface (no provider logic)
class WsTransport {
public:
    using MessageCb = std::function<void(std::string)>; // own the data to avoid dangling views
    using EventCb   = std::function<void()>;
    using FaultCb   = std::function<void(TransportFault)>;

    WsTransport() = default;
    virtual ~WsTransport() = default;

    // Starts a new connection, abandoning any previous one. Callbacks from the
    // abandoned connection are never delivered.
    virtual void connect(WsEndpoint endpoint, HttpHeaders headers) = 0;
    // Graceful close; no fault is reported for a connection closed this way.
    virtual void close() = 0;
    virtual void send(std::string msg) = 0; // serialized by implementation

    virtual void onMessage(MessageCb) = 0;
    virtual void onSecured(EventCb) = 0;   // TCP + TLS established, upgrade in flight
    virtual void onOpen(EventCb) = 0;      // upgrade accepted
    virtual void onFault(FaultCb) = 0;
};
