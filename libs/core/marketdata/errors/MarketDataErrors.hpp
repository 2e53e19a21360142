#pragma once
/*
Tapline — MarketDataErrors
Role: Exception taxonomy for the ingestion pipeline.
Integration: Thrown by Signer, CredentialProvider, StreamConfig, MessageParser and SqliteEventStore.
Propagation: Nothing here crosses the io strand or a worker thread; SessionManager turns these into
             state transitions and StreamClient re-emits them as Qt signals.
*/
#include <stdexcept>
#include <string>

class MarketDataError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Bad or missing key material. Fatal, never retried.
class CredentialError : public MarketDataError {
public:
    explicit CredentialError(const std::string& what)
        : MarketDataError("CredentialError: " + what) {}
};

// The signing operation failed. Fatal for the current attempt only.
class SigningError : public MarketDataError {
public:
    explicit SigningError(const std::string& what)
        : MarketDataError("SigningError: " + what) {}
};

// Venue refused the handshake (HTTP 401/403 or an auth error ack).
class HandshakeRejected : public MarketDataError {
public:
    HandshakeRejected(const std::string& what, int httpStatus = 0)
        : MarketDataError("HandshakeRejected: " + what)
        , m_httpStatus(httpStatus) {}

    [[nodiscard]] int httpStatus() const noexcept { return m_httpStatus; }

private:
    int m_httpStatus;
};

// Closed socket, timeout, resolver failure, malformed-frame circuit breaker.
class TransportError : public MarketDataError {
public:
    explicit TransportError(const std::string& what)
        : MarketDataError("TransportError: " + what) {}
};

class MalformedFrame : public MarketDataError {
public:
    explicit MalformedFrame(const std::string& what)
        : MarketDataError("MalformedFrame: " + what) {}
};

class StoreWriteError : public MarketDataError {
public:
    explicit StoreWriteError(const std::string& what)
        : MarketDataError("StoreWriteError: " + what) {}
};

class ConfigError : public MarketDataError {
public:
    explicit ConfigError(const std::string& what)
        : MarketDataError("ConfigError: " + what) {}
};
