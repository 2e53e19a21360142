#pragma once
#include <string>

// What handlers may ask of the session. Implemented by SessionManager.
class ISessionControl {
public:
    virtual ~ISessionControl() = default;

    /// Unsubscribe and resubscribe every held orderbook subscription covering the instrument.
    virtual void requestSnapshot(const std::string& instrument) = 0;

    /// Drop the connection and go through the reconnect path.
    virtual void forceDegraded(const std::string& reason) = 0;
};
